/**
 * @file CInterface.h
 * @brief C-compatible API layer for embedding the upmixer in other languages and hosts.
 */

#ifndef SPATIALIZER_C_INTERFACE_H
#define SPATIALIZER_C_INTERFACE_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Output modes, same order as spatializer::OutputMode
enum SpatializerMode {
    SPATIALIZER_MODE_BINAURAL = 0,
    SPATIALIZER_MODE_SURROUND51 = 1,
    SPATIALIZER_MODE_SURROUND51_IMMERSIVE = 2,
    SPATIALIZER_MODE_SURROUND71 = 3,
    SPATIALIZER_MODE_SURROUND51_FAST = 4
};

// Return codes of upmixer_convert_file
enum SpatializerStatus {
    SPATIALIZER_OK = 0,
    SPATIALIZER_CANCELLED = 1,
    SPATIALIZER_ERROR = -1
};

// Progress stages reported to SpatializerProgressFn
enum SpatializerStage {
    SPATIALIZER_STAGE_PREPARING = 0,
    SPATIALIZER_STAGE_CONVERTING = 1,
    SPATIALIZER_STAGE_FINALIZING = 2,
    SPATIALIZER_STAGE_COMPLETE = 3
};

// Opaque handle type
typedef void* UpmixerHandle;

typedef void (*SpatializerProgressFn)(int percent, int stage, void* user_data);

// Upmixer API
UpmixerHandle upmixer_create(int mode, unsigned int sample_rate, unsigned int worker_count);
void upmixer_destroy(UpmixerHandle handle);
int upmixer_channel_count(UpmixerHandle handle);

/**
 * Upmix interleaved stereo into interleaved multichannel output on the
 * calling thread. Filter state carries over between calls.
 * output must hold frames * upmixer_channel_count() samples.
 */
int upmixer_process(UpmixerHandle handle, const float* stereo_input, float* output, size_t frames);

/**
 * Upmix one chunk across the handle's workers. Filter state restarts at
 * every worker range.
 */
int upmixer_process_parallel(UpmixerHandle handle, const float* stereo_input, float* output, size_t frames);

int upmixer_reset(UpmixerHandle handle);
int upmixer_get_metrics(UpmixerHandle handle,
                        uint64_t* last_time_ns,
                        uint64_t* max_time_ns,
                        uint64_t* total_blocks);

/**
 * Convert a PCM file (anything libsndfile reads) to a multichannel WAV file.
 * Blocks until done. Returns SPATIALIZER_OK, SPATIALIZER_CANCELLED or
 * SPATIALIZER_ERROR; no output file is left behind unless SPATIALIZER_OK.
 * callback may be NULL.
 */
int upmixer_convert_file(UpmixerHandle handle, const char* input_path, const char* output_path,
                         int float_output, SpatializerProgressFn callback, void* user_data);

/**
 * Ask a running upmixer_convert_file() on this handle to stop at the next
 * chunk boundary. Callable from any thread.
 */
void upmixer_cancel(UpmixerHandle handle);

#ifdef __cplusplus
}
#endif

#endif // SPATIALIZER_C_INTERFACE_H
