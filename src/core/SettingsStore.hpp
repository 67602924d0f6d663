/**
 * @file SettingsStore.hpp
 * @brief Human-readable JSON persistence for conversion settings.
 */

#ifndef SPATIALIZER_SETTINGS_STORE_HPP
#define SPATIALIZER_SETTINGS_STORE_HPP

#include "OutputMode.hpp"
#include "StreamPipeline.hpp"
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace spatializer {

using json = nlohmann::json;

enum class PcmFormat {
    Pcm16,
    Float32
};

/**
 * @brief Everything a conversion run can be configured with.
 */
struct ConversionSettings {
    int version = 1;
    OutputMode output_mode = OutputMode::Surround51;
    size_t worker_count = 2;
    size_t chunk_frames = 0; // 0 = mode default
    int target_sample_rate = kTargetSampleRate;
    std::string output_directory;
    PcmFormat pcm_format = PcmFormat::Pcm16;
    std::string alsa_device = "default";

    PipelineConfig pipeline_config() const {
        PipelineConfig config;
        config.mode = output_mode;
        config.worker_count = worker_count;
        config.chunk_frames = chunk_frames;
        config.target_sample_rate = target_sample_rate;
        return config;
    }
};

std::string_view pcm_format_name(PcmFormat format);

void to_json(json& j, const ConversionSettings& s);

/**
 * @brief Missing keys keep their defaults. Values of the wrong type throw
 * json::exception, out-of-range values std::invalid_argument.
 */
void from_json(const json& j, ConversionSettings& s);

/**
 * @brief Manages saving and loading of ConversionSettings.
 */
class SettingsStore {
public:
    static bool save_to_file(const ConversionSettings& settings, const std::string& path);
    static bool load_from_file(ConversionSettings& settings, const std::string& path);

    static std::string serialize(const ConversionSettings& settings) {
        json j = settings;
        return j.dump(4);
    }

    /**
     * @brief Parse settings from a JSON string. @p settings is untouched on failure.
     */
    static bool deserialize(ConversionSettings& settings, const std::string& data) {
        try {
            json j = json::parse(data);
            ConversionSettings parsed = settings;
            from_json(j, parsed);
            settings = parsed;
            return true;
        } catch (const json::exception&) {
            return false;
        } catch (const std::invalid_argument&) {
            return false;
        }
    }
};

} // namespace spatializer

#endif // SPATIALIZER_SETTINGS_STORE_HPP
