/**
 * @file main.cpp
 * @brief Command-line front end: file conversion, live ALSA playback, mode listing.
 */

#include <iostream>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <string>
#include <stdexcept>
#include <vector>
#include "BufferPool.hpp"
#include "Logger.hpp"
#include "OutputMode.hpp"
#include "OutputNaming.hpp"
#include "ProgressReporter.hpp"
#include "SettingsStore.hpp"
#include "StreamPipeline.hpp"
#include "alsa/AlsaPlaybackSink.hpp"
#include "sndfile/SndFileSink.hpp"
#include "sndfile/SndFileSource.hpp"

using namespace spatializer;

namespace {

CancellationToken g_cancel;

void handle_sigint(int) {
    g_cancel.cancel();
}

void print_usage() {
    std::cout << "Usage:" << std::endl;
    std::cout << "  spatializer convert <input> [--mode <label>] [--out <dir>] [--workers N] [--chunk N]"
              << " [--format pcm16|float] [--config <json>]" << std::endl;
    std::cout << "  spatializer play <input> [--mode <label>] [--device <alsa>]" << std::endl;
    std::cout << "  spatializer modes" << std::endl;
    std::cout << "Example: spatializer convert song.flac --mode 71ch --out out/" << std::endl;
}

void print_modes() {
    for (OutputMode mode : kAllOutputModes) {
        std::cout << mode_label(mode) << "\t" << mode_name(mode) << "\t" << channel_count(mode) << " ch:";
        for (Channel channel : channel_layout(mode)) {
            std::cout << " " << channel_name(channel);
        }
        std::cout << std::endl;
    }
}

void print_progress(int percent, ProgressStage stage) {
    std::cout << "\r[" << stage_name(stage) << "] " << percent << "%" << std::flush;
    if (stage == ProgressStage::Complete) {
        std::cout << std::endl;
    }
}

int report_outcome(const RunOutcome& outcome) {
    AudioLogger::instance().flush();
    switch (outcome.status) {
        case RunStatus::Completed: {
            const ProcessResult& r = *outcome.result;
            std::cout << "Output: " << r.output_location << " (" << mode_label(r.output_mode) << ", "
                      << r.channel_count << " ch, " << r.sample_rate << " Hz, " << r.frame_count
                      << " frames)" << std::endl;
            return 0;
        }
        case RunStatus::Cancelled:
            std::cout << std::endl << "Cancelled." << std::endl;
            return 130;
        case RunStatus::Failed:
            std::cerr << std::endl << "Error: " << outcome.error << std::endl;
            return 1;
    }
    return 1;
}

bool parse_count(const std::string& text, size_t& value) {
    try {
        size_t used = 0;
        const long long parsed = std::stoll(text, &used);
        if (used != text.size() || parsed < 1) {
            return false;
        }
        value = static_cast<size_t>(parsed);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }
    if (command == "modes") {
        print_modes();
        return 0;
    }
    if (command != "convert" && command != "play") {
        std::cerr << "Unknown command: " << command << std::endl;
        print_usage();
        return 1;
    }

    ConversionSettings settings;
    std::string input;
    std::string mode_arg;
    std::string workers_arg;
    std::string chunk_arg;
    std::string format_arg;
    std::string out_arg;
    std::string device_arg;
    std::string config_path;

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            target = argv[++i];
            return true;
        };

        bool ok = true;
        if (arg == "--mode") ok = next(mode_arg);
        else if (arg == "--out") ok = next(out_arg);
        else if (arg == "--workers") ok = next(workers_arg);
        else if (arg == "--chunk") ok = next(chunk_arg);
        else if (arg == "--format") ok = next(format_arg);
        else if (arg == "--config") ok = next(config_path);
        else if (arg == "--device") ok = next(device_arg);
        else if (input.empty() && arg.rfind("--", 0) != 0) input = arg;
        else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            ok = false;
        }
        if (!ok) {
            print_usage();
            return 1;
        }
    }

    if (input.empty()) {
        std::cerr << "No input file given" << std::endl;
        print_usage();
        return 1;
    }

    // Config file first, then command-line overrides
    if (!config_path.empty() && !SettingsStore::load_from_file(settings, config_path)) {
        return 1;
    }
    if (!mode_arg.empty()) {
        const auto mode = parse_output_mode(mode_arg);
        if (!mode) {
            std::cerr << "Unknown mode: " << mode_arg << " (see 'spatializer modes')" << std::endl;
            return 1;
        }
        settings.output_mode = *mode;
    }
    if (!workers_arg.empty() && !parse_count(workers_arg, settings.worker_count)) {
        std::cerr << "--workers needs a positive integer" << std::endl;
        return 1;
    }
    if (!chunk_arg.empty() && !parse_count(chunk_arg, settings.chunk_frames)) {
        std::cerr << "--chunk needs a positive integer" << std::endl;
        return 1;
    }
    if (!format_arg.empty()) {
        if (format_arg == "pcm16") settings.pcm_format = PcmFormat::Pcm16;
        else if (format_arg == "float") settings.pcm_format = PcmFormat::Float32;
        else {
            std::cerr << "Unknown format: " << format_arg << std::endl;
            return 1;
        }
    }
    if (!out_arg.empty()) settings.output_directory = out_arg;
    if (!device_arg.empty()) settings.alsa_device = device_arg;

    std::signal(SIGINT, handle_sigint);

    BufferPool pool;
    hal::SndFileSource source(input);

    if (command == "play") {
        // Lowest latency: one worker, continuous filters
        PipelineConfig config = settings.pipeline_config();
        config.worker_count = 1;
        hal::AlsaPlaybackSink sink(settings.alsa_device);
        StreamPipeline pipeline(config, pool);
        return report_outcome(pipeline.run(source, sink, g_cancel));
    }

    if (!settings.output_directory.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(settings.output_directory, ec);
        if (ec) {
            std::cerr << "Cannot create " << settings.output_directory << ": " << ec.message() << std::endl;
            return 1;
        }
    }

    const std::string output_path = output_file_path(settings.output_directory, input, settings.output_mode,
                                                     std::chrono::system_clock::now());
    hal::SndFileSink sink(output_path, settings.pcm_format == PcmFormat::Float32 ? hal::SampleEncoding::Float32
                                                                                 : hal::SampleEncoding::Pcm16);
    StreamPipeline pipeline(settings.pipeline_config(), pool);
    return report_outcome(pipeline.run(source, sink, g_cancel, print_progress));
}
