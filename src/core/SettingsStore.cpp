#include "SettingsStore.hpp"
#include "FilterBank.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace spatializer {

std::string_view pcm_format_name(PcmFormat format) {
    return format == PcmFormat::Float32 ? "float" : "pcm16";
}

void to_json(json& j, const ConversionSettings& s) {
    j = json{
        {"version", s.version},
        {"output_mode", std::string(mode_label(s.output_mode))},
        {"worker_count", s.worker_count},
        {"chunk_frames", s.chunk_frames},
        {"target_sample_rate", s.target_sample_rate},
        {"output_directory", s.output_directory},
        {"pcm_format", std::string(pcm_format_name(s.pcm_format))},
        {"alsa_device", s.alsa_device}
    };
}

void from_json(const json& j, ConversionSettings& s) {
    if (j.contains("version")) {
        s.version = j.at("version").get<int>();
    }
    if (j.contains("output_mode")) {
        const auto label = j.at("output_mode").get<std::string>();
        const auto mode = parse_output_mode(label);
        if (!mode) {
            throw std::invalid_argument("unknown output_mode: " + label);
        }
        s.output_mode = *mode;
    }
    if (j.contains("worker_count")) {
        const auto workers = j.at("worker_count").get<long long>();
        if (workers < 1) {
            throw std::invalid_argument("worker_count must be at least 1");
        }
        s.worker_count = static_cast<size_t>(workers);
    }
    if (j.contains("chunk_frames")) {
        const auto frames = j.at("chunk_frames").get<long long>();
        if (frames < 1) {
            throw std::invalid_argument("chunk_frames must be at least 1");
        }
        s.chunk_frames = static_cast<size_t>(frames);
    }
    if (j.contains("target_sample_rate")) {
        const int rate = j.at("target_sample_rate").get<int>();
        if (!FilterBank::supports_sample_rate(rate)) {
            throw std::invalid_argument("target_sample_rate must exceed twice the highest filter cutoff");
        }
        s.target_sample_rate = rate;
    }
    if (j.contains("output_directory")) {
        s.output_directory = j.at("output_directory").get<std::string>();
    }
    if (j.contains("pcm_format")) {
        const auto name = j.at("pcm_format").get<std::string>();
        if (name == "pcm16") {
            s.pcm_format = PcmFormat::Pcm16;
        } else if (name == "float") {
            s.pcm_format = PcmFormat::Float32;
        } else {
            throw std::invalid_argument("unknown pcm_format: " + name);
        }
    }
    if (j.contains("alsa_device")) {
        s.alsa_device = j.at("alsa_device").get<std::string>();
    }
}

bool SettingsStore::save_to_file(const ConversionSettings& settings, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[SettingsStore] Failed to open file for writing: " << path << std::endl;
        return false;
    }
    file << serialize(settings);
    return static_cast<bool>(file);
}

bool SettingsStore::load_from_file(ConversionSettings& settings, const std::string& path) {
    std::cout << "[SettingsStore] Attempting to load: " << path << std::endl;
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[SettingsStore] Failed to open file: " << path << std::endl;
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    const bool success = deserialize(settings, content);
    if (success) {
        std::cout << "[SettingsStore] Loaded settings, mode " << mode_label(settings.output_mode) << std::endl;
    } else {
        std::cerr << "[SettingsStore] Failed to deserialize settings from: " << path << std::endl;
    }
    return success;
}

} // namespace spatializer
