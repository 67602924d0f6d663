#include "OutputNaming.hpp"
#include <ctime>
#include <filesystem>

namespace spatializer {

std::string timestamp_prefix(std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);

    char buffer[16];
    const size_t n = std::strftime(buffer, sizeof(buffer), "%Y%m%d%H%M", &local);
    return std::string(buffer, n);
}

std::string output_file_name(std::string_view input_path, OutputMode mode,
                             std::chrono::system_clock::time_point when) {
    std::string stem = std::filesystem::path(input_path).stem().string();
    if (stem.empty()) {
        stem = "audio";
    }
    return timestamp_prefix(when) + "_" + stem + "_" + std::string(mode_label(mode)) + ".wav";
}

std::string output_file_path(std::string_view output_directory, std::string_view input_path,
                             OutputMode mode, std::chrono::system_clock::time_point when) {
    const std::string name = output_file_name(input_path, mode, when);
    if (output_directory.empty()) {
        return name;
    }
    return (std::filesystem::path(output_directory) / name).string();
}

} // namespace spatializer
