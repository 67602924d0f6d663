/**
 * @file OutputNaming.hpp
 * @brief File names for converted output: <yyyyMMddHHmm>_<basename>_<label>.wav
 */

#ifndef SPATIALIZER_OUTPUT_NAMING_HPP
#define SPATIALIZER_OUTPUT_NAMING_HPP

#include "OutputMode.hpp"
#include <chrono>
#include <string>
#include <string_view>

namespace spatializer {

/**
 * @brief Local-time stamp in yyyyMMddHHmm form.
 */
std::string timestamp_prefix(std::chrono::system_clock::time_point when);

/**
 * @brief Output file name for @p input_path: stamp, input stem and mode label.
 */
std::string output_file_name(std::string_view input_path, OutputMode mode,
                             std::chrono::system_clock::time_point when);

/**
 * @brief output_file_name() placed under @p output_directory ("" keeps it relative).
 */
std::string output_file_path(std::string_view output_directory, std::string_view input_path,
                             OutputMode mode, std::chrono::system_clock::time_point when);

} // namespace spatializer

#endif // SPATIALIZER_OUTPUT_NAMING_HPP
