/**
 * @file PipelineIo.hpp
 * @brief Reading and writing pipeline configurations as JSON documents.
 * @author MasterLaplace
 *
 * Document layout:
 * @code
 *   {
 *     "version": 1,
 *     "operators": [
 *       { "name": "notch", "freq": 50.0, "q": 30.0 },
 *       { "name": "bandpass", "low": 1.0, "high": 100.0, "order": 4 }
 *     ]
 *   }
 * @endcode
 */

#pragma once

#include "biosig/dsp/Pipeline.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace biosig::dsp {

/**
 * @brief Parses a JSON document and builds the pipeline it describes.
 */
[[nodiscard]] core::Expected<Pipeline> parsePipeline(std::string_view text, double inputRate);

/**
 * @brief Serializes the pipeline configuration (operators in order).
 */
[[nodiscard]] std::string serializePipeline(const Pipeline &pipeline);

[[nodiscard]] core::Expected<Pipeline> loadPipeline(const std::filesystem::path &path, double inputRate);

[[nodiscard]] core::ExpectedVoid savePipeline(const Pipeline &pipeline, const std::filesystem::path &path);

} // namespace biosig::dsp
