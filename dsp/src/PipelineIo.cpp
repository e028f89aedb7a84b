/**
 * @file PipelineIo.cpp
 * @brief JSON (de)serialization of pipelines with jsoncpp.
 * @author MasterLaplace
 */

#include "biosig/dsp/PipelineIo.hpp"

#include "biosig/core/Log.hpp"

#include <format>
#include <fstream>
#include <memory>
#include <sstream>

namespace biosig::dsp {

core::Expected<Pipeline> parsePipeline(std::string_view text, double inputRate)
{
    Json::CharReaderBuilder builder;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kFileParseError, std::format("pipeline JSON: {}", errors)));
    }
    return Pipeline::fromJson(root, inputRate);
}

std::string serializePipeline(const Pipeline &pipeline)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, pipeline.toJson());
}

core::Expected<Pipeline> loadPipeline(const std::filesystem::path &path, double inputRate)
{
    std::ifstream file(path);
    if (!file.is_open())
        return std::unexpected(core::Error::make(core::ErrorCode::kFileNotFound, path.string()));

    std::ostringstream content;
    content << file.rdbuf();

    auto pipeline = parsePipeline(content.str(), inputRate);
    if (!pipeline) {
        pipeline.error().message = std::format("{}: {}", path.string(), pipeline.error().message);
        return pipeline;
    }
    core::Log::info("dsp", std::format("loaded pipeline '{}' ({} operator(s))", path.string(), pipeline->stageCount()));
    return pipeline;
}

core::ExpectedVoid savePipeline(const Pipeline &pipeline, const std::filesystem::path &path)
{
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kFileNotFound, std::format("cannot write {}", path.string())));
    }

    file << serializePipeline(pipeline) << '\n';
    if (!file) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidState, std::format("write failed for {}", path.string())));
    }
    return {};
}

} // namespace biosig::dsp
