/**
 * @file Pipeline.cpp
 * @brief Implementation of the operator Pipeline and PipelineBuilder.
 * @author MasterLaplace
 */

#include "biosig/dsp/Pipeline.hpp"
#include "biosig/dsp/OperatorRegistry.hpp"

#include "biosig/core/Log.hpp"

#include <format>

namespace biosig::dsp {

// ─── PipelineBuilder ─────────────────────────────────────────────────────────

PipelineBuilder &PipelineBuilder::add(std::unique_ptr<IOperator> op)
{
    if (op)
        _operators.push_back(std::move(op));
    return *this;
}

core::Expected<Pipeline> PipelineBuilder::build(double inputRate)
{
    if (!(inputRate > 0.0)) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidConfiguration,
            std::format("pipeline input rate must be > 0, got {}", inputRate)));
    }

    double rate = inputRate;
    for (const auto &op : _operators) {
        auto next = op->validate(rate);
        if (!next) {
            core::Log::error("dsp", std::format("operator '{}' rejected at {} Hz: {}",
                op->name(), rate, next.error().message));
            return std::unexpected(std::move(next.error()));
        }
        rate = *next;
    }

    core::Log::debug("dsp", std::format("pipeline built: {} operator(s), {} Hz -> {} Hz",
        _operators.size(), inputRate, rate));
    return Pipeline(std::move(_operators), inputRate, rate);
}

// ─── Pipeline ────────────────────────────────────────────────────────────────

Pipeline::Pipeline(std::vector<std::unique_ptr<IOperator>> operators, double inputRate, double outputRate)
    : _operators(std::move(operators)), _inputRate(inputRate), _outputRate(outputRate)
{
}

PipelineBuilder Pipeline::builder()
{
    return PipelineBuilder{};
}

core::Expected<PipelineOutput> Pipeline::run(SampleFrame frame)
{
    std::vector<HistoryEntry> entries;
    entries.reserve(_operators.size());
    auto output = BIOSIG_TRY(apply(std::move(frame), &entries));

    for (auto &entry : entries)
        record(std::move(entry));
    return output;
}

core::Expected<PipelineOutput> Pipeline::dryRun(SampleFrame frame) const
{
    return apply(std::move(frame), nullptr);
}

core::Expected<PipelineOutput> Pipeline::apply(SampleFrame frame, std::vector<HistoryEntry> *entries) const
{
    if (frame.sampleRate != _inputRate) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidArgument,
            std::format("pipeline built for {} Hz, frame is {} Hz", _inputRate, frame.sampleRate)));
    }
    if (frame.timestamps.size() != frame.sampleCount()) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidArgument,
            std::format("frame has {} samples but {} timestamps", frame.sampleCount(), frame.timestamps.size())));
    }

    PipelineOutput output;
    output.frame = std::move(frame);

    for (const auto &op : _operators) {
        auto result = op->process(std::move(output.frame));
        if (!result)
            return std::unexpected(std::move(result.error()));

        output.frame = std::move(result->frame);
        if (entries)
            entries->push_back(HistoryEntry{std::string(op->name()), op->jsonize(), result->annotation});
        output.annotations.insert_or_assign(std::string(op->name()), std::move(result->annotation));
    }
    return output;
}

Json::Value Pipeline::toJson() const
{
    Json::Value config;
    config["version"] = kConfigVersion;
    Json::Value ops(Json::arrayValue);
    for (const auto &op : _operators)
        ops.append(op->jsonize());
    config["operators"] = std::move(ops);
    return config;
}

core::Expected<Pipeline> Pipeline::fromJson(const Json::Value &config, double inputRate)
{
    if (!config.isObject()) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidConfiguration, "pipeline configuration must be a JSON object"));
    }

    const Json::Value &ops = config.isMember("operators") ? config["operators"] : config["ops"];
    if (!ops.isArray()) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidConfiguration, "pipeline configuration has no 'operators' array"));
    }

    const auto &registry = OperatorRegistry::instance();
    PipelineBuilder builder;
    for (const auto &entry : ops)
        builder.add(BIOSIG_TRY(registry.create(entry)));
    return builder.build(inputRate);
}

void Pipeline::setHistoryLimit(std::size_t limit)
{
    _historyLimit = limit;
    while (_historyLimit != 0 && _history.size() > _historyLimit)
        _history.pop_front();
}

std::vector<std::string> Pipeline::operatorNames() const
{
    std::vector<std::string> names;
    names.reserve(_operators.size());
    for (const auto &op : _operators)
        names.emplace_back(op->name());
    return names;
}

void Pipeline::record(HistoryEntry entry)
{
    _history.push_back(std::move(entry));
    if (_historyLimit != 0 && _history.size() > _historyLimit)
        _history.pop_front();
}

} // namespace biosig::dsp
