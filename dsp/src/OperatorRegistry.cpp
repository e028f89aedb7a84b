/**
 * @file OperatorRegistry.cpp
 * @brief Built-in operator factories and JSON parameter parsing.
 * @author MasterLaplace
 */

#include "biosig/dsp/OperatorRegistry.hpp"

#include "biosig/dsp/ArtifactDetector.hpp"
#include "biosig/dsp/Detrend.hpp"
#include "biosig/dsp/Filters.hpp"
#include "biosig/dsp/Resample.hpp"

#include <format>

namespace biosig::dsp {

namespace {

core::Error badParameter(std::string_view op, std::string_view key, std::string_view expected)
{
    return core::Error::make(
        core::ErrorCode::kInvalidConfiguration,
        std::format("{}: parameter '{}' must be {}", op, key, expected));
}

core::Expected<double> readDouble(const Json::Value &config, std::string_view op, const char *key, double fallback)
{
    if (!config.isMember(key))
        return fallback;
    const Json::Value &value = config[key];
    if (!value.isNumeric())
        return std::unexpected(badParameter(op, key, "a number"));
    return value.asDouble();
}

core::Expected<int> readInt(const Json::Value &config, std::string_view op, const char *key, int fallback)
{
    if (!config.isMember(key))
        return fallback;
    const Json::Value &value = config[key];
    if (!value.isInt())
        return std::unexpected(badParameter(op, key, "an integer"));
    return value.asInt();
}

template <typename T, typename... Args>
core::Expected<std::unique_ptr<IOperator>> makeOperator(Args &&...args)
{
    return std::unique_ptr<IOperator>(std::make_unique<T>(std::forward<Args>(args)...));
}

core::Expected<std::unique_ptr<IOperator>> makeNotch(const Json::Value &j)
{
    const double freq = BIOSIG_TRY(readDouble(j, NotchFilter::kName, "freq", 50.0));
    const double q = BIOSIG_TRY(readDouble(j, NotchFilter::kName, "q", 30.0));
    return makeOperator<NotchFilter>(freq, q);
}

core::Expected<std::unique_ptr<IOperator>> makeBandpass(const Json::Value &j)
{
    const double low = BIOSIG_TRY(readDouble(j, BandpassFilter::kName, "low", 20.0));
    const double high = BIOSIG_TRY(readDouble(j, BandpassFilter::kName, "high", 450.0));
    const int order = BIOSIG_TRY(readInt(j, BandpassFilter::kName, "order", 4));
    return makeOperator<BandpassFilter>(low, high, order);
}

core::Expected<std::unique_ptr<IOperator>> makeHighpass(const Json::Value &j)
{
    const double cutoff = BIOSIG_TRY(readDouble(j, HighpassFilter::kName, "cutoff", 0.5));
    const int order = BIOSIG_TRY(readInt(j, HighpassFilter::kName, "order", 2));
    return makeOperator<HighpassFilter>(cutoff, order);
}

core::Expected<std::unique_ptr<IOperator>> makeLowpass(const Json::Value &j)
{
    const double cutoff = BIOSIG_TRY(readDouble(j, LowpassFilter::kName, "cutoff", 100.0));
    const int order = BIOSIG_TRY(readInt(j, LowpassFilter::kName, "order", 4));
    return makeOperator<LowpassFilter>(cutoff, order);
}

core::Expected<std::unique_ptr<IOperator>> makeResample(const Json::Value &j)
{
    const double target = BIOSIG_TRY(readDouble(j, Resample::kName, "target_fs", 250.0));
    return makeOperator<Resample>(target);
}

core::Expected<std::unique_ptr<IOperator>> makeArtifactDetector(const Json::Value &j)
{
    const double z = BIOSIG_TRY(readDouble(j, ArtifactDetector::kName, "z_thresh", 6.0));
    return makeOperator<ArtifactDetector>(z);
}

core::Expected<std::unique_ptr<IOperator>> makeDetrend(const Json::Value &j)
{
    if (!j.isMember("type"))
        return makeOperator<Detrend>();
    const Json::Value &value = j["type"];
    const auto type = value.isString() ? parseDetrendType(value.asString()) : std::nullopt;
    if (!type)
        return std::unexpected(badParameter(Detrend::kName, "type", "\"linear\" or \"constant\""));
    return makeOperator<Detrend>(*type);
}

} // anonymous namespace

OperatorRegistry::OperatorRegistry()
{
    _factories.emplace(std::string(NotchFilter::kName), makeNotch);
    _factories.emplace(std::string(BandpassFilter::kName), makeBandpass);
    _factories.emplace(std::string(HighpassFilter::kName), makeHighpass);
    _factories.emplace(std::string(LowpassFilter::kName), makeLowpass);
    _factories.emplace(std::string(Resample::kName), makeResample);
    _factories.emplace(std::string(ArtifactDetector::kName), makeArtifactDetector);
    _factories.emplace(std::string(Detrend::kName), makeDetrend);
}

OperatorRegistry &OperatorRegistry::instance()
{
    static OperatorRegistry registry;
    return registry;
}

void OperatorRegistry::registerFactory(std::string name, OperatorFactory factory)
{
    std::lock_guard lock(_mutex);
    _factories.insert_or_assign(std::move(name), std::move(factory));
}

core::Expected<std::unique_ptr<IOperator>> OperatorRegistry::create(const Json::Value &config) const
{
    if (!config.isObject() || !config["name"].isString()) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidConfiguration, "operator entry must be an object with a string 'name'"));
    }

    const std::string name = config["name"].asString();
    OperatorFactory factory;
    {
        std::lock_guard lock(_mutex);
        const auto it = _factories.find(name);
        if (it == _factories.end()) {
            return std::unexpected(core::Error::make(
                core::ErrorCode::kInvalidConfiguration, std::format("unknown operator '{}'", name)));
        }
        factory = it->second;
    }
    return factory(config);
}

bool OperatorRegistry::contains(std::string_view name) const
{
    std::lock_guard lock(_mutex);
    return _factories.find(name) != _factories.end();
}

std::vector<std::string> OperatorRegistry::names() const
{
    std::lock_guard lock(_mutex);
    std::vector<std::string> out;
    out.reserve(_factories.size());
    for (const auto &[name, factory] : _factories)
        out.push_back(name);
    return out;
}

} // namespace biosig::dsp
