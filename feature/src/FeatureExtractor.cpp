/**
 * @file FeatureExtractor.cpp
 * @brief Implementation of FeatureExtractor and its sliding-window range.
 * @author MasterLaplace
 */

#include "biosig/feature/FeatureExtractor.hpp"

#include "biosig/core/Log.hpp"
#include "biosig/feature/Spectral.hpp"
#include "biosig/feature/TimeDomain.hpp"
#include "biosig/feature/Wavelet.hpp"

#include <cmath>
#include <format>

namespace biosig::feature {

namespace {

constexpr const char *kTimeDomainNames[] = {
    "mean", "std", "rms", "iemg", "mav", "wl", "zc", "median", "iqr", "skew", "kurtosis"
};

std::size_t secondsToSamples(double seconds, double sampleRate) noexcept
{
    const double samples = std::round(seconds * sampleRate);
    return samples > 0.0 ? static_cast<std::size_t>(samples) : 0;
}

} // anonymous namespace

// ─── FeatureExtractor ────────────────────────────────────────────────────────

FeatureExtractor::FeatureExtractor(FeatureExtractorConfig config)
    : _config(config)
{
    for (const char *name : kTimeDomainNames)
        _names.emplace_back(name);
    _names.emplace_back("psd_power");
    _names.emplace_back("psd_med_freq");
    for (std::size_t i = 0; i <= _config.waveletLevel; ++i)
        _names.push_back(std::format("wavelet_e_{}", i));

    _channelSchema = std::make_shared<const FeatureSchema>(FeatureSchema{kSchemaVersion, _names});
}

std::shared_ptr<const FeatureSchema> FeatureExtractor::schema(std::size_t channelCount) const
{
    std::lock_guard lock(_schemaMutex);
    if (_cachedSchema && _cachedSchema->size() == channelCount * _names.size())
        return _cachedSchema;

    FeatureSchema schema{kSchemaVersion, {}};
    schema.keys.reserve(channelCount * _names.size());
    for (std::size_t ch = 0; ch < channelCount; ++ch) {
        for (const auto &name : _names)
            schema.keys.push_back(std::format("ch{}_{}", ch, name));
    }
    _cachedSchema = std::make_shared<const FeatureSchema>(std::move(schema));
    return _cachedSchema;
}

std::size_t FeatureExtractor::windowSamples(double sampleRate) const noexcept
{
    return secondsToSamples(_config.windowSeconds, sampleRate);
}

std::size_t FeatureExtractor::stepSamples(double sampleRate) const noexcept
{
    return secondsToSamples(_config.stepSeconds, sampleRate);
}

void FeatureExtractor::appendChannel(std::span<const double> signal, double sampleRate, std::vector<double> &out) const
{
    const auto td = TimeDomain::compute(signal);
    out.insert(out.end(), {
        td.mean, td.std, td.rms, td.iemg, td.mav, td.wl, td.zc,
        td.median, td.iqr, td.skew, td.kurtosis
    });

    const auto psd = Spectral::welch(signal, sampleRate, _config.welchSegment);
    out.push_back(Spectral::totalPower(psd));
    out.push_back(Spectral::medianFrequency(psd));

    const auto energies = Wavelet::bandEnergies(signal, _config.waveletLevel);
    out.insert(out.end(), energies.begin(), energies.end());
}

FeatureVector FeatureExtractor::computeAll(const dsp::SampleMatrix &window, Eigen::Index startColumn,
                                           Eigen::Index columns, double sampleRate) const
{
    const auto channels = static_cast<std::size_t>(window.rows());
    std::vector<double> values;
    values.reserve(channels * _names.size());
    for (Eigen::Index ch = 0; ch < window.rows(); ++ch) {
        const auto row = dsp::channelView(window, ch).subspan(
            static_cast<std::size_t>(startColumn), static_cast<std::size_t>(columns));
        appendChannel(row, sampleRate, values);
    }
    return FeatureVector(schema(channels), std::move(values));
}

core::Expected<FeatureVector> FeatureExtractor::extractWindow(std::span<const double> signal, double sampleRate) const
{
    if (signal.empty())
        return std::unexpected(core::Error::make(core::ErrorCode::kEmptyInput, "extractWindow: empty window"));
    if (!(sampleRate > 0.0)) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidArgument, std::format("extractWindow: sampling rate {} must be > 0", sampleRate)));
    }
    if (_config.waveletLevel > Wavelet::maxUsefulLevel(signal.size()) && core::Log::enabled(core::LogLevel::kDebug)) {
        core::Log::debug("feature", std::format("wavelet level {} exceeds the useful depth for {} samples",
            _config.waveletLevel, signal.size()));
    }

    std::vector<double> values;
    values.reserve(_names.size());
    appendChannel(signal, sampleRate, values);
    return FeatureVector(_channelSchema, std::move(values));
}

core::Expected<FeatureVector> FeatureExtractor::extract(const dsp::SampleMatrix &window, double sampleRate) const
{
    if (window.size() == 0)
        return std::unexpected(core::Error::make(core::ErrorCode::kEmptyInput, "extract: empty window"));
    if (!(sampleRate > 0.0)) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidArgument, std::format("extract: sampling rate {} must be > 0", sampleRate)));
    }
    return computeAll(window, 0, window.cols(), sampleRate);
}

core::Expected<SlidingFeatures> FeatureExtractor::slidingExtract(const dsp::SampleMatrix &signal, double sampleRate) const
{
    if (!(sampleRate > 0.0)) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidArgument, std::format("slidingExtract: sampling rate {} must be > 0", sampleRate)));
    }

    const auto window = windowSamples(sampleRate);
    const auto step = stepSamples(sampleRate);
    if (window == 0 || step == 0) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidConfiguration,
            std::format("window {} s / step {} s are shorter than one sample at {} Hz",
                _config.windowSeconds, _config.stepSeconds, sampleRate)));
    }
    return SlidingFeatures(*this, signal, sampleRate, window, step);
}

// ─── SlidingFeatures ─────────────────────────────────────────────────────────

SlidingFeatures::SlidingFeatures(const FeatureExtractor &extractor, const dsp::SampleMatrix &signal,
                                 double sampleRate, std::size_t window, std::size_t step) noexcept
    : _extractor(&extractor), _signal(&signal), _sampleRate(sampleRate), _window(window), _step(step)
{
    const auto n = static_cast<std::size_t>(signal.cols());
    _count = (signal.rows() == 0 || n < window) ? 0 : (n - window) / step + 1;
}

FeatureVector SlidingFeatures::windowAt(std::size_t index) const
{
    return _extractor->computeAll(*_signal, static_cast<Eigen::Index>(index * _step),
                                  static_cast<Eigen::Index>(_window), _sampleRate);
}

std::vector<FeatureVector> SlidingFeatures::collect() const
{
    std::vector<FeatureVector> out;
    out.reserve(_count);
    for (std::size_t i = 0; i < _count; ++i)
        out.push_back(windowAt(i));
    return out;
}

FeatureVector SlidingFeatures::Iterator::operator*() const
{
    return _owner->windowAt(_index);
}

SlidingFeatures::Iterator &SlidingFeatures::Iterator::operator++() noexcept
{
    ++_index;
    return *this;
}

SlidingFeatures::Iterator SlidingFeatures::Iterator::operator++(int) noexcept
{
    Iterator previous = *this;
    ++_index;
    return previous;
}

std::size_t SlidingFeatures::Iterator::windowStart() const noexcept
{
    return _owner ? _index * _owner->_step : 0;
}

} // namespace biosig::feature
