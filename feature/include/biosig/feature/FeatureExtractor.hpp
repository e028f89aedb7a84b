/**
 * @file FeatureExtractor.hpp
 * @brief Time, frequency and wavelet features over windows of a multichannel signal.
 * @author MasterLaplace
 *
 * Per channel the extractor emits, in this order:
 *   mean, std, rms, iemg, mav, wl, zc, median, iqr, skew, kurtosis,
 *   psd_power, psd_med_freq, wavelet_e_0 ... wavelet_e_L
 * Multichannel keys are prefixed with the channel index ("ch0_rms").
 *
 * @code
 *   FeatureExtractor extractor({.windowSeconds = 0.2, .stepSeconds = 0.1});
 *   auto windows = extractor.slidingExtract(recording, 1000.0);
 *   if (windows) {
 *       for (const FeatureVector &features : *windows) { ... }
 *   }
 * @endcode
 */

#pragma once

#include "biosig/core/Expected.hpp"
#include "biosig/dsp/SampleFrame.hpp"
#include "biosig/feature/FeatureVector.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace biosig::feature {

struct FeatureExtractorConfig {
    double windowSeconds = 0.2;
    double stepSeconds = 0.1;
    std::size_t welchSegment = 256;
    std::size_t waveletLevel = 3;
};

class FeatureExtractor;

/**
 * @brief Lazy, finite, restartable sequence of per-window feature vectors.
 *
 * Windows start at 0, step, 2 * step, ... and are emitted while they fit
 * entirely inside the signal. Each dereference computes that window's
 * features; begin() may be called any number of times.
 *
 * References the extractor and the signal; both must outlive the range.
 */
class SlidingFeatures {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = FeatureVector;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = FeatureVector;

        Iterator() = default;

        [[nodiscard]] FeatureVector operator*() const;
        Iterator &operator++() noexcept;
        Iterator operator++(int) noexcept;
        bool operator==(const Iterator &other) const noexcept = default;

        /** @brief Column of the first sample of the current window. */
        [[nodiscard]] std::size_t windowStart() const noexcept;

    private:
        friend class SlidingFeatures;
        Iterator(const SlidingFeatures *owner, std::size_t index) noexcept : _owner(owner), _index(index) {}

        const SlidingFeatures *_owner = nullptr;
        std::size_t _index = 0;
    };

    [[nodiscard]] Iterator begin() const noexcept { return Iterator(this, 0); }
    [[nodiscard]] Iterator end() const noexcept { return Iterator(this, _count); }

    [[nodiscard]] std::size_t size() const noexcept { return _count; }
    [[nodiscard]] bool empty() const noexcept { return _count == 0; }
    [[nodiscard]] std::size_t windowSamples() const noexcept { return _window; }
    [[nodiscard]] std::size_t stepSamples() const noexcept { return _step; }

    /** @brief Materializes every window. */
    [[nodiscard]] std::vector<FeatureVector> collect() const;

private:
    friend class FeatureExtractor;
    SlidingFeatures(const FeatureExtractor &extractor, const dsp::SampleMatrix &signal,
                    double sampleRate, std::size_t window, std::size_t step) noexcept;

    [[nodiscard]] FeatureVector windowAt(std::size_t index) const;

    const FeatureExtractor *_extractor;
    const dsp::SampleMatrix *_signal;
    double _sampleRate;
    std::size_t _window;
    std::size_t _step;
    std::size_t _count;
};

/**
 * @brief Computes the feature groups for single windows and sliding scans.
 *
 * Pure: the same input always yields the same output. Safe to share
 * between threads.
 */
class FeatureExtractor {
public:
    static constexpr std::uint32_t kSchemaVersion = 1;

    explicit FeatureExtractor(FeatureExtractorConfig config = {});

    /**
     * @brief Per-channel feature names, in emission order.
     */
    [[nodiscard]] const std::vector<std::string> &featureNames() const noexcept { return _names; }

    /**
     * @brief Schema of extract() output for @p channelCount channels.
     *
     * Built once per channel count and shared by every vector it produces.
     */
    [[nodiscard]] std::shared_ptr<const FeatureSchema> schema(std::size_t channelCount) const;

    /**
     * @brief Features of one channel's window (unprefixed keys).
     *
     * @return kEmptyInput for an empty window, kInvalidArgument for a
     *         non-positive sampling rate
     */
    [[nodiscard]] core::Expected<FeatureVector> extractWindow(std::span<const double> signal, double sampleRate) const;

    /**
     * @brief Features of every channel of @p window, keys "ch{i}_{name}".
     */
    [[nodiscard]] core::Expected<FeatureVector> extract(const dsp::SampleMatrix &window, double sampleRate) const;

    /**
     * @brief Lazily scans @p signal with the configured window and step.
     *
     * Window and step are round(seconds * sampleRate) samples.
     *
     * The returned range refers to @p signal, which must outlive it.
     *
     * @return kInvalidConfiguration when either is shorter than one sample
     */
    [[nodiscard]] core::Expected<SlidingFeatures> slidingExtract(const dsp::SampleMatrix &signal, double sampleRate) const;
    core::Expected<SlidingFeatures> slidingExtract(dsp::SampleMatrix &&, double) const = delete;

    /** @brief round(windowSeconds * sampleRate). */
    [[nodiscard]] std::size_t windowSamples(double sampleRate) const noexcept;

    /** @brief round(stepSeconds * sampleRate). */
    [[nodiscard]] std::size_t stepSamples(double sampleRate) const noexcept;

    [[nodiscard]] const FeatureExtractorConfig &config() const noexcept { return _config; }

private:
    friend class SlidingFeatures;

    void appendChannel(std::span<const double> signal, double sampleRate, std::vector<double> &out) const;
    [[nodiscard]] FeatureVector computeAll(const dsp::SampleMatrix &window, Eigen::Index startColumn,
                                           Eigen::Index columns, double sampleRate) const;

    FeatureExtractorConfig _config;
    std::vector<std::string> _names;
    std::shared_ptr<const FeatureSchema> _channelSchema;

    mutable std::mutex _schemaMutex;
    mutable std::shared_ptr<const FeatureSchema> _cachedSchema;
};

} // namespace biosig::feature
