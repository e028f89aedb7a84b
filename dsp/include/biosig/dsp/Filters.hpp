/**
 * @file Filters.hpp
 * @brief Zero-phase IIR filter operators: notch and Butterworth band types.
 * @author MasterLaplace
 *
 * Each operator designs its SOS cascade for the frame's sampling rate and
 * filters every channel forward and backward, so the output keeps the
 * input shape and carries no group delay.
 *
 * @code
 *   auto pipeline = Pipeline::builder()
 *       .add<NotchFilter>(50.0, 30.0)
 *       .add<BandpassFilter>(20.0, 450.0, 4)
 *       .build(1000.0);
 * @endcode
 *
 * @see ZeroPhaseFilter.hpp
 */

#pragma once

#include "biosig/dsp/FilterDesign.hpp"
#include "biosig/dsp/IOperator.hpp"

namespace biosig::dsp {

/**
 * @brief Shared process()/validate() for operators defined by a SOS design.
 */
class ZeroPhaseOperator : public IOperator {
public:
    [[nodiscard]] core::Expected<OperatorOutput> process(SampleFrame frame) const override;
    [[nodiscard]] core::Expected<double> validate(double sampleRate) const override;

protected:
    /**
     * @brief Designs the cascade for the given sampling rate.
     */
    [[nodiscard]] virtual core::Expected<SosCascade> design(double sampleRate) const = 0;
};

/**
 * @brief Narrowband band-reject filter.
 */
class NotchFilter final : public ZeroPhaseOperator {
public:
    static constexpr std::string_view kName = "notch";

    /**
     * @param frequency Rejected frequency in Hz
     * @param quality   Quality factor (frequency / bandwidth)
     */
    explicit NotchFilter(double frequency = 50.0, double quality = 30.0);

    [[nodiscard]] std::string_view name() const noexcept override { return kName; }
    [[nodiscard]] Json::Value jsonize() const override;

    [[nodiscard]] double frequency() const noexcept { return _frequency; }
    [[nodiscard]] double quality() const noexcept { return _quality; }

protected:
    [[nodiscard]] core::Expected<SosCascade> design(double sampleRate) const override;

private:
    double _frequency;
    double _quality;
};

/**
 * @brief Butterworth band-pass between two cutoffs in Hz.
 */
class BandpassFilter final : public ZeroPhaseOperator {
public:
    static constexpr std::string_view kName = "bandpass";

    BandpassFilter(double low = 20.0, double high = 450.0, int order = 4);

    [[nodiscard]] std::string_view name() const noexcept override { return kName; }
    [[nodiscard]] Json::Value jsonize() const override;

protected:
    [[nodiscard]] core::Expected<SosCascade> design(double sampleRate) const override;

private:
    double _low;
    double _high;
    int _order;
};

/**
 * @brief Butterworth high-pass, typically used to remove baseline wander.
 */
class HighpassFilter final : public ZeroPhaseOperator {
public:
    static constexpr std::string_view kName = "highpass";

    explicit HighpassFilter(double cutoff = 0.5, int order = 2);

    [[nodiscard]] std::string_view name() const noexcept override { return kName; }
    [[nodiscard]] Json::Value jsonize() const override;

protected:
    [[nodiscard]] core::Expected<SosCascade> design(double sampleRate) const override;

private:
    double _cutoff;
    int _order;
};

/**
 * @brief Butterworth low-pass.
 */
class LowpassFilter final : public ZeroPhaseOperator {
public:
    static constexpr std::string_view kName = "lowpass";

    explicit LowpassFilter(double cutoff = 100.0, int order = 4);

    [[nodiscard]] std::string_view name() const noexcept override { return kName; }
    [[nodiscard]] Json::Value jsonize() const override;

protected:
    [[nodiscard]] core::Expected<SosCascade> design(double sampleRate) const override;

private:
    double _cutoff;
    int _order;
};

} // namespace biosig::dsp
