/**
 * @file IOperator.hpp
 * @brief Abstract interface for a single operator in the preprocessing pipeline.
 * @author MasterLaplace
 *
 * Every transform (filtering, resampling, detrending) and every detector
 * implements this interface. Operators are composed sequentially by the
 * Pipeline class using the Builder pattern.
 *
 * @see Pipeline
 */

#pragma once

#include "biosig/core/Expected.hpp"
#include "biosig/dsp/SampleFrame.hpp"

#include <json/json.h>

#include <string_view>

namespace biosig::dsp {

/**
 * @brief Processed frame plus whatever the operator reports about it.
 */
struct OperatorOutput {
    SampleFrame frame;
    Annotation annotation;
};

/**
 * @brief A single immutable operator that transforms a SampleFrame.
 *
 * Contract:
 *  - parameters are fixed at construction; process() is const and may be
 *    called with any frame whose sampleRate passed validate().
 *  - process() takes the frame by value: an operator that leaves the data
 *    untouched moves it through without copying.
 *  - name() is the stable identifier used in history, annotations and
 *    JSON configuration.
 */
class IOperator {
public:
    virtual ~IOperator() = default;

    IOperator(const IOperator &) = delete;
    IOperator &operator=(const IOperator &) = delete;
    IOperator(IOperator &&) = default;
    IOperator &operator=(IOperator &&) = default;

    /**
     * @brief Transforms the frame.
     *
     * @param frame Samples, timestamps and the sampling rate they were taken at
     * @return The transformed frame and annotation, or an Error
     */
    [[nodiscard]] virtual core::Expected<OperatorOutput> process(SampleFrame frame) const = 0;

    /**
     * @brief Checks the parameters against an input sampling rate.
     *
     * @return The sampling rate of the operator's output, or
     *         kInvalidConfiguration
     */
    [[nodiscard]] virtual core::Expected<double> validate(double sampleRate) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /**
     * @brief Configuration snapshot: {"name": ..., parameters...}.
     */
    [[nodiscard]] virtual Json::Value jsonize() const = 0;

protected:
    IOperator() = default;
};

} // namespace biosig::dsp
