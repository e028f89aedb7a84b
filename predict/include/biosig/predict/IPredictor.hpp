/**
 * @file IPredictor.hpp
 * @brief Interface to the classifier fed by the real-time scheduler.
 * @author MasterLaplace
 *
 * The model itself lives outside this library. A predictor first binds to
 * the feature schema it will receive (and may refuse it), then maps
 * feature vectors to predictions. Implementations that only accept a
 * positional input report kPredictorInput from the keyed overload; the
 * scheduler then retries once with the values in schema order.
 */

#pragma once

#include "biosig/core/Expected.hpp"
#include "biosig/feature/FeatureVector.hpp"

#include <span>
#include <string>
#include <vector>

namespace biosig::predict {

/**
 * @brief Classifier output: a label and optional per-class scores.
 */
struct Prediction {
    std::string label;
    std::vector<double> scores;
};

class IPredictor {
public:
    virtual ~IPredictor() = default;

    IPredictor(const IPredictor &) = delete;
    IPredictor &operator=(const IPredictor &) = delete;
    IPredictor(IPredictor &&) = default;
    IPredictor &operator=(IPredictor &&) = default;

    /**
     * @brief Announces the schema every later call will use.
     *
     * @return kPredictorInput (or any Error) to refuse the schema
     */
    [[nodiscard]] virtual core::ExpectedVoid bindSchema(const feature::FeatureSchema &schema) = 0;

    /**
     * @brief Predicts from keyed features.
     *
     * @return kPredictorInput when this input shape is not accepted,
     *         kPredictorFailure for any other model error
     */
    [[nodiscard]] virtual core::Expected<Prediction> predict(const feature::FeatureVector &features) = 0;

    /**
     * @brief Predicts from the flat values, ordered as the bound schema.
     */
    [[nodiscard]] virtual core::Expected<Prediction> predict(std::span<const double> values) = 0;

protected:
    IPredictor() = default;
};

} // namespace biosig::predict
