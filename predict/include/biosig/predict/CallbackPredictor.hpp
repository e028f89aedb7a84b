/**
 * @file CallbackPredictor.hpp
 * @brief IPredictor adapter over plain callables.
 * @author MasterLaplace
 *
 * Lets an application or a test plug a model in without subclassing.
 * A missing keyed callback makes the keyed overload report
 * kPredictorInput, so only the positional path is used.
 */

#pragma once

#include "biosig/predict/IPredictor.hpp"

#include <functional>
#include <optional>

namespace biosig::predict {

class CallbackPredictor final : public IPredictor {
public:
    using KeyedFn = std::function<core::Expected<Prediction>(const feature::FeatureVector &)>;
    using FlatFn = std::function<core::Expected<Prediction>(std::span<const double>)>;
    using SchemaFn = std::function<core::ExpectedVoid(const feature::FeatureSchema &)>;

    /**
     * @param flat  Positional model entry point, required
     * @param keyed Keyed model entry point, optional
     */
    explicit CallbackPredictor(FlatFn flat, KeyedFn keyed = {}, SchemaFn onBind = {});

    [[nodiscard]] core::ExpectedVoid bindSchema(const feature::FeatureSchema &schema) override;
    [[nodiscard]] core::Expected<Prediction> predict(const feature::FeatureVector &features) override;
    [[nodiscard]] core::Expected<Prediction> predict(std::span<const double> values) override;

    [[nodiscard]] const std::optional<feature::FeatureSchema> &boundSchema() const noexcept { return _schema; }

private:
    FlatFn _flat;
    KeyedFn _keyed;
    SchemaFn _onBind;
    std::optional<feature::FeatureSchema> _schema;
};

} // namespace biosig::predict
