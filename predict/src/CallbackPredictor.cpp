/**
 * @file CallbackPredictor.cpp
 * @brief Implementation of the callable-backed predictor.
 * @author MasterLaplace
 */

#include "biosig/predict/CallbackPredictor.hpp"

#include <format>

namespace biosig::predict {

CallbackPredictor::CallbackPredictor(FlatFn flat, KeyedFn keyed, SchemaFn onBind)
    : _flat(std::move(flat)), _keyed(std::move(keyed)), _onBind(std::move(onBind))
{
}

core::ExpectedVoid CallbackPredictor::bindSchema(const feature::FeatureSchema &schema)
{
    if (_onBind)
        BIOSIG_TRY_VOID(_onBind(schema));
    _schema = schema;
    return {};
}

core::Expected<Prediction> CallbackPredictor::predict(const feature::FeatureVector &features)
{
    if (!_keyed) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kPredictorInput, "predictor accepts positional input only"));
    }
    return _keyed(features);
}

core::Expected<Prediction> CallbackPredictor::predict(std::span<const double> values)
{
    if (!_flat) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kPredictorFailure, "predictor has no positional entry point"));
    }
    if (_schema && values.size() != _schema->size()) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kPredictorInput,
            std::format("expected {} values, got {}", _schema->size(), values.size())));
    }
    return _flat(values);
}

} // namespace biosig::predict
