/**
 * @file TestCallbackPredictor.cpp
 * @brief Unit tests for predict::CallbackPredictor.
 */

#include <catch2/catch_test_macros.hpp>

#include "biosig/predict/CallbackPredictor.hpp"

#include <memory>
#include <vector>

namespace biosig::predict {

namespace {

core::Expected<Prediction> sumLabel(std::span<const double> values)
{
    double sum = 0.0;
    for (double v : values)
        sum += v;
    return Prediction{sum > 0.0 ? "positive" : "non-positive", {sum}};
}

std::shared_ptr<const feature::FeatureSchema> twoKeys()
{
    return std::make_shared<const feature::FeatureSchema>(feature::FeatureSchema{1, {"ch0_rms", "ch1_rms"}});
}

} // namespace

TEST_CASE("Positional-only predictor refuses keyed input", "[predict]")
{
    CallbackPredictor predictor(sumLabel);
    const auto schema = twoKeys();
    REQUIRE(predictor.bindSchema(*schema));

    const auto features = feature::FeatureVector::make(schema, {1.0, 2.0});
    REQUIRE(features.has_value());

    const auto keyed = predictor.predict(*features);
    REQUIRE_FALSE(keyed.has_value());
    REQUIRE(keyed.error().code == core::ErrorCode::kPredictorInput);

    const auto flat = predictor.predict(features->values());
    REQUIRE(flat.has_value());
    REQUIRE(flat->label == "positive");
    REQUIRE(flat->scores == std::vector<double>{3.0});
}

TEST_CASE("Keyed callback receives the named features", "[predict]")
{
    CallbackPredictor predictor(sumLabel, [](const feature::FeatureVector &features) -> core::Expected<Prediction> {
        const auto rms = features.find("ch1_rms");
        if (!rms)
            return std::unexpected(core::Error::make(core::ErrorCode::kPredictorInput, "ch1_rms missing"));
        return Prediction{*rms > 1.0 ? "high" : "low", {}};
    });

    const auto features = feature::FeatureVector::make(twoKeys(), {0.0, 4.0});
    const auto prediction = predictor.predict(*features);
    REQUIRE(prediction.has_value());
    REQUIRE(prediction->label == "high");
}

TEST_CASE("Flat input must match the bound schema size", "[predict]")
{
    CallbackPredictor predictor(sumLabel);
    const std::vector<double> values{1.0, 2.0, 3.0};

    REQUIRE(predictor.predict(std::span<const double>(values)).has_value());

    REQUIRE(predictor.bindSchema(*twoKeys()));
    const auto mismatched = predictor.predict(std::span<const double>(values));
    REQUIRE_FALSE(mismatched.has_value());
    REQUIRE(mismatched.error().code == core::ErrorCode::kPredictorInput);
}

TEST_CASE("Schema callback may refuse a schema", "[predict]")
{
    CallbackPredictor predictor(sumLabel, {}, [](const feature::FeatureSchema &schema) -> core::ExpectedVoid {
        if (!schema.indexOf("ch2_rms"))
            return std::unexpected(core::Error::make(core::ErrorCode::kPredictorInput, "model needs 3 channels"));
        return {};
    });

    const auto bound = predictor.bindSchema(*twoKeys());
    REQUIRE_FALSE(bound.has_value());
    REQUIRE(bound.error().code == core::ErrorCode::kPredictorInput);
    REQUIRE_FALSE(predictor.boundSchema().has_value());
}

TEST_CASE("Accepted schema is kept", "[predict]")
{
    CallbackPredictor predictor(sumLabel);
    REQUIRE(predictor.bindSchema(*twoKeys()));
    REQUIRE(predictor.boundSchema().has_value());
    REQUIRE(*predictor.boundSchema() == *twoKeys());
}

TEST_CASE("Missing positional entry point is a model failure", "[predict]")
{
    CallbackPredictor predictor(nullptr);
    const std::vector<double> values{1.0};
    REQUIRE(predictor.predict(std::span<const double>(values)).error().code == core::ErrorCode::kPredictorFailure);
}

} // namespace biosig::predict
