/**
 * @file FeatureVector.cpp
 * @brief Implementation of FeatureSchema lookups and FeatureVector.
 * @author MasterLaplace
 */

#include "biosig/feature/FeatureVector.hpp"

#include <algorithm>
#include <format>

namespace biosig::feature {

namespace {

const FeatureSchema kEmptySchema{};

} // anonymous namespace

std::optional<std::size_t> FeatureSchema::indexOf(std::string_view key) const noexcept
{
    const auto it = std::find(keys.begin(), keys.end(), key);
    if (it == keys.end())
        return std::nullopt;
    return static_cast<std::size_t>(it - keys.begin());
}

core::Expected<FeatureVector> FeatureVector::make(
    std::shared_ptr<const FeatureSchema> schema, std::vector<double> values)
{
    if (!schema) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidArgument, "FeatureVector requires a schema"));
    }
    if (schema->size() != values.size()) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidArgument,
            std::format("schema has {} keys, got {} values", schema->size(), values.size())));
    }
    return FeatureVector(std::move(schema), std::move(values));
}

FeatureVector::FeatureVector(std::shared_ptr<const FeatureSchema> schema, std::vector<double> values)
    : _schema(std::move(schema)), _values(std::move(values))
{
}

const FeatureSchema &FeatureVector::schema() const noexcept
{
    return _schema ? *_schema : kEmptySchema;
}

std::optional<double> FeatureVector::find(std::string_view key) const noexcept
{
    const auto index = schema().indexOf(key);
    if (!index)
        return std::nullopt;
    return _values[*index];
}

} // namespace biosig::feature
