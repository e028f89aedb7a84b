/**
 * @file FeatureVector.hpp
 * @brief Explicit feature schema and the ordered values bound to it.
 * @author MasterLaplace
 *
 * The schema fixes the key order once, at configuration time. Every
 * FeatureVector produced under it stores its values in that order, so the
 * flat positional view handed to a predictor is stable across runs.
 */

#pragma once

#include "biosig/core/Expected.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace biosig::feature {

class FeatureExtractor;

/**
 * @brief Ordered, versioned list of feature keys.
 */
struct FeatureSchema {
    std::uint32_t version = 1;
    std::vector<std::string> keys;

    [[nodiscard]] std::optional<std::size_t> indexOf(std::string_view key) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return keys.size(); }

    bool operator==(const FeatureSchema &) const = default;
};

/**
 * @brief Feature values in schema order.
 *
 * Cheap to copy: the schema is shared, only the values are owned.
 */
class FeatureVector {
public:
    /**
     * @brief Binds @p values to @p schema.
     *
     * @return kInvalidArgument when the schema is null or the value count
     *         differs from the key count
     */
    [[nodiscard]] static core::Expected<FeatureVector> make(
        std::shared_ptr<const FeatureSchema> schema, std::vector<double> values);

    FeatureVector() = default;

    [[nodiscard]] const FeatureSchema &schema() const noexcept;
    [[nodiscard]] const std::shared_ptr<const FeatureSchema> &sharedSchema() const noexcept { return _schema; }

    /** @brief Values in schema order. */
    [[nodiscard]] std::span<const double> values() const noexcept { return _values; }

    [[nodiscard]] std::optional<double> find(std::string_view key) const noexcept;
    [[nodiscard]] double at(std::size_t index) const noexcept { return _values[index]; }
    [[nodiscard]] const std::string &keyAt(std::size_t index) const noexcept { return schema().keys[index]; }

    [[nodiscard]] std::size_t size() const noexcept { return _values.size(); }
    [[nodiscard]] bool empty() const noexcept { return _values.empty(); }

private:
    friend class FeatureExtractor;

    FeatureVector(std::shared_ptr<const FeatureSchema> schema, std::vector<double> values);

    std::shared_ptr<const FeatureSchema> _schema;
    std::vector<double> _values;
};

} // namespace biosig::feature
