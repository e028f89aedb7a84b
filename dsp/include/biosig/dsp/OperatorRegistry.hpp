/**
 * @file OperatorRegistry.hpp
 * @brief Maps JSON operator names to factories for pipeline deserialization.
 * @author MasterLaplace
 *
 * Every built-in operator is registered on first use. Additional operator
 * types can be registered at startup, before any pipeline is loaded.
 */

#pragma once

#include "biosig/dsp/IOperator.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace biosig::dsp {

using OperatorFactory = std::function<core::Expected<std::unique_ptr<IOperator>>(const Json::Value &)>;

class OperatorRegistry final {
public:
    /**
     * @brief Process-wide registry with the built-in operators registered.
     */
    [[nodiscard]] static OperatorRegistry &instance();

    /**
     * @brief Registers (or replaces) the factory for @p name.
     */
    void registerFactory(std::string name, OperatorFactory factory);

    /**
     * @brief Builds the operator described by @p config.
     *
     * @param config An object whose "name" selects the factory; the other
     *               members are the operator's parameters
     * @return The operator, or kInvalidConfiguration for unknown names and
     *         malformed parameters
     */
    [[nodiscard]] core::Expected<std::unique_ptr<IOperator>> create(const Json::Value &config) const;

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    OperatorRegistry();

    mutable std::mutex _mutex;
    std::map<std::string, OperatorFactory, std::less<>> _factories;
};

} // namespace biosig::dsp
