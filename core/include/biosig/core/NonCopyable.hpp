/**
 * @file NonCopyable.hpp
 * @brief CRTP base class that deletes copy operations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BIOSIG_CORE_NON_COPYABLE_HPP
    #define BIOSIG_CORE_NON_COPYABLE_HPP

namespace biosig::core {

/**
 * @brief Inherit (privately) to disable copy construction and assignment.
 *
 * Move operations are deleted as well: types deriving from this own a
 * mutex or a worker thread whose address must stay stable.
 *
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = delete;
    NonCopyable &operator=(NonCopyable &&)       = delete;
};

} // namespace biosig::core

#endif // BIOSIG_CORE_NON_COPYABLE_HPP
