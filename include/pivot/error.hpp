#pragma once
/**
 * @file error.hpp
 * @brief Result codes shared by the strategy and observer components.
 * @details Mutations return Err; factories return pivot_detail::expected<T, Err>.
 *          Nothing here throws. Failures raised by user strategies/observers are
 *          not translated into Err; they propagate to the caller as-is.
 */

#include <cstdint>
#include <string_view>
#include "pivot/compat/expected.hpp"

namespace pivot {

/// Result codes for context/registry mutations.
enum class Err : std::uint8_t {
    Ok = 0,          ///< Operation succeeded.
    InvalidArgument, ///< Required collaborator (strategy/observer) was null.
    NotFound         ///< Detach target was never attached.
};

/// Value-or-Err returned by validating factories.
template <class T>
using Result = pivot_detail::expected<T, Err>;

/// Stable label for logs and test messages.
constexpr std::string_view to_string(Err e) noexcept {
    switch (e) {
        case Err::Ok:              return "ok";
        case Err::InvalidArgument: return "invalid_argument";
        case Err::NotFound:        return "not_found";
    }
    return "unknown";
}

} // namespace pivot
