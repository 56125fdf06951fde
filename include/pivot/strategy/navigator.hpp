#pragma once
/**
 * @file navigator.hpp
 * @brief Strategy context: owns one active RouteStrategy, swappable at runtime.
 *
 * Invariants:
 *  - Exactly one strategy is active; never null once create() succeeded.
 *  - set_strategy() either installs the new strategy or leaves the old one in place.
 *  - Move construction exists only to hand the result of create() out; a moved-from
 *    Navigator owns no strategy and may only be destroyed. There is no assignment,
 *    so a live Navigator can never be overwritten into that state.
 *
 * Thread-safety: none. Guard a shared Navigator with one external mutex.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "pivot/error.hpp"
#include "pivot/obs/observability.hpp"
#include "pivot/strategy/route_strategy.hpp"

namespace pivot::strategy {

class Navigator final {
public:
    /**
     * @brief Factory: validates the initial strategy.
     * @param initial Strategy to own; must not be null.
     * @param sink Optional diagnostics sink (not owned, may be nullptr).
     * @return Navigator, or Err::InvalidArgument when @p initial is null.
     */
    static Result<Navigator>
    create(std::unique_ptr<RouteStrategy> initial, obs::Sink* sink = nullptr);

    Navigator(const Navigator&)            = delete;
    Navigator& operator=(const Navigator&) = delete;
    Navigator(Navigator&&) noexcept            = default;
    Navigator& operator=(Navigator&&)          = delete;

    /**
     * @brief Replace the active strategy.
     * @return Err::Ok, or Err::InvalidArgument when @p next is null (nothing changes).
     */
    [[nodiscard]] Err set_strategy(std::unique_ptr<RouteStrategy> next);

    /// Delegate to the active strategy; its result and exceptions pass through unchanged.
    std::string get_directions(const std::string& origin, const std::string& destination) const;

    /// Kind label of the active strategy.
    [[nodiscard]] std::string_view strategy_kind() const noexcept { return strategy_->kind(); }

    /// Number of successful set_strategy() calls.
    [[nodiscard]] uint64_t switches() const noexcept { return switches_; }

    /// Set or clear (nullptr) the diagnostics sink.
    void attach_sink(obs::Sink* sink) noexcept { sink_ = sink; }

private:
    Navigator(std::unique_ptr<RouteStrategy> initial, obs::Sink* sink) noexcept
    : strategy_(std::move(initial)), sink_(sink) {}

    std::unique_ptr<RouteStrategy> strategy_; ///< Active strategy (never null)
    obs::Sink*                     sink_{nullptr};
    uint64_t                       switches_{0};
};

} // namespace pivot::strategy
