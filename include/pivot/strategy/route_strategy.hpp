#pragma once
/**
 * @file route_strategy.hpp
 * @brief Pluggable route-building algorithm consumed by Navigator.
 * @details Road and walk variants ship here; callers may add their own by
 *          deriving from RouteStrategy.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include "pivot/config/constants.hpp"

namespace pivot::strategy {

    /**
     * @enum RouteMode
     * @brief Built-in strategy variants known to the factory.
     */
    enum class RouteMode : uint8_t {
        Road, ///< Drive along a highway
        Walk  ///< Walk along a named path
    };

    /// Stable label for a RouteMode.
    std::string_view to_string(RouteMode m) noexcept;

    class RouteStrategy {
    public:
        virtual ~RouteStrategy() = default;

        /**
         * @brief Build human-readable directions between two places.
         * @param origin Start location.
         * @param destination End location.
         */
        virtual std::string compute_route(const std::string& origin,
                                          const std::string& destination) const = 0;

        /// Type label reported in switch diagnostics (e.g. "RoadStrategy").
        virtual std::string_view kind() const noexcept = 0;
    };

    /** @struct RoadConfig
     *  @brief Fixed configuration held by RoadStrategy.
     */
    struct RoadConfig {
        std::string highway{pivot::config::constants::ROAD_DEFAULT_HIGHWAY}; ///< Highway to drive
        uint32_t    minutes{pivot::config::constants::ROAD_DEFAULT_MINUTES}; ///< Advertised drive time
    };

    /** @struct WalkConfig
     *  @brief Fixed configuration held by WalkStrategy.
     */
    struct WalkConfig {
        std::string via{pivot::config::constants::WALK_DEFAULT_VIA};     ///< Path description
        uint32_t    hours{pivot::config::constants::WALK_DEFAULT_HOURS}; ///< Advertised walk time
    };

    /** @struct RouteStrategyConfig
     *  @brief Per-mode configuration used by make_route_strategy().
     */
    struct RouteStrategyConfig {
        RoadConfig road; ///< Applied to RouteMode::Road
        WalkConfig walk; ///< Applied to RouteMode::Walk
    };

    class RoadStrategy final : public RouteStrategy {
    public:
        explicit RoadStrategy(RoadConfig cfg = {}) : cfg_(std::move(cfg)) {}

        std::string compute_route(const std::string& origin,
                                  const std::string& destination) const override;
        std::string_view kind() const noexcept override { return "RoadStrategy"; }

        const RoadConfig& config() const noexcept { return cfg_; }

    private:
        RoadConfig cfg_;
    };

    class WalkStrategy final : public RouteStrategy {
    public:
        explicit WalkStrategy(WalkConfig cfg = {}) : cfg_(std::move(cfg)) {}

        std::string compute_route(const std::string& origin,
                                  const std::string& destination) const override;
        std::string_view kind() const noexcept override { return "WalkStrategy"; }

        const WalkConfig& config() const noexcept { return cfg_; }

    private:
        WalkConfig cfg_;
    };

    /**
     * @brief Build a built-in strategy for the given mode.
     * @param mode Variant to construct.
     * @param cfg Per-mode configuration; only the entry for @p mode is used.
     * @return Owning pointer, never null.
     */
    std::unique_ptr<RouteStrategy> make_route_strategy(RouteMode mode,
                                                       const RouteStrategyConfig& cfg = {});

} // namespace pivot::strategy
