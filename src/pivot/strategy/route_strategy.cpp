/**
* @file route_strategy.cpp
 * @brief Road/walk route builders and the mode factory.
 */
#include "pivot/strategy/route_strategy.hpp"

namespace pivot::strategy {

    std::string_view to_string(RouteMode m) noexcept {
        switch (m) {
            case RouteMode::Road: return "road";
            case RouteMode::Walk: return "walk";
        }
        return "unknown";
    }

    std::string RoadStrategy::compute_route(const std::string& origin,
                                            const std::string& destination) const {
        return "Road Route from " + origin + " to " + destination +
               " : Drive " + cfg_.highway + ", takes " + std::to_string(cfg_.minutes) + " mins";
    }

    std::string WalkStrategy::compute_route(const std::string& origin,
                                            const std::string& destination) const {
        return "Walking from " + origin + " to " + destination +
               ": Walk " + cfg_.via + ", takes " + std::to_string(cfg_.hours) + " hours";
    }

    std::unique_ptr<RouteStrategy> make_route_strategy(RouteMode mode,
                                                       const RouteStrategyConfig& cfg) {
        switch (mode) {
            case RouteMode::Road: return std::make_unique<RoadStrategy>(cfg.road);
            case RouteMode::Walk: return std::make_unique<WalkStrategy>(cfg.walk);
        }
        return std::make_unique<RoadStrategy>(cfg.road);
    }

} // namespace pivot::strategy
