#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade returning named defaults for the demo wiring.
 * @details All defaults reference constants.hpp to avoid magic literals.
 */

#include <string>
#include "pivot/strategy/route_strategy.hpp"

namespace pivot::config {

    /** @struct WeatherConfig
     *  @brief Weather subject settings.
     */
    struct WeatherConfig {
        int initial_temp{constants::WEATHER_INITIAL_TEMP}; ///< Value before the first update
        int demo_temp{constants::WEATHER_DEMO_TEMP};       ///< Value published by weather_demo
    };

    /** @struct NavigationConfig
     *  @brief Navigator demo settings.
     */
    struct NavigationConfig {
        pivot::strategy::RouteMode           initial_mode{pivot::strategy::RouteMode::Road}; ///< First strategy
        pivot::strategy::RouteMode           switch_to{pivot::strategy::RouteMode::Walk};    ///< Replacement strategy
        pivot::strategy::RouteStrategyConfig routes;                                         ///< Per-mode settings
        std::string origin{constants::DEMO_ORIGIN};           ///< Start location
        std::string destination{constants::DEMO_DESTINATION}; ///< End location
    };

    /** @struct DemoConfig
     *  @brief Aggregate of sub-configs used by the demo applications.
     */
    struct DemoConfig {
        NavigationConfig navigation; ///< Strategy demo
        WeatherConfig    weather;    ///< Observer demo
    };

    /** @class Loader
     *  @brief Source of demo configuration.
     */
    class Loader {
    public:
        /// @return DemoConfig populated from constants.hpp.
        static DemoConfig defaults();
    };

} // namespace pivot::config
