/**
* @file config_loader.cpp
 * @brief Loader that assembles named defaults.
 */
#include "pivot/config/config_loader.hpp"
#include "pivot/config/constants.hpp"

namespace pivot::config {
    using namespace pivot::strategy;
    using namespace pivot::config::constants;

    static RouteStrategyConfig default_routes() {
        RouteStrategyConfig cfg;
        cfg.road = { .highway = ROAD_DEFAULT_HIGHWAY, .minutes = ROAD_DEFAULT_MINUTES };
        cfg.walk = { .via = WALK_DEFAULT_VIA, .hours = WALK_DEFAULT_HOURS };
        return cfg;
    }

    DemoConfig Loader::defaults() {
        DemoConfig dc;
        dc.navigation.routes = default_routes();
        dc.weather = WeatherConfig{}; // picks defaults from constants
        return dc;
    }

} // namespace pivot::config
