#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for strategies, displays and the weather subject.
 * @details Keeps literal route text and labels out of the component code. The
 *          config Loader assembles these into DemoConfig.
 */

#include <cstdint>

namespace pivot::config::constants {

// =====================
// Route strategies
// =====================
inline constexpr const char* ROAD_DEFAULT_HIGHWAY = "I-95";             ///< Highway named in road directions
inline constexpr uint32_t    ROAD_DEFAULT_MINUTES = 30;                 ///< Drive time
inline constexpr const char* WALK_DEFAULT_VIA     = "through the park"; ///< Walking path description
inline constexpr uint32_t    WALK_DEFAULT_HOURS   = 2;                  ///< Walk time

// =====================
// Demo endpoints
// =====================
inline constexpr const char* DEMO_ORIGIN      = "Home";
inline constexpr const char* DEMO_DESTINATION = "Office";

// =====================
// Weather subject + displays
// =====================
inline constexpr int         WEATHER_INITIAL_TEMP   = 0;               ///< Value before the first update
inline constexpr int         WEATHER_DEMO_TEMP      = 50;              ///< Value published by weather_demo
inline constexpr const char* WEATHER_UNIT_LABEL     = "temperature";   ///< Unit text in display lines
inline constexpr const char* PHONE_DISPLAY_LABEL    = "Phone display";
inline constexpr const char* WINDOW_DISPLAY_LABEL   = "Window display";

} // namespace pivot::config::constants
