// apps/navigator_demo/src/main.cpp
// pivot: navigator_demo
// Purpose: drive the strategy context end to end.
//   1) Build a Navigator with the configured initial strategy (road).
//   2) Print directions Home -> Office.
//   3) Swap in the replacement strategy (walk); the console sink logs the switch.
//   4) Print directions again.

#include <iostream>

#include "pivot/config/config_loader.hpp"
#include "pivot/obs/observability.hpp"
#include "pivot/version.hpp"
#include "pivot/strategy/navigator.hpp"
#include "pivot/strategy/route_strategy.hpp"

using pivot::Err;
using pivot::strategy::Navigator;
using pivot::strategy::make_route_strategy;

int main() {
    std::cout << "pivot navigator_demo v" << pivot::version_string << std::endl;

    const auto cfg = pivot::config::Loader::defaults().navigation;
    auto* sink = pivot::obs::make_console_sink();

    auto nav = Navigator::create(make_route_strategy(cfg.initial_mode, cfg.routes), sink);
    if (!nav) {
        std::cerr << "navigator_demo: create failed: " << pivot::to_string(nav.error()) << std::endl;
        return 1;
    }

    std::cout << nav->get_directions(cfg.origin, cfg.destination) << std::endl;

    if (const auto rc = nav->set_strategy(make_route_strategy(cfg.switch_to, cfg.routes)); rc != Err::Ok) {
        std::cerr << "navigator_demo: switch failed: " << pivot::to_string(rc) << std::endl;
        return 1;
    }

    std::cout << nav->get_directions(cfg.origin, cfg.destination) << std::endl;
    return 0;
}
