// apps/weather_demo/src/main.cpp
// pivot: weather_demo
// Purpose: drive the subject registry end to end.
//   - Attach PhoneDisplay then WindowDisplay to a WeatherStation.
//   - Publish the configured temperature; each display reports through the console sink.

#include <iostream>
#include <memory>

#include "pivot/config/config_loader.hpp"
#include "pivot/obs/observability.hpp"
#include "pivot/version.hpp"
#include "pivot/observer/weather.hpp"

using pivot::Err;
using pivot::observer::PhoneDisplay;
using pivot::observer::WeatherStation;
using pivot::observer::WindowDisplay;

int main() {
    std::cout << "pivot weather_demo v" << pivot::version_string << std::endl;

    const auto cfg = pivot::config::Loader::defaults().weather;
    auto* sink = pivot::obs::make_console_sink();

    WeatherStation station{cfg.initial_temp};
    auto phone  = std::make_shared<PhoneDisplay>(sink);
    auto window = std::make_shared<WindowDisplay>(sink);

    for (const auto& d : {WeatherStation::ObserverPtr(phone), WeatherStation::ObserverPtr(window)}) {
        if (const auto rc = station.attach(d); rc != Err::Ok) {
            std::cerr << "weather_demo: attach failed: " << pivot::to_string(rc) << std::endl;
            return 1;
        }
    }

    station.set_value(cfg.demo_temp);

    const auto st = station.stats();
    std::cout << "broadcasts=" << st.broadcasts << " deliveries=" << st.deliveries << std::endl;
    return 0;
}
