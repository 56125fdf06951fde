/**
* @file weather.cpp
 * @brief Display observers for WeatherStation.
 */
#include "pivot/observer/weather.hpp"

namespace pivot::observer {

    void TemperatureDisplay::on_value_changed(const int& value) {
        last_value_ = value;
        ++updates_;
        if (sink_) {
            sink_->record(obs::NotificationEvent{label_, std::to_string(value),
                                                 pivot::config::constants::WEATHER_UNIT_LABEL});
        }
    }

} // namespace pivot::observer
