#pragma once
/**
 * @file weather.hpp
 * @brief Temperature subject and the two stock display observers.
 * @details Displays remember the last delivered value and report each update
 *          to an optional obs::Sink as a NotificationEvent.
 */

#include <cstdint>
#include <string>
#include "pivot/config/constants.hpp"
#include "pivot/obs/observability.hpp"
#include "pivot/observer/observer.hpp"
#include "pivot/observer/subject_registry.hpp"

namespace pivot::observer {

/// Subject publishing integer temperatures.
using WeatherStation = SubjectRegistry<int>;

/**
 * @class TemperatureDisplay
 * @brief Common body of the stock displays: label, last value, update count.
 */
class TemperatureDisplay : public Observer<int> {
public:
    void on_value_changed(const int& value) override;

    const std::string& label() const noexcept { return label_; }
    /// Last delivered value, or the station's initial value before any update.
    int last_value() const noexcept { return last_value_; }
    /// Number of deliveries received.
    uint64_t updates() const noexcept { return updates_; }

    /// Set or clear (nullptr) the diagnostics sink.
    void attach_sink(obs::Sink* sink) noexcept { sink_ = sink; }

protected:
    TemperatureDisplay(std::string label, obs::Sink* sink) noexcept
    : label_(std::move(label)), sink_(sink) {}

private:
    std::string label_;
    obs::Sink*  sink_{nullptr};
    int         last_value_{pivot::config::constants::WEATHER_INITIAL_TEMP};
    uint64_t    updates_{0};
};

class PhoneDisplay final : public TemperatureDisplay {
public:
    explicit PhoneDisplay(obs::Sink* sink = nullptr)
    : TemperatureDisplay(pivot::config::constants::PHONE_DISPLAY_LABEL, sink) {}
};

class WindowDisplay final : public TemperatureDisplay {
public:
    explicit WindowDisplay(obs::Sink* sink = nullptr)
    : TemperatureDisplay(pivot::config::constants::WINDOW_DISPLAY_LABEL, sink) {}
};

} // namespace pivot::observer
