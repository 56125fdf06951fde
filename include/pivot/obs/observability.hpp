#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: strategy-switch and notification events + counters.
 * @details Components hold a nullable Sink*; nullptr means no diagnostics.
 */

#include <string>
#include <cstdint>

namespace pivot::obs {

    /** @struct Counters
     *  @brief Process-level counters for recorded events.
     */
    struct Counters {
        uint64_t strategy_switches{0}; ///< StrategySwitchEvent count
        uint64_t notifications{0};     ///< NotificationEvent count
    };

    /** @struct StrategySwitchEvent
     *  @brief Navigator replaced its active strategy.
     */
    struct StrategySwitchEvent {
        std::string from_kind; ///< Kind label of the replaced strategy
        std::string to_kind;   ///< Kind label of the new strategy
    };

    /** @struct NotificationEvent
     *  @brief A display observer received a value.
     */
    struct NotificationEvent {
        std::string observer; ///< Display label, e.g. "Phone display"
        std::string value;    ///< Delivered value, already formatted
        std::string unit;     ///< Unit text, e.g. "temperature"
    };

    /** @class Sink
     *  @brief Observability sink interface.
     */
    class Sink {
    public:
        virtual ~Sink() = default;
        /// Record a strategy replacement.
        virtual void record(const StrategySwitchEvent& e) = 0;
        /// Record a single observer notification.
        virtual void record(const NotificationEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide stdout sink (implemented in .cpp).
    Sink* make_console_sink();

} // namespace pivot::obs
