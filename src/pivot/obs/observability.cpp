/**
* @file observability.cpp
 * @brief printf-backed Sink that writes one human-readable line per event.
 */
#include "pivot/obs/observability.hpp"
#include <mutex>
#include <cstdio>

namespace pivot::obs {

    class ConsoleSink : public Sink {
    public:
        void record(const StrategySwitchEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.strategy_switches++;
            std::printf("----Switching strategy from %s to %s------\n",
                        e.from_kind.c_str(), e.to_kind.c_str());
            std::fflush(stdout);
        }
        void record(const NotificationEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.notifications++;
            std::printf("%s updated to %s %s\n",
                        e.observer.c_str(), e.value.c_str(), e.unit.c_str());
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Sink* make_console_sink() {
        static ConsoleSink sink; // process-wide singleton
        return &sink;
    }

} // namespace pivot::obs
