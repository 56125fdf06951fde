#include "pivot/strategy/navigator.hpp"

namespace pivot::strategy {

Result<Navigator>
Navigator::create(std::unique_ptr<RouteStrategy> initial, obs::Sink* sink) {
    if (!initial) {
        return pivot_detail::make_unexpected(Err::InvalidArgument);
    }
    return Navigator(std::move(initial), sink);
}

Err Navigator::set_strategy(std::unique_ptr<RouteStrategy> next) {
    if (!next) return Err::InvalidArgument;

    // Labels are captured before the swap; the old strategy dies with it.
    obs::StrategySwitchEvent ev;
    if (sink_) ev = {std::string(strategy_->kind()), std::string(next->kind())};

    strategy_ = std::move(next);
    ++switches_;
    if (sink_) sink_->record(ev);
    return Err::Ok;
}

std::string Navigator::get_directions(const std::string& origin,
                                      const std::string& destination) const {
    return strategy_->compute_route(origin, destination);
}

} // namespace pivot::strategy
