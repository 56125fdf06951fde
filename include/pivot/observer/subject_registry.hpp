#pragma once
// pivot: SubjectRegistry
// Ordered audience of Observer<T> plus the value they watch.
//   • Observer list is copy-on-write: attach/detach build a new list and swap the
//     shared_ptr; a broadcast holds the list it started with.
//   • Attach/detach issued from inside a broadcast apply from the next broadcast.
//   • set_value/notify issued from inside a broadcast supersede it: the nested pass
//     delivers the newer value to everyone, then the outer pass stops.
//   • Duplicates are allowed; each attachment is delivered once per broadcast.
// Thread-safety: none. Hosts sharing a registry across threads guard it with one mutex.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "pivot/error.hpp"
#include "pivot/observer/observer.hpp"

namespace pivot::observer {

///
/// Subject holding a value of type T and broadcasting it to attached observers.
/// - set_value(): store, then deliver in attachment order.
/// - notify():    deliver the current value again (e.g. initial state).
/// - detach() of an observer that is not attached returns Err::NotFound.
/// - Exceptions thrown by an observer propagate; later observers are skipped.
///
template <class T>
class SubjectRegistry {
public:
    using value_type  = T;
    using ObserverPtr = std::shared_ptr<Observer<T>>;
    using List        = std::vector<ObserverPtr>;

    SubjectRegistry() = default;
    explicit SubjectRegistry(T initial) : value_(std::move(initial)) {}

    // --------------------------- Membership ----------------------------------
    /// Append an observer. Null yields Err::InvalidArgument.
    [[nodiscard]] Err attach(ObserverPtr obs);

    /// Remove the first entry pointing at @p obs. Never attached yields Err::NotFound.
    [[nodiscard]] Err detach(const ObserverPtr& obs);

    /// Drop every observer. Treated as maintenance; counts no attach/detach.
    void clear();

    // --------------------------- Value + broadcast ---------------------------
    /// Store @p v, then deliver it to every attached observer in order.
    void set_value(T v);

    /// Deliver the current value without changing it.
    void notify();

    [[nodiscard]] const T& value() const noexcept { return value_; }

    // --------------------------- Read utilities ------------------------------
    /// Current observer list (immutable; replaced on every membership change).
    [[nodiscard]] std::shared_ptr<const List> snapshot() const noexcept { return list_; }
    [[nodiscard]] std::size_t size() const noexcept { return list_->size(); }
    [[nodiscard]] bool empty() const noexcept { return list_->empty(); }

    /// Monotonic version counter. Increments on every successful membership change.
    [[nodiscard]] uint64_t version() const noexcept { return version_; }

    // --------------------------- Observability -------------------------------
    /// Cumulative counters since construction.
    struct Stats {
        uint64_t attaches{0}, detaches{0}, broadcasts{0}, deliveries{0}, failures{0};
    };
    [[nodiscard]] Stats stats() const noexcept { return stats_; }

private:
    void broadcast();
    void publish(List next);

    std::shared_ptr<const List> list_{std::make_shared<List>()};
    T        value_{};
    uint64_t version_{0};
    uint64_t generation_{0}; ///< Bumped at the start of every broadcast
    Stats    stats_{};
};

//------------------------------- Membership ------------------------------------

template <class T>
void SubjectRegistry<T>::publish(List next) {
    list_ = std::make_shared<List>(std::move(next));
    ++version_;
}

template <class T>
Err SubjectRegistry<T>::attach(ObserverPtr obs) {
    if (!obs) { ++stats_.failures; return Err::InvalidArgument; }

    List next(*list_); // copy-on-write
    next.push_back(std::move(obs));
    publish(std::move(next));
    ++stats_.attaches;
    return Err::Ok;
}

template <class T>
Err SubjectRegistry<T>::detach(const ObserverPtr& obs) {
    if (!obs) { ++stats_.failures; return Err::InvalidArgument; }

    auto it = std::find(list_->begin(), list_->end(), obs);
    if (it == list_->end()) { ++stats_.failures; return Err::NotFound; }

    List next(*list_);
    next.erase(next.begin() + (it - list_->begin()));
    publish(std::move(next));
    ++stats_.detaches;
    return Err::Ok;
}

template <class T>
void SubjectRegistry<T>::clear() {
    list_ = std::make_shared<List>();
    ++version_;
}

//------------------------------- Broadcast -------------------------------------

template <class T>
void SubjectRegistry<T>::set_value(T v) {
    value_ = std::move(v);
    broadcast();
}

template <class T>
void SubjectRegistry<T>::notify() {
    broadcast();
}

template <class T>
void SubjectRegistry<T>::broadcast() {
    // Pin the list: attach/detach from an observer apply to the next pass.
    // A nested set_value/notify bumps generation_ and delivers the newer value
    // to its own snapshot; this pass then stops so nobody ends on a stale value.
    const auto     snap    = list_;
    const T        current = value_;
    const uint64_t gen     = ++generation_;
    ++stats_.broadcasts;
    for (const auto& obs : *snap) {
        obs->on_value_changed(current);
        ++stats_.deliveries;
        if (generation_ != gen) break;
    }
}

} // namespace pivot::observer
