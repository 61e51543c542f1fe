#include <core/transfer/progress_channel.h>
#include <exception>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace peerdrop::core {

ProgressChannel::Subscription::Subscription(std::weak_ptr<State> state, std::uint64_t id)
    : state_(std::move(state))
    , id_(id) {}

ProgressChannel::Subscription::~Subscription() {
    Cancel();
}

ProgressChannel::Subscription::Subscription(Subscription&& other) noexcept
    : state_(std::move(other.state_))
    , id_(std::exchange(other.id_, 0)) {}

ProgressChannel::Subscription& ProgressChannel::Subscription::operator=(
    Subscription&& other) noexcept {
    if (this != &other) {
        Cancel();
        state_ = std::move(other.state_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void ProgressChannel::Subscription::Cancel() {
    if (auto state = state_.lock(); state && id_ != 0) {
        state->observers.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

bool ProgressChannel::Subscription::active() const {
    auto state = state_.lock();
    return state && state->observers.contains(id_);
}

ProgressChannel::ProgressChannel()
    : state_(std::make_shared<State>()) {}

ProgressChannel::Subscription ProgressChannel::Subscribe(Observer observer) {
    auto id = state_->next_id++;
    auto shared_observer = std::make_shared<Observer>(std::move(observer));
    state_->observers.emplace(id, Entry{shared_observer, state_->published + 1});

    Subscription subscription(state_, id);
    // Replay the cached value to the new subscriber only
    Value current = state_->current;
    notify(shared_observer, current);
    return subscription;
}

void ProgressChannel::Publish(TransferStatus status) {
    publish(std::move(status));
}

void ProgressChannel::Reset() {
    publish(std::nullopt);
}

const ProgressChannel::Value& ProgressChannel::current() const {
    return state_->current;
}

std::size_t ProgressChannel::subscriber_count() const {
    return state_->observers.size();
}

void ProgressChannel::publish(Value value) {
    // Keep the state alive even if an observer destroys this channel
    auto state = state_;
    state->current = value;
    state->pending.push_back(Pending{++state->published, std::move(value)});
    if (state->dispatching) {
        return;
    }
    dispatch(state);
}

void ProgressChannel::dispatch(const std::shared_ptr<State>& state) {
    // Cleared on every exit, an observer may throw something notify() does not catch
    struct DispatchGuard {
        State& state;
        explicit DispatchGuard(State& s)
            : state(s) {
            state.dispatching = true;
        }
        ~DispatchGuard() { state.dispatching = false; }
    } guard(*state);

    while (!state->pending.empty()) {
        Pending pending = std::move(state->pending.front());
        state->pending.pop_front();

        std::vector<std::uint64_t> ids;
        ids.reserve(state->observers.size());
        for (const auto& [id, _] : state->observers) {
            ids.push_back(id);
        }
        for (auto id : ids) {
            auto it = state->observers.find(id);
            if (it == state->observers.end()) {
                continue; // Unsubscribed during this round
            }
            if (pending.sequence < it->second.since) {
                continue; // Already replayed a newer value on subscribe
            }
            auto observer = it->second.observer;
            notify(observer, pending.value);
        }
    }
}

void ProgressChannel::notify(const std::shared_ptr<Observer>& observer, const Value& value) {
    try {
        (*observer)(value);
    } catch (const std::exception& e) {
        spdlog::error("Progress observer threw: {}", e.what());
    }
}

} // namespace peerdrop::core
