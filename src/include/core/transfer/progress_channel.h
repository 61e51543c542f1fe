#pragma once

#include <core/model/transfer_status.h>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>

namespace peerdrop::core {

/**
 * @brief Last-value cached broadcast of the current transfer status.
 *
 * Every publication replaces the cached value. A new subscriber is called at once
 * with the cached value (std::nullopt before the first publication and after a
 * reset), then with every later value in publish order. Values published from
 * inside an observer are queued and delivered after the current round, so every
 * subscriber sees the same order. A subscriber added while values are still queued
 * only receives the ones published after it subscribed.
 */
class ProgressChannel {
    struct State;

public:
    using Value = std::optional<TransferStatus>;
    using Observer = std::function<void(const Value&)>;

    // Scoped handle, the observer is never called after Cancel() or destruction
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription();
        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void Cancel();
        bool active() const;

    private:
        friend class ProgressChannel;
        Subscription(std::weak_ptr<State> state, std::uint64_t id);

        std::weak_ptr<State> state_;
        std::uint64_t id_{0};
    };

    ProgressChannel();
    ~ProgressChannel() = default;
    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    [[nodiscard]] Subscription Subscribe(Observer observer);

    void Publish(TransferStatus status);

    // Publishes the empty value
    void Reset();

    const Value& current() const;
    std::size_t subscriber_count() const;

private:
    struct Entry {
        std::shared_ptr<Observer> observer;
        std::uint64_t since; // First publication sequence this observer gets
    };

    struct Pending {
        std::uint64_t sequence;
        Value value;
    };

    struct State {
        Value current;
        std::map<std::uint64_t, Entry> observers;
        std::uint64_t next_id{1};
        std::uint64_t published{0};
        std::deque<Pending> pending;
        bool dispatching{false};
    };

    void publish(Value value);
    static void dispatch(const std::shared_ptr<State>& state);
    static void notify(const std::shared_ptr<Observer>& observer, const Value& value);

    std::shared_ptr<State> state_;
};

} // namespace peerdrop::core
