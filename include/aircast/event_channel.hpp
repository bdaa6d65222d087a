// event_channel.hpp
// Reverse HTTP event listener.
//
// A second connection to the device is upgraded with "POST /reverse"
// (Upgrade: PTTH/1.0). From then on the roles are swapped: the device sends
// "POST /event" requests carrying plist bodies and we answer each with a bare
// 200 OK. The listener runs on its own thread and hands video events to the
// caller through a FIFO queue; any failure on that thread is queued too and
// rethrown from next().
#pragma once

#include "aircast/channel_queue.hpp"
#include "aircast/device.hpp"
#include "aircast/exit_registry.hpp"
#include "aircast/plist_codec.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <iterator>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <variant>

namespace aircast {

using Event = PlistDict;

// Validate one pushed request (path /event, plist content-type, non-empty
// body) and decode its body. Throws ProtocolError or ParseError.
Event decode_event(std::string_view raw_request);

class EventChannel {
public:
    enum class State { disconnected, upgraded, listening, closed };

    EventChannel(Device device, std::chrono::milliseconds connect_timeout,
                 std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
    ~EventChannel();

    EventChannel(const EventChannel &) = delete;
    EventChannel &operator=(const EventChannel &) = delete;

    // Start the listener thread. Called lazily by next(); idempotent.
    void start();

    // Next video event. Blocking waits for one; non-blocking returns nullopt
    // when nothing is queued. After stop() only already-queued events are
    // returned. A failure from the listener is rethrown here, and again on
    // every later call.
    std::optional<Event> next(bool block);

    // Ask the listener to exit and wait for it. Observed within one poll interval.
    void stop();

    State state() const { return state_; }

private:
    // monostate marks the end of the stream after stop().
    using Delivery = std::variant<std::monostate, Event, std::exception_ptr>;

    void monitor();

    const Device device_;
    const std::chrono::milliseconds connect_timeout_;
    const std::chrono::milliseconds poll_interval_;

    ChannelQueue<Delivery> events_;
    ChannelQueue<bool> control_;

    std::mutex lifecycle_lock_;
    std::thread worker_;
    bool started_ = false;
    bool stopped_ = false;
    std::optional<ExitHookId> exit_hook_;

    std::exception_ptr failure_;
    std::atomic<State> state_{State::disconnected};
};

// Input range over an EventChannel, for use in range-for:
//
//   for (const Event &ev : client.events(false)) { ... }
//
// Blocking streams end only if the channel is stopped; non-blocking streams
// end once the queue is drained.
class EventStream {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Event;
        using difference_type = std::ptrdiff_t;
        using pointer = const Event *;
        using reference = const Event &;

        iterator() = default;
        iterator(EventChannel *channel, bool block) : channel_(channel), block_(block) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator &operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator &other) const { return channel_ == other.channel_; }
        bool operator!=(const iterator &other) const { return !(*this == other); }

    private:
        void advance() {
            current_ = channel_->next(block_);
            if (!current_) channel_ = nullptr;
        }

        EventChannel *channel_ = nullptr;
        bool block_ = true;
        std::optional<Event> current_;
    };

    EventStream(EventChannel &channel, bool block) : channel_(&channel), block_(block) {}

    iterator begin() { return iterator(channel_, block_); }
    iterator end() { return iterator(); }

private:
    EventChannel *channel_;
    bool block_;
};

} // namespace aircast
