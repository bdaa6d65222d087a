#include "aircast/event_channel.hpp"
#include "aircast/errors.hpp"
#include "aircast/log.hpp"
#include "aircast/socket_io.hpp"
#include "aircast/wire_codec.hpp"

#include <array>

namespace aircast {

namespace beast = boost::beast;
namespace http = wire::http;

Event decode_event(std::string_view raw_request) {
    wire::Request req = wire::parse_request(raw_request);

    if (req.target() != "/event") {
        throw ProtocolError("Unexpected path when parsing event: " + std::string(req.target()));
    }

    std::string type = wire::content_type(req);
    if (type != wire::plist_content_type) {
        throw ProtocolError("Unexpected Content-Type when parsing event: " +
                            (type.empty() ? std::string("(none)") : type));
    }

    if (wire::content_length(req) == 0) {
        throw ProtocolError("Received an event with a zero length body");
    }

    return parse_plist(req.body());
}

EventChannel::EventChannel(Device device, std::chrono::milliseconds connect_timeout,
                           std::chrono::milliseconds poll_interval)
    : device_(std::move(device)), connect_timeout_(connect_timeout), poll_interval_(poll_interval) {}

EventChannel::~EventChannel() {
    stop();
}

void EventChannel::start() {
    std::lock_guard<std::mutex> lk(lifecycle_lock_);
    if (started_ || stopped_) return;
    started_ = true;
    worker_ = std::thread([this] { monitor(); });
    exit_hook_ = register_exit_hook([this] { stop(); });
}

std::optional<Event> EventChannel::next(bool block) {
    if (failure_) std::rethrow_exception(failure_);
    start();

    std::optional<Delivery> item;
    bool stopped;
    {
        std::lock_guard<std::mutex> lk(lifecycle_lock_);
        stopped = stopped_;
    }
    if (block && !stopped) {
        item = events_.pop();
    } else {
        item = events_.try_pop();
    }
    if (!item || std::holds_alternative<std::monostate>(*item)) return std::nullopt;

    if (auto error = std::get_if<std::exception_ptr>(&*item)) {
        failure_ = *error;
        std::rethrow_exception(failure_);
    }
    return std::get<Event>(std::move(*item));
}

void EventChannel::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_lock_);
    stopped_ = true;
    if (worker_.joinable()) {
        control_.push(true);
        worker_.join();
        events_.push(std::monostate());
    }
    if (exit_hook_) {
        unregister_exit_hook(*exit_hook_);
        exit_hook_.reset();
    }
}

void EventChannel::monitor() {
    // stop() queues on control_ before joining; the handshake gives up as soon as it does.
    const Interrupt stop_requested = [this] { return control_.size() > 0; };
    try {
        net::io_context ioc;
        tcp::socket socket =
            connect_socket(ioc, device_.host(), device_.port(), connect_timeout_, stop_requested);

        const std::string upgrade = wire::serialize_upgrade_request();
        write_all(socket, upgrade);

        std::array<char, wire::recv_size> buffer;
        beast::error_code ec;
        std::size_t n = read_some_for(ioc, socket, net::buffer(buffer), connect_timeout_, ec, stop_requested);
        if (ec == net::error::operation_aborted && stop_requested()) {
            socket.close(ec);
            state_ = State::closed;
            log::debug("Event", "Listener stopped before the upgrade completed");
            return;
        }
        if (ec) {
            throw ConnectionError("No reply to the reverse HTTP upgrade from " + device_.address() +
                                  ": " + ec.message());
        }

        std::string_view raw(buffer.data(), n);
        wire::Response res = wire::parse_response(raw);
        if (res.result() != http::status::switching_protocols) {
            throw ProtocolError("Unexpected response when setting up the event listener.\n"
                                "Expected: HTTP/1.1 101 Switching Protocols\n"
                                "Received:\n" + std::string(raw));
        }
        state_ = State::upgraded;
        log::debug("Event", "Reverse HTTP channel open to " + device_.address());

        state_ = State::listening;
        for (;;) {
            if (control_.try_pop()) {
                socket.close(ec);
                state_ = State::closed;
                log::debug("Event", "Listener stopped");
                return;
            }

            n = read_some_for(ioc, socket, net::buffer(buffer), poll_interval_, ec);
            if (ec == net::error::timed_out) continue;
            if (ec) throw ConnectionError("Event connection to " + device_.address() + " lost: " + ec.message());

            raw = std::string_view(buffer.data(), n);
            Event event = decode_event(raw);

            // Every event is acknowledged, including the ones filtered out below.
            write_all(socket, wire::serialize_ack());

            auto category = find_string(event, "category");
            if (!category || *category != "video") {
                log::debug("Event", "Skipping " + category.value_or("uncategorized") + " event");
                continue;
            }
            events_.push(std::move(event));
        }
    } catch (...) {
        state_ = State::closed;
        if (stop_requested()) {
            log::debug("Event", "Listener stopped while connecting");
            return;
        }
        events_.push(std::current_exception());
    }
}

} // namespace aircast
