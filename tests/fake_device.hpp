// =============================================================================
// Scripted AirPlay receiver on loopback, for tests.
//
// Control connections: every request is recorded and answered by the
// installed handler. A connection that opens with "POST /reverse" gets the
// configured upgrade reply; after a 101 the fake pushes queued event requests
// and counts the acknowledgements.
// =============================================================================
#pragma once

#include "aircast/channel_queue.hpp"
#include "aircast/device.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <cctype>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace aircast::testing {

namespace net = boost::asio;
using tcp = net::ip::tcp;

inline std::string empty_response(int status = 200, const std::string &reason = "OK") {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\nContent-Length: 0\r\n\r\n";
}

inline std::string body_response(const std::string &content_type, const std::string &body) {
    return "HTTP/1.1 200 OK\r\nContent-Type: " + content_type + "\r\nContent-Length: " +
           std::to_string(body.size()) + "\r\n\r\n" + body;
}

inline std::string plist_document(const std::string &dict_contents) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
           "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
           "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
           "<plist version=\"1.0\"><dict>" + dict_contents + "</dict></plist>\n";
}

inline std::string event_request(const std::string &category, const std::string &state) {
    std::string body = plist_document("<key>category</key><string>" + category +
                                      "</string><key>state</key><string>" + state + "</string>");
    return "POST /event HTTP/1.1\r\nContent-Type: text/x-apple-plist+xml\r\nContent-Length: " +
           std::to_string(body.size()) + "\r\n\r\n" + body;
}

class FakeDevice {
public:
    using Handler = std::function<std::string(const std::string &request)>;

    FakeDevice() : acceptor_(ioc_, tcp::endpoint(net::ip::address_v4::loopback(), 0)) {
        acceptor_.non_blocking(true);
        handler_ = [](const std::string &) { return empty_response(); };
        accept_thread_ = std::thread([this] { accept_loop(); });
    }

    ~FakeDevice() {
        stopping_ = true;
        accept_thread_.join();
        std::vector<std::thread> connections;
        {
            std::lock_guard<std::mutex> lk(lock_);
            connections.swap(connections_);
        }
        for (auto &t : connections) t.join();
    }

    std::uint16_t port() const { return acceptor_.local_endpoint().port(); }
    Device device() const { return Device("127.0.0.1", port()); }

    void on_request(Handler handler) {
        std::lock_guard<std::mutex> lk(lock_);
        handler_ = std::move(handler);
    }

    void set_upgrade_response(std::string raw) {
        std::lock_guard<std::mutex> lk(lock_);
        upgrade_response_ = std::move(raw);
    }

    void push_event(std::string raw_request) { events_.push(std::move(raw_request)); }

    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lk(lock_);
        return requests_;
    }

    int acks() const { return acks_; }
    bool upgraded() const { return upgraded_; }

    // Poll until `pred` holds or the deadline passes.
    static bool wait_for(const std::function<bool()> &pred,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return pred();
    }

private:
    void accept_loop() {
        while (!stopping_) {
            boost::system::error_code ec;
            tcp::socket socket(ioc_);
            acceptor_.accept(socket, ec);
            if (ec == net::error::would_block || ec == net::error::try_again) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                continue;
            }
            if (ec) return;
            socket.non_blocking(true);
            std::lock_guard<std::mutex> lk(lock_);
            connections_.emplace_back([this, s = std::move(socket)]() mutable { serve(s); });
        }
    }

    // One complete message (header plus Content-Length body), or nullopt once
    // the peer closes or the fake is stopping.
    std::optional<std::string> read_message(tcp::socket &socket, std::string &pending) {
        for (;;) {
            size_t end = pending.find("\r\n\r\n");
            if (end != std::string::npos) {
                size_t length = 0;
                std::string header = pending.substr(0, end);
                for (auto &c : header) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                size_t cl = header.find("content-length:");
                if (cl != std::string::npos) length = std::stoul(header.substr(cl + 15));
                if (pending.size() >= end + 4 + length) {
                    std::string message = pending.substr(0, end + 4 + length);
                    pending.erase(0, end + 4 + length);
                    return message;
                }
            }
            if (stopping_) return std::nullopt;

            char buf[4096];
            boost::system::error_code ec;
            size_t n = socket.read_some(net::buffer(buf), ec);
            if (ec == net::error::would_block || ec == net::error::try_again) {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                continue;
            }
            if (ec) return std::nullopt;
            pending.append(buf, n);
        }
    }

    void send(tcp::socket &socket, const std::string &data) {
        size_t sent = 0;
        while (sent < data.size() && !stopping_) {
            boost::system::error_code ec;
            sent += socket.write_some(net::buffer(data.data() + sent, data.size() - sent), ec);
            if (ec == net::error::would_block || ec == net::error::try_again) continue;
            if (ec) return;
        }
    }

    void serve(tcp::socket &socket) {
        std::string pending;
        auto first = read_message(socket, pending);
        if (!first) return;

        if (first->rfind("POST /reverse", 0) == 0) {
            serve_events(socket, pending);
            return;
        }

        std::optional<std::string> request = std::move(first);
        while (request) {
            Handler handler;
            {
                std::lock_guard<std::mutex> lk(lock_);
                requests_.push_back(*request);
                handler = handler_;
            }
            send(socket, handler(*request));
            request = read_message(socket, pending);
        }
    }

    void serve_events(tcp::socket &socket, std::string &pending) {
        std::string reply;
        {
            std::lock_guard<std::mutex> lk(lock_);
            reply = upgrade_response_;
        }
        send(socket, reply);
        if (reply.find(" 101 ") == std::string::npos) return;
        upgraded_ = true;

        while (!stopping_) {
            auto event = events_.pop_for(std::chrono::milliseconds(20));
            if (!event) {
                // Notice the client closing its end while idle.
                char peek;
                boost::system::error_code ec;
                socket.receive(net::buffer(&peek, 1), tcp::socket::message_peek, ec);
                if (ec && ec != net::error::would_block && ec != net::error::try_again) return;
                continue;
            }
            send(socket, *event);
            if (!read_message(socket, pending)) return;
            ++acks_;
        }
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread accept_thread_;
    std::atomic<bool> stopping_{false};

    mutable std::mutex lock_;
    Handler handler_;
    std::string upgrade_response_ = "HTTP/1.1 101 Switching Protocols\r\nUpgrade: PTTH/1.0\r\nConnection: Upgrade\r\n\r\n";
    std::vector<std::string> requests_;
    std::vector<std::thread> connections_;

    ChannelQueue<std::string> events_;
    std::atomic<int> acks_{0};
    std::atomic<bool> upgraded_{false};
};

} // namespace aircast::testing
