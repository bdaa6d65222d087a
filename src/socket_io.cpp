#include "aircast/socket_io.hpp"
#include "aircast/errors.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>

namespace aircast {

namespace beast = boost::beast;

namespace {

enum class Wait { done, timed_out, interrupted };

// Run `ioc` until its pending operation completes, the timeout passes or
// `interrupted` fires. Without an Interrupt this is a single run_for().
Wait run_until_done(net::io_context &ioc, std::chrono::milliseconds timeout, const Interrupt &interrupted) {
    ioc.restart();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return Wait::timed_out;

        ioc.run_for(interrupted ? std::min(left, interrupt_poll) : left);
        if (ioc.stopped()) return Wait::done;
        if (interrupted && interrupted()) return Wait::interrupted;
    }
}

} // namespace

tcp::socket connect_socket(net::io_context &ioc, const std::string &host, std::uint16_t port,
                           std::chrono::milliseconds timeout, const Interrupt &interrupted) {
    const std::string where = host + ":" + std::to_string(port);

    beast::error_code ec;
    tcp::resolver resolver(ioc);
    auto endpoints = resolver.resolve(tcp::v4(), host, std::to_string(port), ec);
    if (ec) throw ConnectionError("Unable to connect to " + where + ": " + ec.message());

    tcp::socket socket(ioc);
    ec = net::error::would_block;
    net::async_connect(socket, endpoints,
                       [&](const beast::error_code &e, const tcp::endpoint &) { ec = e; });
    Wait outcome = run_until_done(ioc, timeout, interrupted);
    if (outcome != Wait::done) {
        beast::error_code ignored;
        socket.close(ignored);
        ioc.run();
        ec = outcome == Wait::timed_out ? net::error::timed_out : net::error::operation_aborted;
    }
    if (ec) throw ConnectionError("Unable to connect to " + where + ": " + ec.message());
    return socket;
}

std::size_t read_some_for(net::io_context &ioc, tcp::socket &socket, net::mutable_buffer buffer,
                          std::chrono::milliseconds timeout, beast::error_code &ec,
                          const Interrupt &interrupted) {
    std::size_t transferred = 0;
    ec = net::error::would_block;
    socket.async_read_some(buffer, [&](const beast::error_code &e, std::size_t n) {
        ec = e;
        transferred = n;
    });
    Wait outcome = run_until_done(ioc, timeout, interrupted);
    if (outcome != Wait::done) {
        beast::error_code ignored;
        socket.cancel(ignored);
        ioc.run();
        if (ec == net::error::operation_aborted && outcome == Wait::timed_out) ec = net::error::timed_out;
    }
    return transferred;
}

void write_all(tcp::socket &socket, std::string_view data) {
    beast::error_code ec;
    net::write(socket, net::buffer(data.data(), data.size()), ec);
    if (ec) throw ConnectionError("Socket write failed: " + ec.message());
}

} // namespace aircast
