// socket_io.hpp
// Blocking socket helpers with deadlines. Each helper drives the socket's own
// io_context with run_for(), so callers keep a synchronous style.
#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace aircast {

namespace net = boost::asio;
using tcp = net::ip::tcp;

// Polled while waiting; returning true abandons the pending operation.
using Interrupt = std::function<bool()>;

// How often an Interrupt is polled.
constexpr std::chrono::milliseconds interrupt_poll{50};

// Resolve (IPv4) and connect. Throws ConnectionError naming host:port, also
// when `interrupted` fires first.
tcp::socket connect_socket(net::io_context &ioc, const std::string &host, std::uint16_t port,
                           std::chrono::milliseconds timeout, const Interrupt &interrupted = {});

// One read_some bounded by `timeout`. On expiry `ec` is net::error::timed_out,
// when `interrupted` fires it is net::error::operation_aborted. In both cases
// nothing was consumed.
std::size_t read_some_for(net::io_context &ioc, tcp::socket &socket, net::mutable_buffer buffer,
                          std::chrono::milliseconds timeout, boost::beast::error_code &ec,
                          const Interrupt &interrupted = {});

// Throws ConnectionError when the write fails.
void write_all(tcp::socket &socket, std::string_view data);

} // namespace aircast
