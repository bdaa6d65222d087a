// wire_codec.hpp
// Minimal HTTP framing for the control and event sockets. Messages are parsed
// from a single already-received buffer with Beast's parsers; no stream is
// involved.
#pragma once

#include <boost/beast/http.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace aircast::wire {

namespace http = boost::beast::http;

using Response = http::response<http::string_body>;
using Request = http::request<http::string_body>;

// Bytes read from a socket in one go.
constexpr std::size_t recv_size = 8192;

constexpr std::string_view plist_content_type = "text/x-apple-plist+xml";
constexpr std::string_view parameters_content_type = "text/parameters";

// Throws ProtocolError on a malformed status line/headers or when the body is
// shorter than the declared Content-Length.
Response parse_response(std::string_view bytes);
Request parse_request(std::string_view bytes);

// "METHOD target HTTP/1.1\r\nContent-Length: N\r\n\r\n<body>"
std::string serialize_request(std::string_view method, std::string_view target,
                              std::string_view body);

// Reverse HTTP upgrade sent on the event socket.
std::string serialize_upgrade_request();

// "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n"
std::string serialize_ack();

// Declared Content-Length, 0 when absent.
std::uint64_t content_length(const http::fields &fields);

// Media type without parameters, lower-cased; empty when absent.
std::string content_type(const http::fields &fields);

} // namespace aircast::wire
