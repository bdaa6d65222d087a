#include "aircast/wire_codec.hpp"
#include "aircast/errors.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/beast/core.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace aircast::wire {

namespace beast = boost::beast;
namespace net = boost::asio;

namespace {

template <bool isRequest>
http::message<isRequest, http::string_body> parse_message(std::string_view bytes) {
    const char *what = isRequest ? "request" : "response";

    http::parser<isRequest, http::string_body> parser;
    parser.eager(true);

    beast::error_code ec;
    net::const_buffer remaining(bytes.data(), bytes.size());
    while (remaining.size() > 0 && !parser.is_done()) {
        std::size_t used = parser.put(remaining, ec);
        if (ec == http::error::need_more) {
            ec = {};
            break;
        }
        if (ec) {
            throw ProtocolError(std::string("Malformed HTTP ") + what + ": " + ec.message());
        }
        if (used == 0) break;
        remaining += used;
    }

    if (!parser.is_header_done()) {
        throw ProtocolError(std::string("Incomplete HTTP ") + what + " header (" +
                            std::to_string(bytes.size()) + " bytes received)");
    }

    if (!parser.is_done()) {
        // No Content-Length and not chunked: the body runs to the end of what we got.
        if (!parser.content_length() && !parser.chunked() && parser.need_eof()) {
            parser.put_eof(ec);
        } else {
            ec = http::error::partial_message;
        }
        if (ec) {
            throw ProtocolError(std::string("HTTP ") + what +
                                " body is shorter than its declared Content-Length");
        }
    }

    return parser.release();
}

} // namespace

Response parse_response(std::string_view bytes) {
    return parse_message<false>(bytes);
}

Request parse_request(std::string_view bytes) {
    return parse_message<true>(bytes);
}

std::string serialize_request(std::string_view method, std::string_view target,
                              std::string_view body) {
    Request req;
    http::verb verb = http::string_to_verb(beast::string_view(method.data(), method.size()));
    if (verb == http::verb::unknown) {
        req.method_string(beast::string_view(method.data(), method.size()));
    } else {
        req.method(verb);
    }
    req.target(beast::string_view(target.data(), target.size()));
    req.version(11);
    req.content_length(body.size());
    req.body().assign(body.data(), body.size());

    std::ostringstream out;
    out << req;
    return out.str();
}

std::string serialize_upgrade_request() {
    return "POST /reverse HTTP/1.1\r\nUpgrade: PTTH/1.0\r\nConnection: Upgrade\r\n\r\n";
}

std::string serialize_ack() {
    http::response<http::empty_body> res{http::status::ok, 11};
    res.content_length(0);

    std::ostringstream out;
    out << res;
    return out.str();
}

std::uint64_t content_length(const http::fields &fields) {
    auto it = fields.find(http::field::content_length);
    if (it == fields.end()) return 0;

    auto value = it->value();
    std::uint64_t length = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        throw ProtocolError("Invalid Content-Length: " + std::string(value));
    }
    return length;
}

std::string content_type(const http::fields &fields) {
    auto it = fields.find(http::field::content_type);
    if (it == fields.end()) return {};

    std::string value(it->value());
    value = value.substr(0, value.find(';'));
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace aircast::wire
