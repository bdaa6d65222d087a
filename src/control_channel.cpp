#include "aircast/control_channel.hpp"
#include "aircast/errors.hpp"
#include "aircast/log.hpp"
#include "aircast/wire_codec.hpp"

#include <array>
#include <cstdlib>

namespace aircast {

namespace beast = boost::beast;

namespace {

bool expect_accepted(const ControlResponse &response, const std::string &what) {
    if (auto accepted = std::get_if<Accepted>(&response)) return accepted->ok;
    throw ProtocolError(what + ": expected an empty response body");
}

double parse_seconds(const std::string &key, const std::string &value) {
    char *end = nullptr;
    double seconds = std::strtod(value.c_str(), &end);
    if (value.empty() || end != value.c_str() + value.size()) {
        throw ParseError("Invalid value for " + key + ": '" + value + "'");
    }
    return seconds;
}

} // namespace

ControlChannel::ControlChannel(const Device &device, std::chrono::milliseconds timeout)
    : socket_(connect_socket(ioc_, device.host(), device.port(), timeout)), timeout_(timeout),
      address_(device.address()) {
    log::debug("Control", "Connected to " + address_ + " from " + local_address());
}

ControlResponse ControlChannel::command(const std::string &path, const std::string &method,
                                        const std::string &body, const QueryParams &query) {
    if (broken_) {
        throw ConnectionError("Control connection to " + address_ + " was closed after an earlier failure");
    }

    std::string target = path;
    if (!query.empty()) target += "?" + build_query(query);

    std::array<char, wire::recv_size> buffer;
    std::size_t n = 0;
    wire::Response res;
    try {
        write_all(socket_, wire::serialize_request(method, target, body));

        beast::error_code ec;
        n = read_some_for(ioc_, socket_, net::buffer(buffer), timeout_, ec);
        if (ec == net::error::timed_out) {
            throw ConnectionError("Timed out waiting for a response to " + method + " " + target);
        }
        if (ec) {
            throw ConnectionError("Control connection failed during " + method + " " + target + ": " +
                                  ec.message());
        }
        res = wire::parse_response(std::string_view(buffer.data(), n));
    } catch (const Error &) {
        // A late or partial reply would be read as the answer to the next request.
        mark_broken();
        throw;
    }
    log::debug("Control", method + " " + target + " -> " + std::to_string(res.result_int()));

    if (wire::content_length(res) == 0) {
        return Accepted{res.result() == wire::http::status::ok};
    }

    std::string type = wire::content_type(res);
    if (type.empty()) {
        throw ProtocolError("Response to " + method + " " + target + " has a body but no content-type");
    }
    if (type == wire::parameters_content_type) {
        return StructuredBody{parse_parameters(res.body())};
    }
    if (type == wire::plist_content_type) {
        return PlistBody{parse_plist(res.body())};
    }
    throw ProtocolError("Response received with unknown content-type: " + type);
}

PlistDict ControlChannel::server_info() {
    auto response = command("/server-info");
    if (auto plist = std::get_if<PlistBody>(&response)) return std::move(plist->dict);
    throw ProtocolError("/server-info did not return a property list");
}

bool ControlChannel::play(const std::string &url, double position) {
    std::string body = "Content-Location: " + url + "\nStart-Position: " + format_decimal(position) + "\n\n";
    return expect_accepted(command("/play", "POST", body), "/play");
}

bool ControlChannel::rate(double value) {
    return expect_accepted(command("/rate", "POST", "", {{"value", format_decimal(value)}}), "/rate");
}

bool ControlChannel::stop() {
    return expect_accepted(command("/stop", "POST"), "/stop");
}

std::optional<PlistDict> ControlChannel::playback_info() {
    auto response = command("/playback-info");
    if (auto plist = std::get_if<PlistBody>(&response)) return std::move(plist->dict);
    if (std::holds_alternative<Accepted>(response)) return std::nullopt;
    throw ProtocolError("/playback-info returned an unexpected body");
}

PlaybackPosition ControlChannel::scrub() {
    auto response = command("/scrub");
    auto body = std::get_if<StructuredBody>(&response);
    if (!body) throw ProtocolError("/scrub did not return text/parameters");

    std::optional<double> duration;
    std::optional<double> position;
    for (const auto &[key, value] : body->fields) {
        double seconds = parse_seconds(key, value);
        if (key == "duration") duration = seconds;
        else if (key == "position") position = seconds;
    }
    if (!duration || !position) {
        throw ProtocolError("/scrub response is missing duration or position");
    }
    return PlaybackPosition{*duration, *position};
}

PlaybackPosition ControlChannel::scrub(double position) {
    auto response = command("/scrub", "POST", "", {{"position", format_decimal(position)}});
    auto accepted = std::get_if<Accepted>(&response);
    if (!accepted || !accepted->ok) {
        log::debug("Control", "Seek to " + format_decimal(position) + " was not acknowledged");
    }
    return scrub();
}

PlistValue ControlChannel::get_property(const std::string &name) {
    throw UnsupportedOperationError("Cannot get property '" + name +
                                    "': methods that require binary plists are not supported");
}

void ControlChannel::set_property(const std::string &name, const PlistValue &) {
    throw UnsupportedOperationError("Cannot set property '" + name +
                                    "': methods that require binary plists are not supported");
}

void ControlChannel::mark_broken() {
    broken_ = true;
    beast::error_code ignored;
    socket_.close(ignored);
    log::debug("Control", "Closed the connection to " + address_);
}

std::string ControlChannel::local_address() const {
    beast::error_code ec;
    auto endpoint = socket_.local_endpoint(ec);
    if (ec) throw ConnectionError("Control connection to " + address_ + " is closed: " + ec.message());
    return endpoint.address().to_string();
}

std::string ControlChannel::remote_address() const {
    beast::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) throw ConnectionError("Control connection to " + address_ + " is closed: " + ec.message());
    return endpoint.address().to_string();
}

} // namespace aircast
