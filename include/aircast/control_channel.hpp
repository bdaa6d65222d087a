// control_channel.hpp
// Request/response exchanges over the persistent control socket.
#pragma once

#include "aircast/device.hpp"
#include "aircast/plist_codec.hpp"
#include "aircast/socket_io.hpp"
#include "aircast/url.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace aircast {

// Zero-length reply; `ok` is status == 200.
struct Accepted {
    bool ok = false;
};

// text/parameters reply.
struct StructuredBody {
    Parameters fields;
};

// text/x-apple-plist+xml reply.
struct PlistBody {
    PlistDict dict;
};

using ControlResponse = std::variant<Accepted, StructuredBody, PlistBody>;

// Seconds.
struct PlaybackPosition {
    double duration = 0.0;
    double position = 0.0;
};

// Owns the control socket. Not thread-safe: one command at a time.
// A timeout, socket error or malformed reply closes the socket for good and
// every later command throws ConnectionError.
class ControlChannel {
public:
    // Throws ConnectionError when the device cannot be reached.
    ControlChannel(const Device &device, std::chrono::milliseconds timeout);

    ControlChannel(const ControlChannel &) = delete;
    ControlChannel &operator=(const ControlChannel &) = delete;

    // Send one request and decode the reply.
    //   Content-Length absent or 0   -> Accepted
    //   text/parameters              -> StructuredBody
    //   text/x-apple-plist+xml       -> PlistBody
    // Anything else is a ProtocolError.
    ControlResponse command(const std::string &path, const std::string &method = "GET",
                            const std::string &body = "", const QueryParams &query = {});

    PlistDict server_info();

    // True means the device accepted the request, not that playback will work.
    bool play(const std::string &url, double position = 0.0);

    // 0.0 is paused, 1.0 normal speed.
    bool rate(double value);

    bool stop();

    // nullopt when nothing is playing.
    std::optional<PlistDict> playback_info();

    PlaybackPosition scrub();

    // Seek, then read the position back. The POST reply carries no fields, so
    // this always costs two round trips.
    PlaybackPosition scrub(double position);

    // Both need binary plist bodies; always throw UnsupportedOperationError.
    PlistValue get_property(const std::string &name);
    void set_property(const std::string &name, const PlistValue &value);

    // Address of our end of the control socket, as the device sees it.
    std::string local_address() const;
    // Resolved address of the device.
    std::string remote_address() const;

private:
    void mark_broken();

    net::io_context ioc_;
    tcp::socket socket_;
    std::chrono::milliseconds timeout_;
    std::string address_;
    bool broken_ = false;
};

} // namespace aircast
