// device_client.hpp
// One connected receiver: the control channel, a lazily started event
// listener and any file servers created to feed it.
#pragma once

#include "aircast/control_channel.hpp"
#include "aircast/device.hpp"
#include "aircast/event_channel.hpp"
#include "aircast/range_file_server.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aircast {

struct ClientOptions {
    std::chrono::milliseconds timeout{5000};
    std::chrono::milliseconds event_poll_interval{100};
    // Serve files only to the device's own address.
    bool restrict_to_device = true;
};

class DeviceClient {
public:
    // Connects the control channel. Throws ConnectionError.
    explicit DeviceClient(Device device, ClientOptions options = {});
    ~DeviceClient();

    DeviceClient(const DeviceClient &) = delete;
    DeviceClient &operator=(const DeviceClient &) = delete;

    const Device &device() const { return device_; }
    ControlChannel &control() { return control_; }

    PlistDict server_info() { return control_.server_info(); }
    bool play(const std::string &url, double position = 0.0) { return control_.play(url, position); }
    bool rate(double value) { return control_.rate(value); }
    bool stop() { return control_.stop(); }
    std::optional<PlistDict> playback_info() { return control_.playback_info(); }
    PlaybackPosition scrub() { return control_.scrub(); }
    PlaybackPosition scrub(double position) { return control_.scrub(position); }
    PlistValue get_property(const std::string &name) { return control_.get_property(name); }
    void set_property(const std::string &name, const PlistValue &value) { control_.set_property(name, value); }

    // Video events from the device. The listener is started on first use.
    EventStream events(bool block = true);
    std::optional<Event> next_event(bool block = true);
    void stop_events();

    // Serve a local file and return the URL the device should fetch it from.
    std::string serve(const std::string &path);
    // One server for several files; one URL per path, in order.
    std::vector<std::string> serve(const std::vector<std::string> &paths);

#ifdef AIRCAST_HAVE_AVAHI
    static std::vector<Device> find(std::chrono::milliseconds timeout = std::chrono::seconds(2), bool fast = false);
#endif

private:
    EventChannel &event_channel();

    Device device_;
    ClientOptions options_;
    ControlChannel control_;
    std::unique_ptr<EventChannel> events_;
    std::vector<std::unique_ptr<RangeFileServer>> servers_;
};

} // namespace aircast
