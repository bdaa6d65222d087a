#include "aircast/device_client.hpp"
#include "aircast/log.hpp"
#include "aircast/url.hpp"

#ifdef AIRCAST_HAVE_AVAHI
#include "aircast/discovery.hpp"
#endif

namespace aircast {

DeviceClient::DeviceClient(Device device, ClientOptions options)
    : device_(std::move(device)), options_(options), control_(device_, options_.timeout) {}

DeviceClient::~DeviceClient() {
    stop_events();
    for (auto &server : servers_) server->stop();
}

EventChannel &DeviceClient::event_channel() {
    if (!events_) {
        events_ = std::make_unique<EventChannel>(device_, options_.timeout, options_.event_poll_interval);
        events_->start();
    }
    return *events_;
}

EventStream DeviceClient::events(bool block) {
    return EventStream(event_channel(), block);
}

std::optional<Event> DeviceClient::next_event(bool block) {
    return event_channel().next(block);
}

void DeviceClient::stop_events() {
    if (events_) events_->stop();
}

std::string DeviceClient::serve(const std::string &path) {
    return serve(std::vector<std::string>{path}).front();
}

std::vector<std::string> DeviceClient::serve(const std::vector<std::string> &paths) {
    std::optional<std::string> allowed;
    if (options_.restrict_to_device) allowed = control_.remote_address();

    auto server = std::make_unique<RangeFileServer>(paths, allowed);
    tcp::endpoint bound = server->start();

    // The device reaches us on the interface the control socket uses.
    const std::string base = "http://" + control_.local_address() + ":" + std::to_string(bound.port()) + "/";

    std::vector<std::string> urls;
    for (const auto &p : paths) {
        // Same resolution as the server's allow-list, so symlinks map to their target name.
        std::string name = std::filesystem::weakly_canonical(std::filesystem::absolute(p)).filename().string();
        urls.push_back(base + url_encode_path(name));
    }
    log::debug("HTTP", "Serving at " + base);
    servers_.push_back(std::move(server));
    return urls;
}

#ifdef AIRCAST_HAVE_AVAHI
std::vector<Device> DeviceClient::find(std::chrono::milliseconds timeout, bool fast) {
    return discover_devices(timeout, fast);
}
#endif

} // namespace aircast
