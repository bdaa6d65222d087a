#include "aircast/device.hpp"

#include <charconv>
#include <utility>

namespace aircast {

Device::Device(std::string host, std::uint16_t port, std::optional<std::string> name)
    : host_(std::move(host)), port_(port), name_(std::move(name)) {}

Device Device::parse(const std::string &host_port) {
    size_t colon = host_port.find(':');
    if (colon == std::string::npos) return Device(host_port);

    std::string port_str = host_port.substr(colon + 1);
    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc() || ptr != port_str.data() + port_str.size() || port == 0 || port > 65535) {
        return Device(host_port);
    }
    return Device(host_port.substr(0, colon), static_cast<std::uint16_t>(port));
}

std::string Device::address() const {
    return host_ + ":" + std::to_string(port_);
}

} // namespace aircast
