// device.hpp
// Identity of a receiver on the network.
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace aircast {

constexpr std::uint16_t default_port = 7000;

class Device {
public:
    Device(std::string host, std::uint16_t port = default_port,
           std::optional<std::string> name = std::nullopt);

    // "host" or "host:port"; an unparseable port means the whole string is
    // the host and the default port is used.
    static Device parse(const std::string &host_port);

    const std::string &host() const { return host_; }
    std::uint16_t port() const { return port_; }
    const std::optional<std::string> &name() const { return name_; }

    // host:port
    std::string address() const;

    bool operator==(const Device &other) const {
        return host_ == other.host_ && port_ == other.port_;
    }
    bool operator!=(const Device &other) const { return !(*this == other); }

private:
    std::string host_;
    std::uint16_t port_;
    std::optional<std::string> name_;
};

} // namespace aircast
