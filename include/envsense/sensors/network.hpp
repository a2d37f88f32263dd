#pragma once

#include <envsense/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace envsense {

struct InterfaceAddress {
    std::string family;  // "ipv4" | "ipv6"
    std::string address;
    std::optional<std::string> netmask;
};

struct NetworkInterface {
    std::string name;
    std::optional<std::string> mac;
    bool loopback = false;
    bool up = false;
    std::vector<InterfaceAddress> addresses;
};

// fe80::/10
[[nodiscard]] bool IsLinkLocalV6(std::string_view address);

// Six bytes as "aa:bb:cc:dd:ee:ff". An all-zero address yields nullopt.
[[nodiscard]] std::optional<std::string> FormatMac(const unsigned char* bytes,
                                                   size_t length);

class INetworkSource {
public:
    virtual ~INetworkSource() = default;
    [[nodiscard]] virtual Result<std::vector<NetworkInterface>, Error> ReadInterfaces() = 0;
};

// getifaddrs(3); interfaces keep the order the kernel reports them in.
class IfaddrsNetworkSource : public INetworkSource {
public:
    [[nodiscard]] Result<std::vector<NetworkInterface>, Error> ReadInterfaces() override;
};

} // namespace envsense
