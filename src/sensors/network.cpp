#include <envsense/sensors/network.hpp>

#include <envsense/core/log.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstdio>
#include <ifaddrs.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <netinet/in.h>

#include <algorithm>
#include <cctype>

namespace envsense {

namespace {

std::optional<std::string> SockaddrToString(const sockaddr* sa) {
    if (sa == nullptr) return std::nullopt;
    char buf[INET6_ADDRSTRLEN] = {};
    if (sa->sa_family == AF_INET) {
        const auto* in4 = reinterpret_cast<const sockaddr_in*>(sa);
        if (inet_ntop(AF_INET, &in4->sin_addr, buf, sizeof(buf)) == nullptr) {
            return std::nullopt;
        }
        return std::string(buf);
    }
    if (sa->sa_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(sa);
        if (inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf)) == nullptr) {
            return std::nullopt;
        }
        return std::string(buf);
    }
    return std::nullopt;
}

// RAII owner for the getifaddrs list.
class IfaddrsList {
public:
    IfaddrsList() = default;
    ~IfaddrsList() {
        if (head_ != nullptr) freeifaddrs(head_);
    }
    IfaddrsList(const IfaddrsList&) = delete;
    IfaddrsList& operator=(const IfaddrsList&) = delete;

    ifaddrs** Out() { return &head_; }
    [[nodiscard]] const ifaddrs* Head() const { return head_; }

private:
    ifaddrs* head_ = nullptr;
};

} // anonymous namespace

bool IsLinkLocalV6(std::string_view address) {
    if (address.size() < 4) return false;
    std::string prefix;
    for (size_t i = 0; i < 4; ++i) {
        prefix.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(address[i]))));
    }
    // fe80 .. febf
    return prefix.compare(0, 2, "fe") == 0 && prefix[2] >= '8' && prefix[2] <= 'b';
}

std::optional<std::string> FormatMac(const unsigned char* bytes, size_t length) {
    if (bytes == nullptr || length != 6) return std::nullopt;
    if (std::all_of(bytes, bytes + length, [](unsigned char b) { return b == 0; })) {
        return std::nullopt;
    }
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", bytes[0],
                  bytes[1], bytes[2], bytes[3], bytes[4], bytes[5]);
    return std::string(buf);
}

Result<std::vector<NetworkInterface>, Error> IfaddrsNetworkSource::ReadInterfaces() {
    IfaddrsList list;
    if (getifaddrs(list.Out()) != 0) {
        return Result<std::vector<NetworkInterface>, Error>::Err(
            Error::FromErrno("Network", errno, "getifaddrs"));
    }

    std::vector<NetworkInterface> interfaces;
    auto find_or_add = [&interfaces](const char* name) -> NetworkInterface& {
        auto it = std::find_if(interfaces.begin(), interfaces.end(),
                               [name](const NetworkInterface& i) { return i.name == name; });
        if (it != interfaces.end()) return *it;
        interfaces.push_back(NetworkInterface{});
        interfaces.back().name = name;
        return interfaces.back();
    };

    for (const ifaddrs* ifa = list.Head(); ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_name == nullptr) continue;
        auto& iface = find_or_add(ifa->ifa_name);
        iface.loopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
        iface.up = (ifa->ifa_flags & IFF_UP) != 0;

        if (ifa->ifa_addr == nullptr) continue;
        const int family = ifa->ifa_addr->sa_family;

        if (family == AF_PACKET) {
            const auto* ll = reinterpret_cast<const sockaddr_ll*>(ifa->ifa_addr);
            if (!iface.mac) iface.mac = FormatMac(ll->sll_addr, ll->sll_halen);
        } else if (family == AF_INET || family == AF_INET6) {
            auto address = SockaddrToString(ifa->ifa_addr);
            if (!address) continue;
            InterfaceAddress entry;
            entry.family = family == AF_INET ? "ipv4" : "ipv6";
            entry.address = *address;
            entry.netmask = SockaddrToString(ifa->ifa_netmask);
            iface.addresses.push_back(std::move(entry));
        }
    }

    LogDebug("network", std::to_string(interfaces.size()) + " interface(s)");
    return Result<std::vector<NetworkInterface>, Error>::Ok(std::move(interfaces));
}

} // namespace envsense
