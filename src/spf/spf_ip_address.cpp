#include "spf/spf_ip_address.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <cstring>

static const char HEX[] = "0123456789abcdef";

std::optional<SpfIpAddress> SpfIpAddress::parse(const std::string& text) {
    SpfIpAddress ip;

    in_addr v4{};
    if (inet_pton(AF_INET, text.c_str(), &v4) == 1) {
        std::memcpy(ip.bytes_.data(), &v4.s_addr, 4);
        return ip;
    }

    in6_addr v6{};
    if (inet_pton(AF_INET6, text.c_str(), &v6) != 1)
        return std::nullopt;

    static const uint8_t mappedPrefix[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff};
    if (std::memcmp(v6.s6_addr, mappedPrefix, sizeof(mappedPrefix)) == 0) {
        std::memcpy(ip.bytes_.data(), v6.s6_addr + 12, 4);
        return ip;
    }

    ip.v6_ = true;
    std::memcpy(ip.bytes_.data(), v6.s6_addr, 16);
    return ip;
}

std::string SpfIpAddress::toString() const {
    char buf[INET6_ADDRSTRLEN];
    if (!inet_ntop(v6_ ? AF_INET6 : AF_INET, bytes_.data(), buf, sizeof(buf)))
        return "";
    return buf;
}

std::string SpfIpAddress::toMacroString() const {
    if (!v6_)
        return toString();

    std::string out;
    for (size_t i = 0; i < 16; ++i) {
        if (i) out += '.';
        out += HEX[bytes_[i] >> 4];
        out += '.';
        out += HEX[bytes_[i] & 0x0f];
    }
    return out;
}

std::string SpfIpAddress::reverseLookupName() const {
    std::string out;
    if (!v6_) {
        for (int i = 3; i >= 0; --i)
            out += std::to_string(bytes_[i]) + ".";
        return out + "in-addr.arpa";
    }
    for (int i = 15; i >= 0; --i) {
        out += HEX[bytes_[i] & 0x0f];
        out += '.';
        out += HEX[bytes_[i] >> 4];
        out += '.';
    }
    return out + "ip6.arpa";
}

bool SpfIpAddress::inNetwork(const SpfIpAddress& network, int prefixLength) const {
    if (v6_ != network.v6_)
        return false;

    int maxBits = v6_ ? 128 : 32;
    if (prefixLength < 0 || prefixLength > maxBits)
        return false;

    int bytes = prefixLength / 8;
    int bits = prefixLength % 8;

    if (std::memcmp(bytes_.data(), network.bytes_.data(), bytes) != 0)
        return false;

    if (bits > 0) {
        uint8_t mask = static_cast<uint8_t>(0xFF << (8 - bits));
        if ((bytes_[bytes] & mask) != (network.bytes_[bytes] & mask))
            return false;
    }
    return true;
}

bool SpfIpAddress::operator==(const SpfIpAddress& other) const {
    return inNetwork(other, v6_ ? 128 : 32);
}
