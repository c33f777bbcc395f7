#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>

// Client or network address as used by ip4/ip6/a/mx/ptr and the i/c/v macros.
class SpfIpAddress {
public:
    // Accepts IPv4 and IPv6 literals. IPv4-mapped IPv6 addresses
    // (::ffff:a.b.c.d) come back as plain IPv4.
    static std::optional<SpfIpAddress> parse(const std::string& text);

    bool isV6() const { return v6_; }

    // Readable form ("192.0.2.3", "2001:db8::cb01").
    std::string toString() const;

    // Form used by the i macro: dotted quad, or 32 dot-separated nibbles.
    std::string toMacroString() const;

    // PTR query name below in-addr.arpa / ip6.arpa.
    std::string reverseLookupName() const;

    // Same family and the first prefixLength bits agree.
    bool inNetwork(const SpfIpAddress& network, int prefixLength) const;

    bool operator==(const SpfIpAddress& other) const;
    bool operator!=(const SpfIpAddress& other) const { return !(*this == other); }

private:
    SpfIpAddress() = default;

    bool v6_ = false;
    std::array<uint8_t, 16> bytes_{};  // IPv4 uses the first 4
};
