#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "dns_types.h"

struct DnsAnswer {
    std::string name;
    DnsRecordType type;
    uint32_t ttl;
    std::string data;                  // A/AAAA address, MX/PTR/CNAME/NS target
    std::vector<std::string> strings;  // TXT/SPF character-strings, in order
    uint16_t preference = 0;           // MX only
};

struct DnsPacket {
    uint16_t id = 0;
    DnsResponseCode rcode = DnsResponseCode::NoError;
    std::vector<DnsAnswer> answers;

    // Answers of one type, in packet order.
    std::vector<const DnsAnswer*> answersOfType(DnsRecordType type) const;
};

// Throws std::runtime_error on a truncated or malformed message.
DnsPacket parseDnsResponse(const uint8_t* buf, size_t len);
