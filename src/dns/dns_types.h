#pragma once
#include <cstdint>
#include <string>

enum class DnsRecordType : uint16_t {
    A     = 1,
    NS    = 2,
    CNAME = 5,
    PTR   = 12,
    MX    = 15,
    TXT   = 16,
    AAAA  = 28,
    SPF   = 99
};

// RFC 1035 4.1.1 / RFC 6895 2.3
enum class DnsResponseCode : uint8_t {
    NoError  = 0,
    FormErr  = 1,
    ServFail = 2,
    NxDomain = 3,
    NotImp   = 4,
    Refused  = 5
};

std::string dnsRecordTypeName(DnsRecordType type);
std::string dnsResponseCodeName(DnsResponseCode rcode);
