#pragma once

#include <optional>
#include <string>
#include "dns/dns_packet.h"

enum class DnsQueryStatus {
    Answered,   // a response was received, whatever its rcode
    Timeout,
    Failed
};

struct DnsQueryResult {
    DnsQueryStatus status = DnsQueryStatus::Failed;
    std::optional<DnsPacket> packet;
    std::string error;
};

// Issues exactly one query. Implementations shared by an SpfServer must be
// safe to call from several threads at once.
class IDnsResolver {
public:
    virtual ~IDnsResolver() = default;

    virtual DnsQueryResult query(const std::string& name, DnsRecordType type) = 0;
};
