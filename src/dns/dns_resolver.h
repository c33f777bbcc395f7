#pragma once
#include <string>
#include "dns/i_dns_resolver.h"

struct DnsResolverConfig {
    int timeoutSeconds = 5;    // per attempt
    int attempts = 2;
    std::string nameserver;    // IPv4 literal; empty: use /etc/resolv.conf
};

// Stub resolver on top of libresolv. Every query runs on its own res_state.
class SystemDnsResolver : public IDnsResolver {
public:
    SystemDnsResolver() = default;
    explicit SystemDnsResolver(const DnsResolverConfig& cfg);

    DnsQueryResult query(const std::string& name, DnsRecordType type) override;

private:
    DnsResolverConfig cfg_;
};
