#include "dns_resolver.h"
#include "core/logger.h"

#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <netinet/in.h>
#include <resolv.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>

SystemDnsResolver::SystemDnsResolver(const DnsResolverConfig& cfg)
    : cfg_(cfg) {}

DnsQueryResult SystemDnsResolver::query(const std::string& name,
                                        DnsRecordType type) {
    DnsQueryResult result;
    const std::string what = dnsRecordTypeName(type) + " " + name;

    struct __res_state state;
    std::memset(&state, 0, sizeof(state));
    if (res_ninit(&state) != 0) {
        result.error = "resolver initialisation failed";
        Logger::instance().log(LogLevel::Warn, "DNS: " + result.error);
        return result;
    }

    state.retrans = cfg_.timeoutSeconds;
    state.retry = cfg_.attempts;
    if (!cfg_.nameserver.empty()) {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(53);
        if (inet_pton(AF_INET, cfg_.nameserver.c_str(), &addr.sin_addr) == 1) {
            state.nsaddr_list[0] = addr;
            state.nscount = 1;
        }
    }

    unsigned char q[NS_PACKETSZ];
    int qlen = res_nmkquery(&state, ns_o_query, name.c_str(), ns_c_in,
                            static_cast<int>(type), nullptr, 0, nullptr,
                            q, sizeof(q));
    if (qlen < 0) {
        res_nclose(&state);
        result.error = "cannot build query for " + what;
        Logger::instance().log(LogLevel::Warn, "DNS: " + result.error);
        return result;
    }

    std::vector<unsigned char> answer(NS_MAXMSG);
    errno = 0;
    int len = res_nsend(&state, q, qlen, answer.data(),
                        static_cast<int>(answer.size()));
    int err = errno;
    res_nclose(&state);

    if (len < 0) {
        if (err == ETIMEDOUT) {
            result.status = DnsQueryStatus::Timeout;
            result.error = "timeout";
        } else {
            result.error = err ? std::strerror(err) : "no response";
        }
        Logger::instance().log(LogLevel::Warn,
            "DNS: query " + what + " failed: " + result.error);
        return result;
    }

    try {
        result.packet = parseDnsResponse(answer.data(), static_cast<size_t>(len));
        result.status = DnsQueryStatus::Answered;
    } catch (const std::runtime_error& ex) {
        result.error = ex.what();
        Logger::instance().log(LogLevel::Warn,
            "DNS: bad response to " + what + ": " + result.error);
    }
    return result;
}
