#include "spf/spf_mechanism.h"
#include "spf/spf_errors.h"
#include "spf/spf_server.h"
#include "core/logger.h"

#include <algorithm>
#include <cctype>

SpfResultCode spfResultCodeFor(SpfQualifier qualifier) {
    switch (qualifier) {
        case SpfQualifier::Plus:     return SpfResultCode::Pass;
        case SpfQualifier::Minus:    return SpfResultCode::Fail;
        case SpfQualifier::Tilde:    return SpfResultCode::SoftFail;
        case SpfQualifier::Question: return SpfResultCode::Neutral;
    }
    return SpfResultCode::Neutral;
}

/* ===================== Helpers ===================== */

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return s;
}

static std::string stripDot(std::string s) {
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

// name equals domain or lies below it
static bool isAtOrBelow(const std::string& name, const std::string& domain) {
    std::string n = toLower(stripDot(name));
    std::string d = toLower(stripDot(domain));
    if (n == d) return true;
    return n.size() > d.size()
        && n.compare(n.size() - d.size(), d.size(), d) == 0
        && n[n.size() - d.size() - 1] == '.';
}

static DnsRecordType addressType(const SpfIpAddress& ip) {
    return ip.isV6() ? DnsRecordType::AAAA : DnsRecordType::A;
}

static std::vector<SpfIpAddress> addressesOf(const DnsPacket& packet, DnsRecordType type) {
    std::vector<SpfIpAddress> out;
    for (const auto* a : packet.answersOfType(type)) {
        auto ip = SpfIpAddress::parse(a->data);
        if (ip) out.push_back(*ip);
    }
    return out;
}

static std::string targetDomain(const SpfMechanism& m, const SpfServer& server,
                                const SpfRequest& request) {
    return m.domainSpec ? m.domainSpec->expand(server, request)
                        : request.authorityDomain();
}

// Looks up the mechanism's target: the expanded domain-spec, or the
// authority domain when there is none.
static DnsPacket lookupTarget(const SpfMechanism& m, const SpfServer& server,
                              const SpfRequest& request, DnsRecordType type) {
    if (m.domainSpec)
        return server.dnsLookup(*m.domainSpec, request, type);
    return server.dnsLookup(request.authorityDomain(), type);
}

static bool anyInNetwork(const std::vector<SpfIpAddress>& addrs,
                         const SpfMechanism& m, const SpfIpAddress& ip) {
    int prefix = ip.isV6() ? m.ipv6Prefix : m.ipv4Prefix;
    for (const auto& a : addrs)
        if (ip.inNetwork(a, prefix)) return true;
    return false;
}

static std::vector<std::string> ptrNames(const SpfServer& server, const SpfIpAddress& ip) {
    DnsPacket packet = server.dnsLookup(ip.reverseLookupName(), DnsRecordType::PTR);
    std::vector<std::string> names;
    for (const auto* a : packet.answersOfType(DnsRecordType::PTR))
        names.push_back(a->data);
    return names;
}

std::vector<std::string> spfValidatedPtrNames(const SpfServer& server,
                                              const std::vector<std::string>& names,
                                              const SpfIpAddress& ip,
                                              int maxNames) {
    std::vector<std::string> validated;
    int tried = 0;
    for (const auto& name : names) {
        // RFC 7208 4.6.4: PTR names beyond the limit are ignored
        if (tried++ >= maxNames) break;
        try {
            DnsPacket packet = server.dnsLookup(name, addressType(ip));
            for (const auto& a : addressesOf(packet, addressType(ip))) {
                if (a == ip) {
                    validated.push_back(name);
                    break;
                }
            }
        } catch (const SpfDnsError& ex) {
            // RFC 7208 5.5: a name whose lookup fails is skipped
            Logger::instance().log(LogLevel::Debug,
                std::string("SPF: skipping PTR name ") + name + ": " + ex.what());
        }
    }
    return validated;
}

std::string spfValidatedDomainName(const SpfServer& server, const SpfRequest& request) {
    std::vector<std::string> validated;
    try {
        validated = spfValidatedPtrNames(server, ptrNames(server, request.ipAddress()),
                                         request.ipAddress(),
                                         server.maxNameLookupsPerPtrMech());
    } catch (const SpfDnsError& ex) {
        Logger::instance().log(LogLevel::Debug,
            std::string("SPF: p macro lookup failed: ") + ex.what());
        return "unknown";
    }
    if (validated.empty())
        return "unknown";

    const std::string& domain = request.authorityDomain();
    for (const auto& name : validated)
        if (toLower(stripDot(name)) == toLower(stripDot(domain))) return stripDot(name);
    for (const auto& name : validated)
        if (isAtOrBelow(name, domain)) return stripDot(name);
    return stripDot(validated.front());
}

/* ===================== Mechanisms ===================== */

SpfMatch SpfMechanism::match(const SpfServer& server, SpfRequest& request) const {
    const SpfIpAddress& ip = request.ipAddress();

    switch (type) {
    case SpfMechanismType::ALL:
        return SpfMatch::match();

    case SpfMechanismType::IP4:
    case SpfMechanismType::IP6:
        if (network && ip.inNetwork(*network, type == SpfMechanismType::IP4 ? ipv4Prefix : ipv6Prefix))
            return SpfMatch::match();
        return SpfMatch::noMatch();

    case SpfMechanismType::A: {
        server.countDnsInteractiveTerm(request);
        DnsPacket packet = lookupTarget(*this, server, request, addressType(ip));
        auto addrs = addressesOf(packet, addressType(ip));
        if (addrs.empty()) {
            server.countVoidDnsLookup(request);
            return SpfMatch::noMatch();
        }
        return anyInNetwork(addrs, *this, ip) ? SpfMatch::match() : SpfMatch::noMatch();
    }

    case SpfMechanismType::MX: {
        server.countDnsInteractiveTerm(request);
        DnsPacket packet = lookupTarget(*this, server, request, DnsRecordType::MX);
        auto mxs = packet.answersOfType(DnsRecordType::MX);
        if (mxs.empty()) {
            server.countVoidDnsLookup(request);
            return SpfMatch::noMatch();
        }
        // RFC 7208 4.6.4
        if (static_cast<int>(mxs.size()) > server.maxNameLookupsPerMxMech())
            throw SpfProcessingLimitExceededError(
                "Maximum name look-ups per MX mechanism limit ("
                + std::to_string(server.maxNameLookupsPerMxMech()) + ") exceeded");

        for (const auto* mx : mxs) {
            DnsPacket hosts = server.dnsLookup(mx->data, addressType(ip));
            if (anyInNetwork(addressesOf(hosts, addressType(ip)), *this, ip))
                return SpfMatch::match();
        }
        return SpfMatch::noMatch();
    }

    case SpfMechanismType::PTR: {
        server.countDnsInteractiveTerm(request);
        std::string domain = targetDomain(*this, server, request);
        auto names = ptrNames(server, ip);
        if (names.empty()) {
            server.countVoidDnsLookup(request);
            return SpfMatch::noMatch();
        }
        for (const auto& name : spfValidatedPtrNames(server, names, ip,
                                                     server.maxNameLookupsPerPtrMech())) {
            if (isAtOrBelow(name, domain))
                return SpfMatch::match();
        }
        return SpfMatch::noMatch();
    }

    case SpfMechanismType::EXISTS: {
        server.countDnsInteractiveTerm(request);
        // Always an A query, whatever the client address family.
        DnsPacket packet = lookupTarget(*this, server, request, DnsRecordType::A);
        if (packet.answersOfType(DnsRecordType::A).empty()) {
            server.countVoidDnsLookup(request);
            return SpfMatch::noMatch();
        }
        return SpfMatch::match();
    }

    case SpfMechanismType::INCLUDE: {
        server.countDnsInteractiveTerm(request);
        SpfRequest sub = request.newSubRequest(targetDomain(*this, server, request), true);
        SpfResult result = server.process(sub);

        // RFC 7208 5.2
        switch (result.code()) {
        case SpfResultCode::Pass:
            return SpfMatch::match();
        case SpfResultCode::Fail:
        case SpfResultCode::SoftFail:
        case SpfResultCode::Neutral:
            return SpfMatch::noMatch();
        case SpfResultCode::TempError:
            return SpfMatch::stop(server.makeResult(SpfResultCode::TempError, request,
                "Included domain '" + sub.authorityDomain() + "': " + result.text()));
        case SpfResultCode::PermError:
            return SpfMatch::stop(server.makeResult(SpfResultCode::PermError, request,
                "Included domain '" + sub.authorityDomain() + "': " + result.text()));
        case SpfResultCode::None:
            return SpfMatch::stop(server.makeResult(SpfResultCode::PermError, request,
                "Included domain '" + sub.authorityDomain() + "' has no applicable sender policy"));
        }
        return SpfMatch::noMatch();
    }
    }
    return SpfMatch::noMatch();
}
