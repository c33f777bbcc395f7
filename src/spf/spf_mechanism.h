#pragma once
#include <optional>
#include <string>
#include <vector>

#include "spf/spf_ip_address.h"
#include "spf/spf_macro.h"
#include "spf/spf_request.h"
#include "spf/spf_result.h"

class SpfServer;

enum class SpfQualifier {
    Plus, Minus, Tilde, Question
};

enum class SpfMechanismType {
    IP4, IP6, A, MX, PTR, INCLUDE, EXISTS, ALL
};

SpfResultCode spfResultCodeFor(SpfQualifier qualifier);

// Outcome of one mechanism: go on with the next term, stop with the
// mechanism's qualifier, or stop with a result of its own (include).
struct SpfMatch {
    bool matched = false;
    std::optional<SpfResult> terminal;

    static SpfMatch noMatch() { return SpfMatch{}; }
    static SpfMatch match() { return SpfMatch{true, std::nullopt}; }
    static SpfMatch stop(SpfResult result) { return SpfMatch{false, std::move(result)}; }
};

struct SpfMechanism {
    SpfQualifier qualifier = SpfQualifier::Plus;
    SpfMechanismType type = SpfMechanismType::ALL;
    std::optional<SpfMacroString> domainSpec;
    std::optional<SpfIpAddress> network;   // ip4 / ip6
    int ipv4Prefix = 32;
    int ipv6Prefix = 128;
    std::string text;                      // as written, for messages

    // May throw SpfDnsError, SpfProcessingLimitExceededError, SpfSyntaxError.
    SpfMatch match(const SpfServer& server, SpfRequest& request) const;
};

// PTR names of the client address that resolve back to it (RFC 7208 5.5),
// at most maxNames of them are tried.
std::vector<std::string> spfValidatedPtrNames(const SpfServer& server,
                                              const std::vector<std::string>& names,
                                              const SpfIpAddress& ip,
                                              int maxNames);

// Value of the p macro; "unknown" when nothing validates.
std::string spfValidatedDomainName(const SpfServer& server, const SpfRequest& request);
