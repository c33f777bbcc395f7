#pragma once
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "dns/i_dns_resolver.h"
#include "spf/spf_macro.h"
#include "spf/spf_record.h"
#include "spf/spf_request.h"
#include "spf/spf_result.h"

struct SpfServerConfig {
    static constexpr unsigned QUERY_RR_TYPE_NONE = 0;
    static constexpr unsigned QUERY_RR_TYPE_TXT  = 1;
    static constexpr unsigned QUERY_RR_TYPE_SPF  = 2;
    static constexpr unsigned QUERY_RR_TYPE_ALL  = QUERY_RR_TYPE_TXT | QUERY_RR_TYPE_SPF;

    // Plain text is wrapped into an explanation macro string.
    std::variant<std::string, SpfMacroString> defaultAuthorityExplanation;
    std::string hostname;                          // empty: gethostname()
    std::shared_ptr<IDnsResolver> dnsResolver;     // null: SystemDnsResolver
    unsigned queryRrTypes = QUERY_RR_TYPE_TXT;
    int maxDnsInteractiveTerms = 10;               // RFC 4408 10.1/6
    int maxNameLookupsPerTerm = 10;                // RFC 4408 10.1/7
    std::optional<int> maxNameLookupsPerMxMech;    // default: per term
    std::optional<int> maxNameLookupsPerPtrMech;   // default: per term
    int maxVoidDnsLookups = 2;                     // RFC 7208 4.6.4
    // A timeout on the SPF-type query still falls back to TXT when set;
    // otherwise it ends the evaluation with temperror right away.
    bool spfTimeoutFallback = true;
};

/**
 * Evaluation engine. Immutable after construction; process() and the other
 * const members may be called from several threads at once as long as the
 * DNS resolver allows it.
 */
class SpfServer {
public:
    static const char* const DEFAULT_AUTHORITY_EXPLANATION;

    explicit SpfServer(SpfServerConfig cfg = {});

    // Full evaluation of one request; every SpfError becomes a verdict,
    // anything else propagates.
    SpfResult process(SpfRequest& request) const;

    std::shared_ptr<const SpfRecord> selectRecord(const SpfRequest& request) const;

    std::vector<std::shared_ptr<const SpfRecord>> getAcceptableRecordsFromPacket(
        const DnsPacket& packet,
        DnsRecordType rrType,
        const std::vector<int>& versions,
        SpfScope scope,
        const std::string& domain) const;

    // Canonicalizes, queries, and classifies: timeout -> SpfDnsTimeoutError,
    // no response or an rcode other than NOERROR/NXDOMAIN -> SpfDnsError.
    DnsPacket dnsLookup(const std::string& domain, DnsRecordType type) const;
    DnsPacket dnsLookup(const SpfMacroString& domain, const SpfRequest& request,
                        DnsRecordType type) const;

    static std::string canonicalizeDomain(const std::string& domain);

    void countDnsInteractiveTerm(const SpfRequest& request) const;
    void countVoidDnsLookup(const SpfRequest& request) const;

    SpfResult::GenericConstructor resultClass() const;
    SpfResult::Constructor resultClass(const std::string& name) const;
    SpfResult makeResult(SpfResultCode code, const SpfRequest& request,
                         const std::string& text) const;

    const std::string& hostname() const { return hostname_; }
    const SpfMacroString& defaultAuthorityExplanation() const { return defaultAuthorityExplanation_; }
    unsigned queryRrTypes() const { return queryRrTypes_; }
    int maxDnsInteractiveTerms() const { return maxDnsInteractiveTerms_; }
    int maxNameLookupsPerTerm() const { return maxNameLookupsPerTerm_; }
    int maxNameLookupsPerMxMech() const { return maxNameLookupsPerMxMech_; }
    int maxNameLookupsPerPtrMech() const { return maxNameLookupsPerPtrMech_; }
    int maxVoidDnsLookups() const { return maxVoidDnsLookups_; }
    bool spfTimeoutFallback() const { return spfTimeoutFallback_; }

private:
    const SpfMacroString defaultAuthorityExplanation_;
    const std::string hostname_;
    const std::shared_ptr<IDnsResolver> dnsResolver_;
    const unsigned queryRrTypes_;
    const int maxDnsInteractiveTerms_;
    const int maxNameLookupsPerTerm_;
    const int maxNameLookupsPerMxMech_;
    const int maxNameLookupsPerPtrMech_;
    const int maxVoidDnsLookups_;
    const bool spfTimeoutFallback_;
};
