#include "spf/spf_server.h"
#include "spf/spf_errors.h"
#include "spf/spf_parser.h"
#include "dns/dns_resolver.h"
#include "core/logger.h"

#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <climits>
#include <exception>
#include <functional>

const char* const SpfServer::DEFAULT_AUTHORITY_EXPLANATION =
    "Please see http://www.openspf.org/Why?s=%{_scope};id=%{S};ip=%{C};r=%{R}";

/* ===================== Construction ===================== */

static SpfMacroString explanationFrom(const std::variant<std::string, SpfMacroString>& v) {
    if (const auto* macro = std::get_if<SpfMacroString>(&v))
        return *macro;
    const std::string& text = std::get<std::string>(v);
    return SpfMacroString(text.empty() ? SpfServer::DEFAULT_AUTHORITY_EXPLANATION : text, true);
}

static std::string detectHostname() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        Logger::instance().log(LogLevel::Warn, "SPF: cannot determine hostname");
        return "";
    }
    return buf;
}

SpfServer::SpfServer(SpfServerConfig cfg)
    : defaultAuthorityExplanation_(explanationFrom(cfg.defaultAuthorityExplanation)),
      hostname_(cfg.hostname.empty() ? detectHostname() : cfg.hostname),
      dnsResolver_(cfg.dnsResolver ? cfg.dnsResolver : std::make_shared<SystemDnsResolver>()),
      queryRrTypes_(cfg.queryRrTypes),
      maxDnsInteractiveTerms_(cfg.maxDnsInteractiveTerms),
      maxNameLookupsPerTerm_(cfg.maxNameLookupsPerTerm),
      maxNameLookupsPerMxMech_(cfg.maxNameLookupsPerMxMech.value_or(cfg.maxNameLookupsPerTerm)),
      maxNameLookupsPerPtrMech_(cfg.maxNameLookupsPerPtrMech.value_or(cfg.maxNameLookupsPerTerm)),
      maxVoidDnsLookups_(cfg.maxVoidDnsLookups),
      spfTimeoutFallback_(cfg.spfTimeoutFallback) {}

SpfResult::GenericConstructor SpfServer::resultClass() const {
    return &SpfResult::create;
}

SpfResult::Constructor SpfServer::resultClass(const std::string& name) const {
    return SpfResult::factoryFor(name);
}

SpfResult SpfServer::makeResult(SpfResultCode code, const SpfRequest& request,
                                const std::string& text) const {
    return SpfResult::factoryFor(code)(*this, request, text);
}

/* ===================== Evaluation ===================== */

SpfResult SpfServer::process(SpfRequest& request) const {
    request.clearState("authority_explanation");
    if (request.isRootRequest())
        request.limits().reset();

    try {
        auto record = selectRecord(request);
        request.setRecord(record);
        SpfResult result = record->eval(*this, request);
        Logger::instance().log(LogLevel::Debug,
            "SPF: " + request.authorityDomain() + " -> " + result.name());
        return result;
    } catch (const SpfDnsError& e) {
        return resultClass("temperror")(*this, request, e.what());
    } catch (const SpfNoAcceptableRecordError& e) {
        return resultClass("none")(*this, request, e.what());
    } catch (const SpfRedundantAcceptableRecordsError& e) {
        return resultClass("permerror")(*this, request, e.what());
    } catch (const SpfSyntaxError& e) {
        return resultClass("permerror")(*this, request, e.what());
    } catch (const SpfProcessingLimitExceededError& e) {
        return resultClass("permerror")(*this, request, e.what());
    }
    // Anything else is a bug and is left to propagate.
}

std::shared_ptr<const SpfRecord> SpfServer::selectRecord(const SpfRequest& request) const {
    const std::string& domain = request.authorityDomain();
    const auto& versions = request.versions();
    SpfScope scope = request.scope();

    std::vector<std::shared_ptr<const SpfRecord>> records;
    size_t queryCount = 0;
    std::vector<std::exception_ptr> dnsErrors;

    auto query = [&](DnsRecordType type) {
        ++queryCount;
        try {
            DnsPacket packet = dnsLookup(domain, type);
            auto found = getAcceptableRecordsFromPacket(packet, type, versions, scope, domain);
            records.insert(records.end(), found.begin(), found.end());
        } catch (const SpfDnsTimeoutError&) {
            if (type == DnsRecordType::SPF && !spfTimeoutFallback_)
                throw;
            dnsErrors.push_back(std::current_exception());
        } catch (const SpfDnsError&) {
            dnsErrors.push_back(std::current_exception());
        }
    };

    // SPF-type RRs first, TXT only while nothing acceptable was found.
    if (queryRrTypes_ & SpfServerConfig::QUERY_RR_TYPE_SPF)
        query(DnsRecordType::SPF);

    // NOTE: departs from RFC 4406 4.4/3: TXT RRs are tried
    // even when SPF-type RRs exist but none applies, as RFC 4408 4.5 does.
    if (records.empty() && (queryRrTypes_ & SpfServerConfig::QUERY_RR_TYPE_TXT))
        query(DnsRecordType::TXT);

    // Unless at least one query succeeded, re-raise the first DNS error.
    if (queryCount > 0 && dnsErrors.size() == queryCount)
        std::rethrow_exception(dnsErrors.front());

    // RFC 4408 4.5/7
    if (records.empty())
        throw SpfNoAcceptableRecordError("No applicable sender policy available");

    // Discard all records but the highest acceptable version.
    const int preferred = records.front()->version();
    const std::string tag = records.front()->versionTag();
    records.erase(std::remove_if(records.begin(), records.end(),
        [preferred](const std::shared_ptr<const SpfRecord>& r) {
            return r->version() != preferred;
        }), records.end());

    // RFC 4408 4.5/6
    if (records.size() != 1)
        throw SpfRedundantAcceptableRecordsError(
            "Redundant applicable '" + tag + "' sender policies found");

    return records.front();
}

std::vector<std::shared_ptr<const SpfRecord>> SpfServer::getAcceptableRecordsFromPacket(
    const DnsPacket& packet,
    DnsRecordType rrType,
    const std::vector<int>& versions,
    SpfScope scope,
    const std::string& domain) const {

    // Try higher record versions first.
    std::vector<int> ordered = versions;
    std::sort(ordered.begin(), ordered.end(), std::greater<int>());

    std::vector<std::shared_ptr<const SpfRecord>> records;
    for (const auto* rr : packet.answersOfType(rrType)) {
        std::string text;
        for (const auto& s : rr->strings)
            text += s;

        std::shared_ptr<SpfRecord> record;
        for (int version : ordered) {
            try {
                record = SpfParser::parse(version, text);
                break;
            } catch (const SpfInvalidRecordVersionError&) {
                // Not this version (or not SPF at all); syntax errors in a
                // correctly tagged record propagate.
            }
        }

        if (!record)
            continue;
        if (record->coversScope(scope))
            records.push_back(record);
        else
            Logger::instance().log(LogLevel::Debug,
                "SPF: '" + record->versionTag() + "' record at " + domain
                + " does not cover scope " + spfScopeName(scope));
    }

    std::stable_sort(records.begin(), records.end(),
        [](const std::shared_ptr<const SpfRecord>& a, const std::shared_ptr<const SpfRecord>& b) {
            return a->version() > b->version();
        });
    return records;
}

/* ===================== DNS ===================== */

std::string SpfServer::canonicalizeDomain(const std::string& domain) {
    std::string d = domain;
    while (!d.empty() && d.back() == '.')
        d.pop_back();

    // Truncate overlong labels at 63 bytes (RFC 4408 8.1/27)
    std::string out;
    size_t start = 0;
    while (true) {
        size_t dot = d.find('.', start);
        std::string label = d.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (label.size() > 63)
            label.resize(63);
        out += label;
        if (dot == std::string::npos)
            break;
        out += '.';
        start = dot + 1;
    }

    // Drop labels from the head while longer than 253 bytes (RFC 4408 8.1/25)
    while (out.size() > 253) {
        size_t dot = out.find('.');
        if (dot == std::string::npos) {
            out.resize(253);
            break;
        }
        out.erase(0, dot + 1);
    }

    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return std::tolower(c); });
    // No trailing separator, whatever truncation left behind.
    while (!out.empty() && out.back() == '.')
        out.pop_back();
    return out;
}

DnsPacket SpfServer::dnsLookup(const std::string& domain, DnsRecordType type) const {
    const std::string name = canonicalizeDomain(domain);
    const std::string typeName = dnsRecordTypeName(type);
    Logger::instance().log(LogLevel::Debug, "SPF: DNS " + typeName + " " + name);

    DnsQueryResult r = dnsResolver_->query(name, type);

    // Raise unless a response with RCODE 0 or 3 (NXDOMAIN) was received;
    // NXDOMAIN is an acceptable but empty answer.
    if (r.status == DnsQueryStatus::Timeout)
        throw SpfDnsTimeoutError(
            "Time-out on DNS '" + typeName + "' lookup of '" + name + "'");

    if (r.status != DnsQueryStatus::Answered || !r.packet)
        throw SpfDnsError(
            "Unknown error on DNS '" + typeName + "' lookup of '" + name + "'");

    if (r.packet->rcode != DnsResponseCode::NoError &&
        r.packet->rcode != DnsResponseCode::NxDomain)
        throw SpfDnsError(
            "'" + dnsResponseCodeName(r.packet->rcode) + "' error on DNS '"
            + typeName + "' lookup of '" + name + "'");

    return *r.packet;
}

DnsPacket SpfServer::dnsLookup(const SpfMacroString& domain, const SpfRequest& request,
                               DnsRecordType type) const {
    return dnsLookup(domain.expand(*this, request), type);
}

/* ===================== Limits ===================== */

void SpfServer::countDnsInteractiveTerm(const SpfRequest& request) const {
    request.limits().countDnsInteractiveTerm(maxDnsInteractiveTerms_);
}

void SpfServer::countVoidDnsLookup(const SpfRequest& request) const {
    request.limits().countVoidDnsLookup(maxVoidDnsLookups_);
}
