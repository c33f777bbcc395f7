#include "spf/spf_request.h"
#include "spf/spf_parser.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

std::string spfScopeName(SpfScope scope) {
    switch (scope) {
        case SpfScope::Helo:  return "helo";
        case SpfScope::MFrom: return "mfrom";
        case SpfScope::Pra:   return "pra";
    }
    return "unknown";
}

SpfScope spfScopeFromName(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
        [](unsigned char c) { return std::tolower(c); });
    if (n == "helo")  return SpfScope::Helo;
    if (n == "mfrom") return SpfScope::MFrom;
    if (n == "pra")   return SpfScope::Pra;
    throw std::invalid_argument("Invalid scope '" + name + "'");
}

static SpfIpAddress parseClientIp(const std::string& text) {
    auto ip = SpfIpAddress::parse(text);
    if (!ip)
        throw std::invalid_argument("Invalid IP address '" + text + "'");
    return *ip;
}

SpfRequest::SpfRequest(const SpfRequestOptions& opts)
    : scope_(opts.scope),
      identity_(opts.identity),
      ipAddress_(parseClientIp(opts.ipAddress)),
      heloIdentity_(opts.heloIdentity),
      limits_(std::make_shared<SpfLimitTracker>()) {
    if (identity_.empty())
        throw std::invalid_argument("Missing required identity");

    if (scope_ == SpfScope::Helo) {
        localpart_ = "postmaster";
        domain_ = identity_;
        if (heloIdentity_.empty())
            heloIdentity_ = identity_;
    } else {
        auto at = identity_.rfind('@');
        if (at == std::string::npos) {
            localpart_ = "postmaster";
            domain_ = identity_;
        } else {
            localpart_ = at > 0 ? identity_.substr(0, at) : "postmaster";
            domain_ = identity_.substr(at + 1);
        }
    }
    if (domain_.empty())
        throw std::invalid_argument("Identity '" + identity_ + "' has no domain");

    const std::vector<int> requested = opts.versions.empty()
        ? SpfParser::supportedVersions()
        : opts.versions;
    for (int v : requested) {
        if (!SpfParser::isSupportedVersion(v))
            throw std::invalid_argument("Invalid version '" + std::to_string(v) + "'");
        if (SpfParser::versionSupportsScope(v, scope_)
            && std::find(versions_.begin(), versions_.end(), v) == versions_.end())
            versions_.push_back(v);
    }
    if (versions_.empty())
        throw std::invalid_argument("Invalid scope '" + spfScopeName(scope_)
                                    + "' for the requested versions");

    authorityDomain_ = opts.authorityDomain.empty() ? domain_ : opts.authorityDomain;
}

SpfRequest::SpfRequest(const SpfRequest& parent, const std::string& authorityDomain,
                       bool viaInclude)
    : versions_(parent.versions_),
      scope_(parent.scope_),
      identity_(parent.identity_),
      localpart_(parent.localpart_),
      domain_(parent.domain_),
      ipAddress_(parent.ipAddress_),
      heloIdentity_(parent.heloIdentity_),
      authorityDomain_(authorityDomain),
      depth_(parent.depth_ + 1),
      withinInclude_(parent.withinInclude_ || viaInclude),
      limits_(parent.limits_) {}

SpfRequest SpfRequest::newSubRequest(const std::string& authorityDomain,
                                     bool viaInclude) const {
    return SpfRequest(*this, authorityDomain, viaInclude);
}

std::string SpfRequest::state(const std::string& key, const std::string& def) const {
    auto it = state_.find(key);
    return it == state_.end() ? def : it->second;
}

bool SpfRequest::hasState(const std::string& key) const {
    return state_.count(key) > 0;
}

void SpfRequest::setState(const std::string& key, const std::string& value) {
    state_[key] = value;
}

void SpfRequest::clearState(const std::string& key) {
    state_.erase(key);
}

void SpfRequest::setRecord(std::shared_ptr<const SpfRecord> record) {
    if (record_)
        throw std::logic_error("Record already set on request for '" + authorityDomain_ + "'");
    record_ = std::move(record);
}
