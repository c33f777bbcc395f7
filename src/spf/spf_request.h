#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "spf/spf_ip_address.h"
#include "spf/spf_limit_tracker.h"

class SpfRecord;

enum class SpfScope { Helo, MFrom, Pra };

std::string spfScopeName(SpfScope scope);
// Throws std::invalid_argument for anything but helo/mfrom/pra.
SpfScope spfScopeFromName(const std::string& name);

struct SpfRequestOptions {
    std::vector<int> versions;     // empty: every version supporting the scope
    SpfScope scope = SpfScope::MFrom;
    std::string identity;          // MAIL FROM address, HELO name or PRA
    std::string ipAddress;
    std::string heloIdentity;      // optional; defaults to identity for helo
    std::string authorityDomain;   // optional; defaults to identity's domain
};

/**
 * One check_host() invocation. A root request owns the limit tracker of its
 * evaluation tree; newSubRequest() hands the same tracker down. Requests are
 * neither copyable nor movable, so two top-level requests never share one.
 *
 * Throws std::invalid_argument for an unusable identity, IP address, scope
 * or version list.
 */
class SpfRequest {
public:
    explicit SpfRequest(const SpfRequestOptions& opts);

    SpfRequest(const SpfRequest&) = delete;
    SpfRequest& operator=(const SpfRequest&) = delete;
    SpfRequest(SpfRequest&&) = delete;
    SpfRequest& operator=(SpfRequest&&) = delete;

    // viaInclude marks the subtree of an include: mechanism, whose fail
    // results never surface and so need no explanation.
    SpfRequest newSubRequest(const std::string& authorityDomain,
                             bool viaInclude = false) const;

    const std::vector<int>& versions() const { return versions_; }
    SpfScope scope() const { return scope_; }
    const std::string& identity() const { return identity_; }
    const std::string& localpart() const { return localpart_; }
    const std::string& domain() const { return domain_; }
    // localpart@domain, the s macro
    std::string sender() const { return localpart_ + "@" + domain_; }
    const SpfIpAddress& ipAddress() const { return ipAddress_; }
    const std::string& heloIdentity() const { return heloIdentity_; }
    const std::string& authorityDomain() const { return authorityDomain_; }

    bool isRootRequest() const { return depth_ == 0; }
    int depth() const { return depth_; }
    bool isWithinInclude() const { return withinInclude_; }

    SpfLimitTracker& limits() const { return *limits_; }
    const std::shared_ptr<SpfLimitTracker>& sharedLimits() const { return limits_; }

    // Keyed per-request state.
    std::string state(const std::string& key, const std::string& def = "") const;
    bool hasState(const std::string& key) const;
    void setState(const std::string& key, const std::string& value);
    void clearState(const std::string& key);

    // Single assignment: a second call throws std::logic_error.
    void setRecord(std::shared_ptr<const SpfRecord> record);
    const std::shared_ptr<const SpfRecord>& record() const { return record_; }

private:
    SpfRequest(const SpfRequest& parent, const std::string& authorityDomain,
               bool viaInclude);

    std::vector<int> versions_;
    SpfScope scope_;
    std::string identity_;
    std::string localpart_;
    std::string domain_;
    SpfIpAddress ipAddress_;
    std::string heloIdentity_;
    std::string authorityDomain_;

    int depth_ = 0;
    bool withinInclude_ = false;
    std::shared_ptr<SpfLimitTracker> limits_;

    std::map<std::string, std::string> state_;
    std::shared_ptr<const SpfRecord> record_;
};
