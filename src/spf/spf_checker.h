#pragma once
#include <string>

#include "spf/auth_results.h"
#include "spf/spf_server.h"

/**
 * SMTP-facing wrapper around SpfServer: takes the values as seen on the
 * wire and returns a ready-to-stamp result.
 */
class SpfChecker {
public:
    explicit SpfChecker(const SpfServer& server) : server_(server) {}

    // MAIL FROM check; a null reverse path is checked as postmaster@<helo>.
    SpfCheckResult check(const std::string& ip,
                         const std::string& mailFrom,
                         const std::string& heloDomain) const;

    SpfCheckResult checkHelo(const std::string& ip,
                             const std::string& heloDomain) const;

private:
    SpfCheckResult run(const SpfRequestOptions& opts, SpfCheckResult res) const;

    const SpfServer& server_;
};
