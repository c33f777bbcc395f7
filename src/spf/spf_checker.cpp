#include "spf_checker.h"
#include "core/logger.h"

#include <stdexcept>

static std::string strip(const std::string& s) {
    if (s.size() >= 2 && s.front() == '<' && s.back() == '>')
        return s.substr(1, s.size() - 2);
    return s;
}

SpfCheckResult SpfChecker::check(const std::string& ip,
                                 const std::string& mailFrom,
                                 const std::string& heloDomain) const {
    SpfCheckResult res;
    res.smtpMailFrom = strip(mailFrom);
    res.smtpHelo = heloDomain;

    SpfRequestOptions opts;
    opts.scope = SpfScope::MFrom;
    opts.identity = res.smtpMailFrom.empty()
                  ? "postmaster@" + heloDomain
                  : res.smtpMailFrom;
    opts.ipAddress = ip;
    opts.heloIdentity = heloDomain;

    return run(opts, res);
}

SpfCheckResult SpfChecker::checkHelo(const std::string& ip,
                                     const std::string& heloDomain) const {
    SpfCheckResult res;
    res.smtpHelo = heloDomain;

    SpfRequestOptions opts;
    opts.scope = SpfScope::Helo;
    opts.identity = heloDomain;
    opts.ipAddress = ip;
    opts.heloIdentity = heloDomain;

    return run(opts, res);
}

SpfCheckResult SpfChecker::run(const SpfRequestOptions& opts, SpfCheckResult res) const {
    try {
        SpfRequest request(opts);
        SpfResult r = server_.process(request);

        res.result = r.code();
        res.receivedSpf = r.receivedSpfHeader();
        res.explanation = r.authorityExplanation();
        if (r.is(SpfResultCode::TempError) || r.is(SpfResultCode::PermError)
            || r.is(SpfResultCode::None))
            res.problem = r.text();
    } catch (const std::invalid_argument& e) {
        // No usable identity or client address: nothing to check (RFC 7208 4.3)
        Logger::instance().log(LogLevel::Warn,
            std::string("SPF: request rejected: ") + e.what());
        res.result = SpfResultCode::None;
        res.problem = e.what();
    }

    Logger::instance().log(LogLevel::Info,
        "SPF: " + spfResultCodeName(res.result) + " for "
        + (opts.scope == SpfScope::Helo ? "helo " : "mailfrom ") + opts.identity
        + " from " + opts.ipAddress);
    return res;
}
