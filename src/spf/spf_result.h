#pragma once
#include <string>

#include "spf/spf_request.h"

class SpfServer;

enum class SpfResultCode {
    Pass, Fail, SoftFail, Neutral, None, TempError, PermError
};

std::string spfResultCodeName(SpfResultCode code);
// Throws std::invalid_argument for an unknown name.
SpfResultCode spfResultCodeFromName(const std::string& name);

/**
 * Verdict of one check_host() evaluation. Copies what it needs from the
 * request so it can outlive it. Fail results carry the authority
 * explanation: the expanded exp= text when the record supplied one,
 * otherwise the server's default explanation.
 */
class SpfResult {
public:
    using Constructor = SpfResult (*)(const SpfServer&, const SpfRequest&, const std::string&);
    using GenericConstructor =
        SpfResult (*)(SpfResultCode, const SpfServer&, const SpfRequest&, const std::string&);

    static SpfResult create(SpfResultCode code,
                            const SpfServer& server,
                            const SpfRequest& request,
                            const std::string& text);

    // Fixed table, one constructor per code.
    static Constructor factoryFor(SpfResultCode code);
    static Constructor factoryFor(const std::string& name);

    SpfResultCode code() const { return code_; }
    std::string name() const { return spfResultCodeName(code_); }
    bool is(SpfResultCode code) const { return code_ == code; }
    const std::string& text() const { return text_; }

    SpfScope scope() const { return scope_; }
    const std::string& identity() const { return identity_; }
    const std::string& sender() const { return sender_; }
    const std::string& clientIp() const { return clientIp_; }
    const std::string& heloIdentity() const { return helo_; }
    const std::string& authorityDomain() const { return authorityDomain_; }
    const std::string& receiver() const { return receiver_; }
    const std::string& authorityExplanation() const { return authorityExplanation_; }

    std::string localExplanation() const;
    std::string receivedSpfHeader() const;

private:
    SpfResult(SpfResultCode code, const SpfServer& server,
              const SpfRequest& request, std::string text);

    template <SpfResultCode C>
    static SpfResult make(const SpfServer& server, const SpfRequest& request,
                          const std::string& text) {
        return SpfResult(C, server, request, text);
    }

    SpfResultCode code_;
    std::string text_;
    SpfScope scope_;
    std::string identity_;
    std::string sender_;
    std::string clientIp_;
    std::string helo_;
    std::string authorityDomain_;
    std::string receiver_;
    std::string authorityExplanation_;
};
