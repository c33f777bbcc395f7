#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "spf/spf_macro.h"
#include "spf/spf_mechanism.h"
#include "spf/spf_request.h"
#include "spf/spf_result.h"

class SpfServer;

struct SpfTerms {
    std::vector<SpfMechanism> mechanisms;
    std::optional<SpfMacroString> redirect;
    std::optional<SpfMacroString> exp;
    std::vector<std::pair<std::string, std::string>> unknownModifiers;
};

// A parsed policy record. Instances come from SpfParser only.
class SpfRecord {
public:
    virtual ~SpfRecord() = default;

    virtual int version() const = 0;
    virtual std::string versionTag() const = 0;

    const std::string& text() const { return text_; }
    const std::vector<SpfScope>& scopes() const { return scopes_; }
    bool coversScope(SpfScope scope) const;

    const std::vector<SpfMechanism>& mechanisms() const { return terms_.mechanisms; }
    const std::optional<SpfMacroString>& redirect() const { return terms_.redirect; }
    const std::optional<SpfMacroString>& exp() const { return terms_.exp; }
    const std::vector<std::pair<std::string, std::string>>& unknownModifiers() const {
        return terms_.unknownModifiers;
    }

    // check_host() body (RFC 7208 4.6). Limit, DNS and macro failures are
    // thrown and turned into verdicts by SpfServer::process().
    SpfResult eval(const SpfServer& server, SpfRequest& request) const;

protected:
    SpfRecord(std::string text, std::vector<SpfScope> scopes, SpfTerms terms);

private:
    void evalExplanation(const SpfServer& server, SpfRequest& request) const;

    std::string text_;
    std::vector<SpfScope> scopes_;
    SpfTerms terms_;
};

class SpfRecordV1 final : public SpfRecord {
public:
    SpfRecordV1(std::string text, SpfTerms terms);

    int version() const override { return 1; }
    std::string versionTag() const override { return "v=spf1"; }
};

class SpfRecordV2 final : public SpfRecord {
public:
    SpfRecordV2(std::string text, std::vector<SpfScope> scopes, SpfTerms terms);

    int version() const override { return 2; }
    std::string versionTag() const override { return "spf2.0"; }
};
