#include "spf/spf_record.h"
#include "spf/spf_errors.h"
#include "spf/spf_server.h"
#include "core/logger.h"

#include <algorithm>

SpfRecord::SpfRecord(std::string text, std::vector<SpfScope> scopes, SpfTerms terms)
    : text_(std::move(text)), scopes_(std::move(scopes)), terms_(std::move(terms)) {}

SpfRecordV1::SpfRecordV1(std::string text, SpfTerms terms)
    : SpfRecord(std::move(text), {SpfScope::Helo, SpfScope::MFrom}, std::move(terms)) {}

SpfRecordV2::SpfRecordV2(std::string text, std::vector<SpfScope> scopes, SpfTerms terms)
    : SpfRecord(std::move(text), std::move(scopes), std::move(terms)) {}

bool SpfRecord::coversScope(SpfScope scope) const {
    return std::find(scopes_.begin(), scopes_.end(), scope) != scopes_.end();
}

SpfResult SpfRecord::eval(const SpfServer& server, SpfRequest& request) const {
    for (const auto& mech : terms_.mechanisms) {
        SpfMatch m = mech.match(server, request);
        if (m.terminal)
            return *m.terminal;
        if (!m.matched)
            continue;

        SpfResultCode code = spfResultCodeFor(mech.qualifier);
        if (code == SpfResultCode::Fail && !request.isWithinInclude())
            evalExplanation(server, request);
        return server.makeResult(code, request, "Mechanism '" + mech.text + "' matched");
    }

    if (terms_.redirect) {
        server.countDnsInteractiveTerm(request);
        SpfRequest sub = request.newSubRequest(terms_.redirect->expand(server, request));
        SpfResult result = server.process(sub);
        // RFC 7208 6.1
        if (result.is(SpfResultCode::None))
            return server.makeResult(SpfResultCode::PermError, request,
                "Redirect domain '" + sub.authorityDomain() + "' has no applicable sender policy");
        return result;
    }

    return server.makeResult(SpfResultCode::Neutral, request,
                             "Default neutral result due to no mechanism matches");
}

// RFC 7208 6.2: problems with the explanation never change the result, the
// default explanation is used instead.
void SpfRecord::evalExplanation(const SpfServer& server, SpfRequest& request) const {
    if (!terms_.exp)
        return;

    try {
        DnsPacket packet = server.dnsLookup(*terms_.exp, request, DnsRecordType::TXT);
        auto txts = packet.answersOfType(DnsRecordType::TXT);
        if (txts.size() != 1) {
            Logger::instance().log(LogLevel::Debug,
                "SPF: expected one explanation TXT for '" + terms_.exp->text() + "', got "
                + std::to_string(txts.size()));
            return;
        }

        std::string text;
        for (const auto& s : txts.front()->strings)
            text += s;
        request.setState("authority_explanation",
                         SpfMacroString(text, true).expand(server, request));
    } catch (const SpfError& ex) {
        Logger::instance().log(LogLevel::Debug,
            std::string("SPF: ignoring explanation: ") + ex.what());
    }
}
