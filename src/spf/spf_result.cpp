#include "spf/spf_result.h"
#include "spf/spf_errors.h"
#include "spf/spf_server.h"
#include "core/logger.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

struct ResultEntry {
    SpfResultCode code;
    const char* name;
};

const ResultEntry kResultNames[] = {
    {SpfResultCode::Pass,      "pass"},
    {SpfResultCode::Fail,      "fail"},
    {SpfResultCode::SoftFail,  "softfail"},
    {SpfResultCode::Neutral,   "neutral"},
    {SpfResultCode::None,      "none"},
    {SpfResultCode::TempError, "temperror"},
    {SpfResultCode::PermError, "permerror"},
};

// RFC 5322 atext plus '.', not starting or ending with a dot.
bool isDotAtom(const std::string& s) {
    if (s.empty() || s.front() == '.' || s.back() == '.')
        return false;
    static const std::string specials = "!#$%&'*+-/=?^_`{|}~.";
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || specials.find(static_cast<char>(c)) != std::string::npos;
    });
}

std::string headerValue(const std::string& s) {
    if (isDotAtom(s))
        return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

std::string headerIdentityName(SpfScope scope) {
    switch (scope) {
        case SpfScope::Helo:  return "helo";
        case SpfScope::MFrom: return "mailfrom";
        case SpfScope::Pra:   return "pra";
    }
    return "unknown";
}

} // namespace

std::string spfResultCodeName(SpfResultCode code) {
    for (const auto& e : kResultNames)
        if (e.code == code) return e.name;
    return "unknown";
}

SpfResultCode spfResultCodeFromName(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
        [](unsigned char c) { return std::tolower(c); });
    for (const auto& e : kResultNames)
        if (n == e.name) return e.code;
    throw std::invalid_argument("Unknown result name '" + name + "'");
}

/* ===================== Factories ===================== */

SpfResult SpfResult::create(SpfResultCode code, const SpfServer& server,
                            const SpfRequest& request, const std::string& text) {
    return factoryFor(code)(server, request, text);
}

SpfResult::Constructor SpfResult::factoryFor(SpfResultCode code) {
    static const Constructor table[] = {
        &SpfResult::make<SpfResultCode::Pass>,
        &SpfResult::make<SpfResultCode::Fail>,
        &SpfResult::make<SpfResultCode::SoftFail>,
        &SpfResult::make<SpfResultCode::Neutral>,
        &SpfResult::make<SpfResultCode::None>,
        &SpfResult::make<SpfResultCode::TempError>,
        &SpfResult::make<SpfResultCode::PermError>,
    };
    return table[static_cast<size_t>(code)];
}

SpfResult::Constructor SpfResult::factoryFor(const std::string& name) {
    return factoryFor(spfResultCodeFromName(name));
}

SpfResult::SpfResult(SpfResultCode code, const SpfServer& server,
                     const SpfRequest& request, std::string text)
    : code_(code),
      text_(std::move(text)),
      scope_(request.scope()),
      identity_(request.identity()),
      sender_(request.sender()),
      clientIp_(request.ipAddress().toString()),
      helo_(request.heloIdentity()),
      authorityDomain_(request.authorityDomain()),
      receiver_(server.hostname()) {
    if (code_ != SpfResultCode::Fail || request.isWithinInclude())
        return;

    if (request.hasState("authority_explanation")) {
        authorityExplanation_ = request.state("authority_explanation");
        return;
    }
    try {
        authorityExplanation_ = server.defaultAuthorityExplanation().expand(server, request);
    } catch (const SpfError& ex) {
        Logger::instance().log(LogLevel::Warn,
            std::string("SPF: cannot expand default explanation: ") + ex.what());
    }
}

/* ===================== Rendering ===================== */

std::string SpfResult::localExplanation() const {
    const std::string who = clientIp_;
    const std::string what = "'" + identity_ + "' in '" + spfScopeName(scope_) + "' identity";

    std::string text;
    switch (code_) {
        case SpfResultCode::Pass:
            text = who + " is authorized to use " + what;
            break;
        case SpfResultCode::Fail:
            text = who + " is not authorized to use " + what;
            break;
        case SpfResultCode::SoftFail:
            text = who + " is not authorized to use " + what
                 + ", however domain is not currently prepared for false failures";
            break;
        case SpfResultCode::Neutral:
            text = "Domain does not state whether sender is authorized to use " + what;
            break;
        default:
            text = text_;
            break;
    }
    return authorityDomain_ + ": " + text;
}

std::string SpfResult::receivedSpfHeader() const {
    std::string h = "Received-SPF: " + name();
    h += " (" + (receiver_.empty() ? std::string("unknown") : receiver_)
       + ": " + localExplanation() + ")";

    if (!receiver_.empty())
        h += " receiver=" + headerValue(receiver_) + ";";
    h += " identity=" + headerIdentityName(scope_) + ";";
    if (scope_ != SpfScope::Helo)
        h += " envelope-from=" + headerValue(sender_) + ";";
    if (!helo_.empty())
        h += " helo=" + headerValue(helo_) + ";";
    h += " client-ip=" + clientIp_;

    if (code_ == SpfResultCode::TempError || code_ == SpfResultCode::PermError)
        h += "; problem=" + headerValue(text_);
    return h;
}
