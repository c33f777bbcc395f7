#include "spf/spf_macro.h"
#include "spf/spf_errors.h"
#include "spf/spf_mechanism.h"
#include "spf/spf_request.h"
#include "spf/spf_server.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <vector>

namespace {

struct MacroPiece {
    bool isMacro = false;
    std::string literal;
    std::string letter;        // "s", "l", ... or "_scope"
    bool urlEscape = false;
    int keep = 0;              // rightmost parts to keep, 0: all
    bool reverse = false;
    std::string delimiters;
};

const std::string MACRO_LETTERS = "slodipvh";
const std::string EXPLANATION_LETTERS = "crt";
const std::string DELIMITERS = ".-+,/_=";

MacroPiece parseMacro(const std::string& body, bool isExplanation,
                      const std::string& text) {
    MacroPiece p;
    p.isMacro = true;
    size_t pos = 0;

    if (body.compare(0, 6, "_scope") == 0) {
        p.letter = "_scope";
        pos = 6;
    } else {
        if (body.empty())
            throw SpfSyntaxError("Empty macro in '" + text + "'");
        unsigned char l = static_cast<unsigned char>(body[0]);
        char lower = static_cast<char>(std::tolower(l));
        if (MACRO_LETTERS.find(lower) == std::string::npos) {
            if (EXPLANATION_LETTERS.find(lower) == std::string::npos)
                throw SpfSyntaxError("Unknown macro '%{" + body + "}' in '" + text + "'");
            if (!isExplanation)
                throw SpfSyntaxError("Macro '%{" + body + "}' is only allowed in explanations");
        }
        p.letter = std::string(1, lower);
        p.urlEscape = std::isupper(l) != 0;
        pos = 1;
    }

    size_t digits = pos;
    while (pos < body.size() && std::isdigit(static_cast<unsigned char>(body[pos]))) {
        if (p.keep < 1000)
            p.keep = p.keep * 10 + (body[pos] - '0');
        ++pos;
    }
    if (pos > digits && p.keep == 0)
        throw SpfSyntaxError("Zero transformer in macro '%{" + body + "}'");

    if (pos < body.size() && (body[pos] == 'r' || body[pos] == 'R')) {
        p.reverse = true;
        ++pos;
    }

    while (pos < body.size()) {
        char d = body[pos++];
        if (DELIMITERS.find(d) == std::string::npos)
            throw SpfSyntaxError("Invalid delimiter in macro '%{" + body + "}'");
        p.delimiters += d;
    }
    return p;
}

std::vector<MacroPiece> tokenize(const std::string& text, bool isExplanation) {
    std::vector<MacroPiece> out;
    std::string literal;

    auto flush = [&]() {
        if (literal.empty()) return;
        MacroPiece p;
        p.literal = literal;
        out.push_back(p);
        literal.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c != '%') {
            literal += c;
            continue;
        }
        if (i + 1 >= text.size())
            throw SpfSyntaxError("Unterminated macro in '" + text + "'");

        char n = text[++i];
        if (n == '%') { literal += '%'; continue; }
        if (n == '_') { literal += ' '; continue; }
        if (n == '-') { literal += "%20"; continue; }
        if (n != '{')
            throw SpfSyntaxError(std::string("Invalid macro escape '%") + n + "' in '" + text + "'");

        size_t close = text.find('}', i + 1);
        if (close == std::string::npos)
            throw SpfSyntaxError("Unterminated macro in '" + text + "'");

        flush();
        out.push_back(parseMacro(text.substr(i + 1, close - i - 1), isExplanation, text));
        i = close;
    }
    flush();
    return out;
}

std::string macroValue(const MacroPiece& p, const SpfServer& server,
                       const SpfRequest& request) {
    const std::string& l = p.letter;
    if (l == "s") return request.sender();
    if (l == "l") return request.localpart();
    if (l == "o") return request.domain();
    if (l == "d") return request.authorityDomain();
    if (l == "i") return request.ipAddress().toMacroString();
    if (l == "p") return spfValidatedDomainName(server, request);
    if (l == "v") return request.ipAddress().isV6() ? "ip6" : "in-addr";
    if (l == "h") return request.heloIdentity().empty() ? "unknown" : request.heloIdentity();
    if (l == "c") return request.ipAddress().toString();
    if (l == "r") return server.hostname().empty() ? "unknown" : server.hostname();
    if (l == "t") return std::to_string(static_cast<long long>(std::time(nullptr)));
    return spfScopeName(request.scope());
}

std::string applyTransformers(const std::string& value, const MacroPiece& p) {
    if (p.keep == 0 && !p.reverse && p.delimiters.empty())
        return value;

    const std::string& delims = p.delimiters.empty() ? "." : p.delimiters;
    std::vector<std::string> parts;
    std::string cur;
    for (char c : value) {
        if (delims.find(c) != std::string::npos) {
            parts.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    parts.push_back(cur);

    if (p.reverse)
        std::reverse(parts.begin(), parts.end());

    if (p.keep > 0 && static_cast<size_t>(p.keep) < parts.size())
        parts.erase(parts.begin(), parts.end() - p.keep);

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += '.';
        out += parts[i];
    }
    return out;
}

// RFC 3986 unreserved characters stay, everything else becomes %XX.
std::string urlEscape(const std::string& s) {
    static const char HEX[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0f];
        }
    }
    return out;
}

} // namespace

SpfMacroString::SpfMacroString(std::string text, bool isExplanation)
    : text_(std::move(text)), isExplanation_(isExplanation) {}

bool SpfMacroString::hasMacros() const {
    return text_.find('%') != std::string::npos;
}

void SpfMacroString::validate() const {
    tokenize(text_, isExplanation_);
}

std::string SpfMacroString::expand(const SpfServer& server,
                                   const SpfRequest& request) const {
    if (!hasMacros())
        return text_;

    std::string out;
    for (const auto& p : tokenize(text_, isExplanation_)) {
        if (!p.isMacro) {
            out += p.literal;
            continue;
        }
        std::string value = applyTransformers(macroValue(p, server, request), p);
        out += p.urlEscape ? urlEscape(value) : value;
    }
    return out;
}
