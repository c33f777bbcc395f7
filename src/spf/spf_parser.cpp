#include "spf_parser.h"
#include "spf/spf_errors.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

/* ===================== Helpers ===================== */

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return s;
}

static bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
}

static SpfQualifier parseQualifier(char c) {
    switch (c) {
        case '+': return SpfQualifier::Plus;
        case '-': return SpfQualifier::Minus;
        case '~': return SpfQualifier::Tilde;
        case '?': return SpfQualifier::Question;
        default:  return SpfQualifier::Plus;
    }
}

static SpfMacroString parseDomainSpec(const std::string& spec, const std::string& term) {
    if (spec.empty())
        throw SpfSyntaxError("Missing domain-spec in term '" + term + "'");
    SpfMacroString m(spec);
    m.validate();
    return m;
}

static int parseCidrLength(const std::string& s, int max, const std::string& term) {
    bool digits = !s.empty() && s.size() <= 3
        && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
    if (!digits || (s.size() > 1 && s[0] == '0'))
        throw SpfSyntaxError("Invalid CIDR prefix length in term '" + term + "'");
    int v = std::stoi(s);
    if (v > max)
        throw SpfSyntaxError("Invalid CIDR prefix length in term '" + term + "'");
    return v;
}

// First '/' that is not part of a %{...} macro.
static size_t cidrStart(const std::string& s) {
    bool inMacro = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 1 < s.size() && s[i + 1] == '{') inMacro = true;
        else if (s[i] == '}') inMacro = false;
        else if (s[i] == '/' && !inMacro) return i;
    }
    return std::string::npos;
}

// "/24", "//64" or "/24//64"
static void parseDualCidr(const std::string& s, SpfMechanism& mech) {
    if (s.empty()) return;
    if (s.compare(0, 2, "//") == 0) {
        mech.ipv6Prefix = parseCidrLength(s.substr(2), 128, mech.text);
        return;
    }
    size_t dbl = s.find("//");
    mech.ipv4Prefix = parseCidrLength(
        s.substr(1, dbl == std::string::npos ? std::string::npos : dbl - 1), 32, mech.text);
    if (dbl != std::string::npos)
        mech.ipv6Prefix = parseCidrLength(s.substr(dbl + 2), 128, mech.text);
}

static void parseIpNetwork(const std::string& rest, bool v6, SpfMechanism& mech) {
    if (rest.size() < 2 || rest[0] != ':')
        throw SpfSyntaxError("Missing network address in term '" + mech.text + "'");

    std::string arg = rest.substr(1);
    size_t slash = arg.find('/');
    std::string addr = arg.substr(0, slash);

    auto ip = SpfIpAddress::parse(addr);
    bool familyOk = v6 ? addr.find(':') != std::string::npos
                       : addr.find(':') == std::string::npos;
    if (!ip || !familyOk)
        throw SpfSyntaxError("Invalid network address '" + addr + "' in term '" + mech.text + "'");
    mech.network = *ip;

    if (slash != std::string::npos) {
        int len = parseCidrLength(arg.substr(slash + 1), v6 ? 128 : 32, mech.text);
        if (v6) mech.ipv6Prefix = len;
        else mech.ipv4Prefix = len;
    }
}

static SpfMechanism parseMechanism(const std::string& term, SpfQualifier qualifier,
                                   const std::string& name, const std::string& rest,
                                   const std::string& versionTag) {
    SpfMechanism mech;
    mech.qualifier = qualifier;
    mech.text = term;

    std::string n = toLower(name);
    if (n == "all") {
        mech.type = SpfMechanismType::ALL;
        if (!rest.empty())
            throw SpfSyntaxError("Junk after 'all' in term '" + term + "'");
    } else if (n == "include" || n == "exists") {
        mech.type = n == "include" ? SpfMechanismType::INCLUDE : SpfMechanismType::EXISTS;
        if (rest.empty() || rest[0] != ':')
            throw SpfSyntaxError("Missing domain-spec in term '" + term + "'");
        mech.domainSpec = parseDomainSpec(rest.substr(1), term);
    } else if (n == "a" || n == "mx") {
        mech.type = n == "a" ? SpfMechanismType::A : SpfMechanismType::MX;
        std::string cidr = rest;
        if (!rest.empty() && rest[0] == ':') {
            size_t slash = cidrStart(rest);
            mech.domainSpec = parseDomainSpec(rest.substr(1, slash == std::string::npos
                                                                ? std::string::npos
                                                                : slash - 1), term);
            cidr = slash == std::string::npos ? "" : rest.substr(slash);
        }
        if (!cidr.empty() && cidr[0] != '/')
            throw SpfSyntaxError("Invalid term '" + term + "'");
        parseDualCidr(cidr, mech);
    } else if (n == "ptr") {
        mech.type = SpfMechanismType::PTR;
        if (!rest.empty()) {
            if (rest[0] != ':')
                throw SpfSyntaxError("Invalid term '" + term + "'");
            mech.domainSpec = parseDomainSpec(rest.substr(1), term);
        }
    } else if (n == "ip4") {
        mech.type = SpfMechanismType::IP4;
        parseIpNetwork(rest, false, mech);
    } else if (n == "ip6") {
        mech.type = SpfMechanismType::IP6;
        parseIpNetwork(rest, true, mech);
    } else {
        throw SpfSyntaxError("Unknown mechanism type '" + name + "' in '"
                             + versionTag + "' record");
    }
    return mech;
}

static void setModifier(std::optional<SpfMacroString>& slot, const std::string& name,
                        const std::string& value, const std::string& term) {
    if (slot)
        throw SpfSyntaxError("Redundant modifier '" + name + "'");
    slot = parseDomainSpec(value, term);
}

static SpfTerms parseTerms(const std::string& body, const std::string& versionTag) {
    SpfTerms terms;
    std::istringstream iss(body);
    std::string term;

    while (iss >> term) {
        bool hasQualifier = term[0] == '+' || term[0] == '-' ||
                            term[0] == '~' || term[0] == '?';
        SpfQualifier qualifier = parseQualifier(term[0]);
        size_t pos = hasQualifier ? 1 : 0;

        size_t nameEnd = pos;
        while (nameEnd < term.size() && isNameChar(term[nameEnd])) ++nameEnd;
        std::string name = term.substr(pos, nameEnd - pos);
        std::string rest = term.substr(nameEnd);

        if (name.empty() || !std::isalpha(static_cast<unsigned char>(name[0])))
            throw SpfSyntaxError("Invalid term '" + term + "' in '" + versionTag + "' record");

        if (!hasQualifier && !rest.empty() && rest[0] == '=') {
            std::string n = toLower(name);
            std::string value = rest.substr(1);
            if (n == "redirect") {
                setModifier(terms.redirect, n, value, term);
            } else if (n == "exp") {
                setModifier(terms.exp, n, value, term);
            } else {
                // RFC 7208 6: unknown modifiers are ignored
                terms.unknownModifiers.emplace_back(n, value);
            }
            continue;
        }

        terms.mechanisms.push_back(parseMechanism(term, qualifier, name, rest, versionTag));
    }
    return terms;
}

/* ===================== Versions ===================== */

namespace {

struct VersionEntry {
    int version;
    std::shared_ptr<SpfRecord> (*parse)(const std::string&);
    std::vector<SpfScope> scopes;
};

std::shared_ptr<SpfRecord> parseAsV1(const std::string& txt) { return SpfParser::parseV1(txt); }
std::shared_ptr<SpfRecord> parseAsV2(const std::string& txt) { return SpfParser::parseV2(txt); }

const std::vector<VersionEntry>& versionTable() {
    static const std::vector<VersionEntry> table = {
        {1, &parseAsV1, {SpfScope::Helo, SpfScope::MFrom}},
        {2, &parseAsV2, {SpfScope::MFrom, SpfScope::Pra}},
    };
    return table;
}

const VersionEntry* findVersion(int version) {
    for (const auto& e : versionTable())
        if (e.version == version) return &e;
    return nullptr;
}

} // namespace

std::shared_ptr<SpfRecord> SpfParser::parse(int version, const std::string& txt) {
    const VersionEntry* e = findVersion(version);
    if (!e)
        throw std::invalid_argument("Unsupported record version " + std::to_string(version));
    return e->parse(txt);
}

std::shared_ptr<SpfRecordV1> SpfParser::parseV1(const std::string& txt) {
    // RFC 7208 4.5: "v=spf1" followed by SP or end of record
    std::string lower = toLower(txt.substr(0, 7));
    if (lower.compare(0, 6, "v=spf1") != 0 || (lower.size() > 6 && lower[6] != ' '))
        throw SpfInvalidRecordVersionError("Not a 'v=spf1' record: '" + txt + "'");

    return std::make_shared<SpfRecordV1>(txt, parseTerms(txt.substr(6), "v=spf1"));
}

std::shared_ptr<SpfRecordV2> SpfParser::parseV2(const std::string& txt) {
    std::string lower = toLower(txt);
    if (lower.compare(0, 6, "spf2.0") != 0 ||
        (lower.size() > 6 && lower[6] != '/' && lower[6] != ' '))
        throw SpfInvalidRecordVersionError("Not an 'spf2.0' record: '" + txt + "'");

    if (lower.size() <= 6 || lower[6] != '/')
        throw SpfSyntaxError("Missing scope list in 'spf2.0' record: '" + txt + "'");

    size_t end = lower.find(' ', 7);
    std::string scopeList = lower.substr(7, end == std::string::npos ? std::string::npos : end - 7);

    std::vector<SpfScope> scopes;
    std::istringstream ss(scopeList);
    std::string s;
    while (std::getline(ss, s, ',')) {
        if (s != "mfrom" && s != "pra")
            throw SpfSyntaxError("Invalid scope '" + s + "' in 'spf2.0' record");
        SpfScope scope = spfScopeFromName(s);
        if (std::find(scopes.begin(), scopes.end(), scope) == scopes.end())
            scopes.push_back(scope);
    }
    if (scopes.empty() || scopeList.back() == ',')
        throw SpfSyntaxError("Invalid scope list in 'spf2.0' record: '" + txt + "'");

    std::string body = end == std::string::npos ? "" : txt.substr(end);
    return std::make_shared<SpfRecordV2>(txt, std::move(scopes), parseTerms(body, "spf2.0"));
}

const std::vector<int>& SpfParser::supportedVersions() {
    static const std::vector<int> versions = [] {
        std::vector<int> v;
        for (const auto& e : versionTable()) v.push_back(e.version);
        return v;
    }();
    return versions;
}

bool SpfParser::isSupportedVersion(int version) {
    return findVersion(version) != nullptr;
}

bool SpfParser::versionSupportsScope(int version, SpfScope scope) {
    const VersionEntry* e = findVersion(version);
    return e && std::find(e->scopes.begin(), e->scopes.end(), scope) != e->scopes.end();
}
