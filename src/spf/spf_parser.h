#pragma once
#include <memory>
#include <string>
#include <vector>
#include "spf/spf_record.h"

class SpfParser {
public:
    // Dispatches on the fixed version table. Throws
    // SpfInvalidRecordVersionError when txt is not tagged for the version,
    // SpfSyntaxError when it is tagged but malformed, std::invalid_argument
    // for an unknown version number.
    static std::shared_ptr<SpfRecord> parse(int version, const std::string& txt);

    static std::shared_ptr<SpfRecordV1> parseV1(const std::string& txt);
    static std::shared_ptr<SpfRecordV2> parseV2(const std::string& txt);

    static const std::vector<int>& supportedVersions();
    static bool isSupportedVersion(int version);
    static bool versionSupportsScope(int version, SpfScope scope);
};
