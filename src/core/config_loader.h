#pragma once

#include <memory>
#include <optional>
#include <string>

#include "dns/dns_resolver.h"
#include "spf/spf_server.h"

struct AppConfig {
    // spf:
    std::string hostname;                   // empty: gethostname()
    std::string queryRrTypes = "txt";       // none | txt | spf | all
    int maxDnsInteractiveTerms = 10;
    int maxNameLookupsPerTerm = 10;
    std::optional<int> maxNameLookupsPerMxMech;
    std::optional<int> maxNameLookupsPerPtrMech;
    int maxVoidDnsLookups = 2;
    std::string defaultAuthorityExplanation;   // empty: built-in text
    bool spfTimeoutFallback = true;

    // dns:
    DnsResolverConfig dns;

    // logging:
    std::string logFile;                    // empty: stderr
    std::string logLevel = "info";
};

class ConfigLoader {
public:
    static AppConfig loadFromFile(const std::string& path);
    static void validateConfig(const AppConfig& cfg);

    // Throws std::invalid_argument for an unknown name.
    static unsigned queryRrTypesFromString(const std::string& s);

    static SpfServerConfig toServerConfig(const AppConfig& cfg,
                                          std::shared_ptr<IDnsResolver> resolver = nullptr);
};
