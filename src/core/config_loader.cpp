#include "core/config_loader.h"
#include "core/logger.h"
#include "spf/spf_errors.h"

#include <arpa/inet.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

AppConfig ConfigLoader::loadFromFile(const std::string& path) {
    AppConfig cfg;

    try {
        YAML::Node root = YAML::LoadFile(path);

        if (root["spf"]) {
            auto s = root["spf"];
            if (s["hostname"])       cfg.hostname     = s["hostname"].as<std::string>();
            if (s["query_rr_types"]) cfg.queryRrTypes = s["query_rr_types"].as<std::string>();
            if (s["max_dns_interactive_terms"])
                cfg.maxDnsInteractiveTerms = s["max_dns_interactive_terms"].as<int>();
            if (s["max_name_lookups_per_term"])
                cfg.maxNameLookupsPerTerm = s["max_name_lookups_per_term"].as<int>();
            if (s["max_name_lookups_per_mx_mech"])
                cfg.maxNameLookupsPerMxMech = s["max_name_lookups_per_mx_mech"].as<int>();
            if (s["max_name_lookups_per_ptr_mech"])
                cfg.maxNameLookupsPerPtrMech = s["max_name_lookups_per_ptr_mech"].as<int>();
            if (s["max_void_dns_lookups"])
                cfg.maxVoidDnsLookups = s["max_void_dns_lookups"].as<int>();
            if (s["default_authority_explanation"])
                cfg.defaultAuthorityExplanation = s["default_authority_explanation"].as<std::string>();
            if (s["spf_timeout_fallback"])
                cfg.spfTimeoutFallback = s["spf_timeout_fallback"].as<bool>();
        }

        if (root["dns"]) {
            auto d = root["dns"];
            if (d["timeout"])    cfg.dns.timeoutSeconds = d["timeout"].as<int>();
            if (d["attempts"])   cfg.dns.attempts       = d["attempts"].as<int>();
            if (d["nameserver"]) cfg.dns.nameserver     = d["nameserver"].as<std::string>();
        }

        if (root["logging"]) {
            auto l = root["logging"];
            if (l["file"])  cfg.logFile  = l["file"].as<std::string>();
            if (l["level"]) cfg.logLevel = l["level"].as<std::string>();
        }
    } catch (const std::exception& ex) {
        Logger::instance().log(
            LogLevel::Error,
            std::string("Failed to load config: ") + ex.what());
        throw;
    }

    validateConfig(cfg);

    return cfg;
}

void ConfigLoader::validateConfig(const AppConfig& cfg) {
    std::vector<std::string> errors;

    try {
        queryRrTypesFromString(cfg.queryRrTypes);
    } catch (const std::invalid_argument&) {
        errors.push_back("spf.query_rr_types must be one of: none, txt, spf, all");
    }

    // Limits
    if (cfg.maxDnsInteractiveTerms <= 0)
        errors.push_back("spf.max_dns_interactive_terms must be positive");
    if (cfg.maxNameLookupsPerTerm <= 0)
        errors.push_back("spf.max_name_lookups_per_term must be positive");
    if (cfg.maxNameLookupsPerMxMech && *cfg.maxNameLookupsPerMxMech <= 0)
        errors.push_back("spf.max_name_lookups_per_mx_mech must be positive");
    if (cfg.maxNameLookupsPerPtrMech && *cfg.maxNameLookupsPerPtrMech <= 0)
        errors.push_back("spf.max_name_lookups_per_ptr_mech must be positive");
    if (cfg.maxVoidDnsLookups <= 0)
        errors.push_back("spf.max_void_dns_lookups must be positive");

    if (!cfg.defaultAuthorityExplanation.empty()) {
        try {
            SpfMacroString(cfg.defaultAuthorityExplanation, true).validate();
        } catch (const SpfError& ex) {
            errors.push_back(std::string("spf.default_authority_explanation: ") + ex.what());
        }
    }

    // Resolver
    if (cfg.dns.timeoutSeconds < 1 || cfg.dns.timeoutSeconds > 60)
        errors.push_back("dns.timeout must be between 1-60 seconds");
    if (cfg.dns.attempts < 1 || cfg.dns.attempts > 10)
        errors.push_back("dns.attempts must be between 1-10");
    if (!cfg.dns.nameserver.empty()) {
        in_addr addr{};
        if (inet_pton(AF_INET, cfg.dns.nameserver.c_str(), &addr) != 1)
            errors.push_back("dns.nameserver must be an IPv4 address");
    }

    // Log level validation
    std::vector<std::string> validLevels = {"debug", "info", "warn", "warning", "error"};
    if (std::find(validLevels.begin(), validLevels.end(), cfg.logLevel) == validLevels.end()) {
        errors.push_back("logging.level must be one of: debug, info, warn, error");
    }

    if (!errors.empty()) {
        std::string errorMsg = "Configuration validation failed:\n";
        for (const auto& error : errors) {
            errorMsg += "  - " + error + "\n";
        }
        Logger::instance().log(LogLevel::Error, errorMsg);
        throw std::runtime_error("Invalid configuration: " + errorMsg);
    }

    Logger::instance().log(LogLevel::Debug, "Configuration validation passed");
}

unsigned ConfigLoader::queryRrTypesFromString(const std::string& s) {
    if (s == "none") return SpfServerConfig::QUERY_RR_TYPE_NONE;
    if (s == "txt")  return SpfServerConfig::QUERY_RR_TYPE_TXT;
    if (s == "spf")  return SpfServerConfig::QUERY_RR_TYPE_SPF;
    if (s == "all")  return SpfServerConfig::QUERY_RR_TYPE_ALL;
    throw std::invalid_argument("Unknown query_rr_types '" + s + "'");
}

SpfServerConfig ConfigLoader::toServerConfig(const AppConfig& cfg,
                                             std::shared_ptr<IDnsResolver> resolver) {
    SpfServerConfig out;
    out.hostname = cfg.hostname;
    out.dnsResolver = resolver ? std::move(resolver)
                               : std::make_shared<SystemDnsResolver>(cfg.dns);
    out.queryRrTypes = queryRrTypesFromString(cfg.queryRrTypes);
    out.maxDnsInteractiveTerms = cfg.maxDnsInteractiveTerms;
    out.maxNameLookupsPerTerm = cfg.maxNameLookupsPerTerm;
    out.maxNameLookupsPerMxMech = cfg.maxNameLookupsPerMxMech;
    out.maxNameLookupsPerPtrMech = cfg.maxNameLookupsPerPtrMech;
    out.maxVoidDnsLookups = cfg.maxVoidDnsLookups;
    out.defaultAuthorityExplanation = cfg.defaultAuthorityExplanation;
    out.spfTimeoutFallback = cfg.spfTimeoutFallback;
    return out;
}
