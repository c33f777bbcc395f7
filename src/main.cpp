#include "core/config_loader.h"
#include "core/logger.h"
#include "spf/spf_request.h"
#include "spf/spf_result.h"
#include "spf/spf_server.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace {

const int EXIT_USAGE = 64;     // EX_USAGE
const int EXIT_SOFTWARE = 70;  // EX_SOFTWARE

struct CliOptions {
    std::string ip;
    std::string sender;
    std::string helo;
    std::string scope;
    std::string configPath;
    bool json = false;
};

void usage(std::ostream& os) {
    os << "usage: spfquery --ip <address> (--sender <address> | --helo <domain>)\n"
          "                [--scope mfrom|helo|pra] [--config <file>] [--json]\n";
}

bool parseArgs(int argc, char** argv, CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "spfquery: missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--ip") {
            if (!value(opts.ip)) return false;
        } else if (arg == "--sender") {
            if (!value(opts.sender)) return false;
        } else if (arg == "--helo") {
            if (!value(opts.helo)) return false;
        } else if (arg == "--scope") {
            if (!value(opts.scope)) return false;
        } else if (arg == "--config") {
            if (!value(opts.configPath)) return false;
        } else if (arg == "--json") {
            opts.json = true;
        } else {
            std::cerr << "spfquery: unknown option " << arg << "\n";
            return false;
        }
    }

    if (opts.ip.empty() || (opts.sender.empty() && opts.helo.empty())) {
        std::cerr << "spfquery: --ip and one of --sender/--helo are required\n";
        return false;
    }
    return true;
}

int exitCodeFor(SpfResultCode code) {
    switch (code) {
        case SpfResultCode::Pass:      return 0;
        case SpfResultCode::Fail:      return 1;
        case SpfResultCode::SoftFail:  return 2;
        case SpfResultCode::Neutral:   return 3;
        case SpfResultCode::None:      return 4;
        case SpfResultCode::TempError: return 5;
        case SpfResultCode::PermError: return 6;
    }
    return 6;
}

AppConfig loadConfig(const CliOptions& opts) {
    // --config wins over CONFIG_PATH; without either the built-in defaults apply
    std::string path = opts.configPath;
    if (path.empty()) {
        const char* envConfig = std::getenv("CONFIG_PATH");
        if (envConfig)
            path = envConfig;
    }
    if (path.empty())
        return AppConfig{};
    return ConfigLoader::loadFromFile(path);
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        usage(std::cerr);
        return EXIT_USAGE;
    }

    try {
        // 1) Configuration and logging
        Logger::instance().setIdent("spfquery");
        AppConfig cfg = loadConfig(opts);
        Logger::instance().setFile(cfg.logFile);
        Logger::instance().setLevel(logLevelFromString(cfg.logLevel));

        SpfServer server(ConfigLoader::toServerConfig(cfg));

        // 2) Request
        SpfRequestOptions reqOpts;
        reqOpts.ipAddress = opts.ip;
        reqOpts.heloIdentity = opts.helo;
        if (!opts.scope.empty())
            reqOpts.scope = spfScopeFromName(opts.scope);
        else
            reqOpts.scope = opts.sender.empty() ? SpfScope::Helo : SpfScope::MFrom;
        reqOpts.identity = reqOpts.scope == SpfScope::Helo ? opts.helo : opts.sender;

        SpfRequest request(reqOpts);

        // 3) Evaluate
        SpfResult result = server.process(request);

        if (opts.json) {
            json j;
            j["result"] = result.name();
            j["scope"] = spfScopeName(result.scope());
            j["identity"] = result.identity();
            j["client_ip"] = result.clientIp();
            j["authority_domain"] = result.authorityDomain();
            j["text"] = result.text();
            j["local_explanation"] = result.localExplanation();
            if (!result.authorityExplanation().empty())
                j["authority_explanation"] = result.authorityExplanation();
            j["received_spf"] = result.receivedSpfHeader();
            std::cout << j.dump(2) << "\n";
        } else {
            std::cout << result.name() << "\n"
                      << result.localExplanation() << "\n";
            if (!result.authorityExplanation().empty())
                std::cout << result.authorityExplanation() << "\n";
            std::cout << result.receivedSpfHeader() << "\n";
        }
        return exitCodeFor(result.code());
    } catch (const std::invalid_argument& ex) {
        std::cerr << "spfquery: " << ex.what() << "\n";
        usage(std::cerr);
        return EXIT_USAGE;
    } catch (const std::exception& ex) {
        Logger::instance().log(LogLevel::Error, std::string("Fatal error: ") + ex.what());
        return EXIT_SOFTWARE;
    }
}
