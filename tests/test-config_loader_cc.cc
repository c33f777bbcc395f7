#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#include <boost/test/unit_test.hpp>

#include "core/config_loader.h"

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace {

// Temporary YAML file removed when the test case ends.
struct TempConfig {
  std::string path;

  explicit TempConfig(const std::string& yaml) {
    char tmpl[] = "/tmp/spf_config_XXXXXX";
    int fd = mkstemp(tmpl);
    BOOST_REQUIRE(fd >= 0);
    close(fd);
    path = tmpl;
    std::ofstream out(path);
    out << yaml;
  }
  ~TempConfig() { std::remove(path.c_str()); }
};

} // namespace

BOOST_AUTO_TEST_SUITE(test_config_loader_cc)

BOOST_AUTO_TEST_CASE(test_full_file) {
  TempConfig f(
    "spf:\n"
    "  hostname: mx.example.org\n"
    "  query_rr_types: all\n"
    "  max_dns_interactive_terms: 12\n"
    "  max_name_lookups_per_term: 8\n"
    "  max_name_lookups_per_mx_mech: 5\n"
    "  max_void_dns_lookups: 3\n"
    "  default_authority_explanation: \"See %{r}\"\n"
    "  spf_timeout_fallback: false\n"
    "dns:\n"
    "  timeout: 3\n"
    "  attempts: 4\n"
    "  nameserver: 127.0.0.1\n"
    "logging:\n"
    "  level: debug\n");

  AppConfig cfg = ConfigLoader::loadFromFile(f.path);
  BOOST_CHECK_EQUAL(cfg.hostname, "mx.example.org");
  BOOST_CHECK_EQUAL(cfg.queryRrTypes, "all");
  BOOST_CHECK_EQUAL(cfg.maxDnsInteractiveTerms, 12);
  BOOST_CHECK_EQUAL(cfg.maxNameLookupsPerTerm, 8);
  BOOST_REQUIRE(cfg.maxNameLookupsPerMxMech);
  BOOST_CHECK_EQUAL(*cfg.maxNameLookupsPerMxMech, 5);
  BOOST_CHECK(!cfg.maxNameLookupsPerPtrMech);
  BOOST_CHECK_EQUAL(cfg.maxVoidDnsLookups, 3);
  BOOST_CHECK_EQUAL(cfg.defaultAuthorityExplanation, "See %{r}");
  BOOST_CHECK(!cfg.spfTimeoutFallback);
  BOOST_CHECK_EQUAL(cfg.dns.timeoutSeconds, 3);
  BOOST_CHECK_EQUAL(cfg.dns.attempts, 4);
  BOOST_CHECK_EQUAL(cfg.dns.nameserver, "127.0.0.1");
  BOOST_CHECK_EQUAL(cfg.logLevel, "debug");

  SpfServer server(ConfigLoader::toServerConfig(cfg));
  BOOST_CHECK_EQUAL(server.queryRrTypes(), SpfServerConfig::QUERY_RR_TYPE_ALL);
  BOOST_CHECK_EQUAL(server.maxNameLookupsPerMxMech(), 5);
  BOOST_CHECK_EQUAL(server.maxNameLookupsPerPtrMech(), 8);
  BOOST_CHECK_EQUAL(server.defaultAuthorityExplanation().text(), "See %{r}");
  BOOST_CHECK(!server.spfTimeoutFallback());
}

BOOST_AUTO_TEST_CASE(test_defaults) {
  TempConfig f("logging:\n  level: info\n");
  AppConfig cfg = ConfigLoader::loadFromFile(f.path);
  BOOST_CHECK_EQUAL(cfg.queryRrTypes, "txt");
  BOOST_CHECK_EQUAL(cfg.maxDnsInteractiveTerms, 10);
  BOOST_CHECK_EQUAL(cfg.maxVoidDnsLookups, 2);
  BOOST_CHECK(cfg.spfTimeoutFallback);
  BOOST_CHECK_EQUAL(cfg.dns.timeoutSeconds, 5);
}

BOOST_AUTO_TEST_CASE(test_validation_collects_errors) {
  TempConfig f(
    "spf:\n"
    "  query_rr_types: mx\n"
    "  max_void_dns_lookups: 0\n"
    "dns:\n"
    "  timeout: 90\n"
    "  nameserver: not-an-address\n"
    "logging:\n"
    "  level: loud\n");

  try {
    ConfigLoader::loadFromFile(f.path);
    BOOST_FAIL("expected validation to fail");
  } catch (const std::runtime_error& e) {
    std::string msg = e.what();
    BOOST_CHECK(msg.find("spf.query_rr_types") != std::string::npos);
    BOOST_CHECK(msg.find("spf.max_void_dns_lookups") != std::string::npos);
    BOOST_CHECK(msg.find("dns.timeout") != std::string::npos);
    BOOST_CHECK(msg.find("dns.nameserver") != std::string::npos);
    BOOST_CHECK(msg.find("logging.level") != std::string::npos);
  }
}

BOOST_AUTO_TEST_CASE(test_bad_explanation_rejected) {
  TempConfig f("spf:\n  default_authority_explanation: \"%{q}\"\n");
  BOOST_CHECK_THROW(ConfigLoader::loadFromFile(f.path), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_missing_file) {
  BOOST_CHECK_THROW(ConfigLoader::loadFromFile("/nonexistent/spf.yml"), std::exception);
}

BOOST_AUTO_TEST_CASE(test_query_rr_types_names) {
  BOOST_CHECK_EQUAL(ConfigLoader::queryRrTypesFromString("none"), SpfServerConfig::QUERY_RR_TYPE_NONE);
  BOOST_CHECK_EQUAL(ConfigLoader::queryRrTypesFromString("spf"), SpfServerConfig::QUERY_RR_TYPE_SPF);
  BOOST_CHECK_THROW(ConfigLoader::queryRrTypesFromString("MX"), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
