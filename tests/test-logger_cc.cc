#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#include <boost/test/unit_test.hpp>

#include "core/logger.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

BOOST_AUTO_TEST_SUITE(test_logger_cc)

BOOST_AUTO_TEST_CASE(test_level_names) {
  BOOST_CHECK(logLevelFromString("debug") == LogLevel::Debug);
  BOOST_CHECK(logLevelFromString("warning") == LogLevel::Warn);
  BOOST_CHECK(logLevelFromString("error") == LogLevel::Error);
  BOOST_CHECK(logLevelFromString("chatty") == LogLevel::Info);
}

BOOST_AUTO_TEST_CASE(test_file_output_and_filter) {
  char tmpl[] = "/tmp/spf_log_XXXXXX";
  int fd = mkstemp(tmpl);
  BOOST_REQUIRE(fd >= 0);
  close(fd);

  Logger& log = Logger::instance();
  LogLevel saved = log.level();
  log.setFile(tmpl);
  log.setIdent("spftest");
  log.setLevel(LogLevel::Warn);
  log.log(LogLevel::Info, "hidden line");
  log.log(LogLevel::Warn, "visible line");
  log.setFile("");
  log.setIdent("");
  log.setLevel(saved);

  std::ifstream in(tmpl);
  std::stringstream ss;
  ss << in.rdbuf();
  std::string text = ss.str();
  std::remove(tmpl);

  BOOST_CHECK(text.find("hidden line") == std::string::npos);
  BOOST_CHECK(text.find("spftest [WARN] visible line") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
