#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#include <boost/test/unit_test.hpp>

#include "spf_test_support.h"
#include "spf/spf_result.h"

#include <stdexcept>

BOOST_AUTO_TEST_SUITE(test_spf_result_cc)

BOOST_AUTO_TEST_CASE(test_code_names) {
  BOOST_CHECK_EQUAL(spfResultCodeName(SpfResultCode::Pass), "pass");
  BOOST_CHECK_EQUAL(spfResultCodeName(SpfResultCode::SoftFail), "softfail");
  BOOST_CHECK_EQUAL(spfResultCodeName(SpfResultCode::PermError), "permerror");
  BOOST_CHECK(spfResultCodeFromName("TempError") == SpfResultCode::TempError);
  BOOST_CHECK_THROW(spfResultCodeFromName("error"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_factory_table) {
  auto dns = std::make_shared<MockDnsResolver>();
  SpfServer server = makeTestServer(dns);
  SpfRequest req = makeMfromRequest("user@example.com", "192.0.2.1");

  const SpfResultCode codes[] = {
    SpfResultCode::Pass, SpfResultCode::Fail, SpfResultCode::SoftFail,
    SpfResultCode::Neutral, SpfResultCode::None, SpfResultCode::TempError,
    SpfResultCode::PermError,
  };
  for (SpfResultCode code : codes) {
    SpfResult r = SpfResult::factoryFor(code)(server, req, "text");
    BOOST_CHECK(r.code() == code);
    BOOST_CHECK_EQUAL(r.text(), "text");
    BOOST_CHECK_EQUAL(SpfResult::create(code, server, req, "t").name(), spfResultCodeName(code));
  }
}

BOOST_AUTO_TEST_CASE(test_result_copies_request) {
  auto dns = std::make_shared<MockDnsResolver>();
  SpfServer server = makeTestServer(dns);
  SpfRequest req = makeMfromRequest("user@example.com", "192.0.2.1", "helo.example.net");

  SpfResult r = server.makeResult(SpfResultCode::Pass, req, "ok");
  BOOST_CHECK(r.scope() == SpfScope::MFrom);
  BOOST_CHECK_EQUAL(r.identity(), "user@example.com");
  BOOST_CHECK_EQUAL(r.sender(), "user@example.com");
  BOOST_CHECK_EQUAL(r.clientIp(), "192.0.2.1");
  BOOST_CHECK_EQUAL(r.heloIdentity(), "helo.example.net");
  BOOST_CHECK_EQUAL(r.authorityDomain(), "example.com");
  BOOST_CHECK_EQUAL(r.receiver(), "mx.example.org");
  BOOST_CHECK(r.authorityExplanation().empty());
}

BOOST_AUTO_TEST_CASE(test_local_explanation) {
  auto dns = std::make_shared<MockDnsResolver>();
  SpfServer server = makeTestServer(dns);
  SpfRequest req = makeMfromRequest("user@example.com", "192.0.2.1");

  BOOST_CHECK_EQUAL(server.makeResult(SpfResultCode::Pass, req, "").localExplanation(),
                    "example.com: 192.0.2.1 is authorized to use 'user@example.com' in 'mfrom' identity");
  BOOST_CHECK_EQUAL(server.makeResult(SpfResultCode::Fail, req, "").localExplanation(),
                    "example.com: 192.0.2.1 is not authorized to use 'user@example.com' in 'mfrom' identity");
  BOOST_CHECK_EQUAL(server.makeResult(SpfResultCode::SoftFail, req, "").localExplanation(),
                    "example.com: 192.0.2.1 is not authorized to use 'user@example.com' in 'mfrom' "
                    "identity, however domain is not currently prepared for false failures");
  BOOST_CHECK_EQUAL(server.makeResult(SpfResultCode::Neutral, req, "").localExplanation(),
                    "example.com: Domain does not state whether sender is authorized to use "
                    "'user@example.com' in 'mfrom' identity");
  BOOST_CHECK_EQUAL(server.makeResult(SpfResultCode::PermError, req, "Bad record").localExplanation(),
                    "example.com: Bad record");
}

BOOST_AUTO_TEST_CASE(test_received_spf_header) {
  auto dns = std::make_shared<MockDnsResolver>();
  SpfServer server = makeTestServer(dns);
  SpfRequest req = makeMfromRequest("user@example.com", "192.0.2.1", "helo.example.net");

  SpfResult pass = server.makeResult(SpfResultCode::Pass, req, "Mechanism 'a' matched");
  BOOST_CHECK_EQUAL(pass.receivedSpfHeader(),
                    "Received-SPF: pass (mx.example.org: example.com: 192.0.2.1 is authorized to use "
                    "'user@example.com' in 'mfrom' identity) receiver=mx.example.org; "
                    "identity=mailfrom; envelope-from=\"user@example.com\"; helo=helo.example.net; "
                    "client-ip=192.0.2.1");

  SpfResult perm = server.makeResult(SpfResultCode::PermError, req, "Unknown mechanism type 'x'");
  BOOST_CHECK_EQUAL(perm.receivedSpfHeader(),
                    "Received-SPF: permerror (mx.example.org: example.com: Unknown mechanism type 'x') "
                    "receiver=mx.example.org; identity=mailfrom; envelope-from=\"user@example.com\"; "
                    "helo=helo.example.net; client-ip=192.0.2.1; problem=\"Unknown mechanism type 'x'\"");
}

BOOST_AUTO_TEST_CASE(test_received_spf_header_helo) {
  auto dns = std::make_shared<MockDnsResolver>();
  SpfServer server = makeTestServer(dns);
  SpfRequestOptions opts;
  opts.scope = SpfScope::Helo;
  opts.identity = "mail.example.com";
  opts.ipAddress = "2001:db8::1";
  SpfRequest req(opts);

  SpfResult r = server.makeResult(SpfResultCode::None, req, "No applicable sender policy available");
  BOOST_CHECK_EQUAL(r.receivedSpfHeader(),
                    "Received-SPF: none (mx.example.org: mail.example.com: No applicable sender "
                    "policy available) receiver=mx.example.org; identity=helo; "
                    "helo=mail.example.com; client-ip=2001:db8::1");
}

BOOST_AUTO_TEST_CASE(test_fail_explanation_uses_exp_state) {
  auto dns = std::make_shared<MockDnsResolver>();
  SpfServer server = makeTestServer(dns);
  SpfRequest req = makeMfromRequest("user@example.com", "192.0.2.1");

  req.setState("authority_explanation", "Go away");
  BOOST_CHECK_EQUAL(server.makeResult(SpfResultCode::Fail, req, "").authorityExplanation(), "Go away");
  BOOST_CHECK(server.makeResult(SpfResultCode::SoftFail, req, "").authorityExplanation().empty());

  // never computed inside an include
  SpfRequest sub = req.newSubRequest("inc.example.net", true);
  BOOST_CHECK(server.makeResult(SpfResultCode::Fail, sub, "").authorityExplanation().empty());
}

BOOST_AUTO_TEST_SUITE_END()
