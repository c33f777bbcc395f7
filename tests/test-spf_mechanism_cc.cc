#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#include <boost/test/unit_test.hpp>

#include "spf_test_support.h"
#include "spf/spf_errors.h"

namespace {

SpfResult check(const std::shared_ptr<MockDnsResolver>& dns, const std::string& ip,
                const std::string& sender = "user@example.com",
                SpfServerConfig cfg = {}) {
  SpfServer server = makeTestServer(dns, std::move(cfg));
  SpfRequest request = makeMfromRequest(sender, ip);
  return server.process(request);
}

} // namespace

BOOST_AUTO_TEST_SUITE(test_spf_mechanism_cc)

BOOST_AUTO_TEST_CASE(test_ip4_ip6) {
  auto dns = std::make_shared<MockDnsResolver>();
  dns->addTxt("example.com", "v=spf1 ip4:192.0.2.0/24 ip6:2001:db8::/32 -all");

  BOOST_CHECK(check(dns, "192.0.2.77").is(SpfResultCode::Pass));
  BOOST_CHECK(check(dns, "192.0.3.1").is(SpfResultCode::Fail));
  BOOST_CHECK(check(dns, "2001:db8:1::5").is(SpfResultCode::Pass));
  BOOST_CHECK(check(dns, "2001:db9::5").is(SpfResultCode::Fail));
  // IPv4-mapped client addresses are treated as IPv4
  BOOST_CHECK(check(dns, "::ffff:192.0.2.8").is(SpfResultCode::Pass));
}

BOOST_AUTO_TEST_CASE(test_a_mechanism) {
  auto dns = std::make_shared<MockDnsResolver>();
  dns->addTxt("example.com", "v=spf1 a a:other.example.com/24 a//64 -all");
  dns->addA("example.com", "192.0.2.10");
  dns->addA("other.example.com", "198.51.100.1");
  dns->addAaaa("example.com", "2001:db8::10");

  BOOST_CHECK(check(dns, "192.0.2.10").is(SpfResultCode::Pass));
  BOOST_CHECK(check(dns, "198.51.100.200").is(SpfResultCode::Pass));
  BOOST_CHECK(check(dns, "2001:db8::ffff").is(SpfResultCode::Pass));
  BOOST_CHECK(check(dns, "192.0.2.11").is(SpfResultCode::Fail));
}

BOOST_AUTO_TEST_CASE(test_mx_mechanism) {
  auto dns = std::make_shared<MockDnsResolver>();
  dns->addTxt("example.com", "v=spf1 mx -all");
  dns->addMx("example.com", 10, "mx1.example.com");
  dns->addMx("example.com", 20, "mx2.example.com");
  dns->addA("mx1.example.com", "192.0.2.1");
  dns->addA("mx2.example.com", "192.0.2.2");

  BOOST_CHECK(check(dns, "192.0.2.2").is(SpfResultCode::Pass));
  BOOST_CHECK(check(dns, "192.0.2.3").is(SpfResultCode::Fail));

  SpfServerConfig cfg;
  cfg.maxNameLookupsPerMxMech = 1;
  SpfResult limited = check(dns, "192.0.2.2", "user@example.com", cfg);
  BOOST_CHECK(limited.is(SpfResultCode::PermError));
  BOOST_CHECK_EQUAL(limited.text(), "Maximum name look-ups per MX mechanism limit (1) exceeded");
}

BOOST_AUTO_TEST_CASE(test_ptr_mechanism) {
  auto dns = std::make_shared<MockDnsResolver>();
  dns->addTxt("example.com", "v=spf1 ptr -all");
  dns->addPtr("1.2.0.192.in-addr.arpa", "mail.example.com");
  dns->addA("mail.example.com", "192.0.2.1");
  dns->addPtr("2.2.0.192.in-addr.arpa", "mail.example.com");  // does not resolve back
  dns->addPtr("3.2.0.192.in-addr.arpa", "host.example.net");
  dns->addA("host.example.net", "192.0.2.3");

  BOOST_CHECK(check(dns, "192.0.2.1").is(SpfResultCode::Pass));
  BOOST_CHECK(check(dns, "192.0.2.2").is(SpfResultCode::Fail));
  BOOST_CHECK(check(dns, "192.0.2.3").is(SpfResultCode::Fail));
}

BOOST_AUTO_TEST_CASE(test_ptr_names_beyond_limit_ignored) {
  auto dns = std::make_shared<MockDnsResolver>();
  dns->addTxt("example.com", "v=spf1 ptr -all");
  dns->addPtr("1.2.0.192.in-addr.arpa", "a.example.net");
  dns->addPtr("1.2.0.192.in-addr.arpa", "mail.example.com");
  dns->addA("a.example.net", "192.0.2.1");
  dns->addA("mail.example.com", "192.0.2.1");

  SpfServerConfig cfg;
  cfg.maxNameLookupsPerPtrMech = 1;
  SpfResult r = check(dns, "192.0.2.1", "user@example.com", cfg);
  BOOST_CHECK(r.is(SpfResultCode::Fail));
  BOOST_CHECK_EQUAL(dns->queryCount("mail.example.com", DnsRecordType::A), 0U);
}

BOOST_AUTO_TEST_CASE(test_exists_mechanism) {
  auto dns = std::make_shared<MockDnsResolver>();
  dns->addTxt("example.com", "v=spf1 exists:%{ir}.%{l1r+-}._spf.%{d} -all");
  dns->addA("1.2.0.192.user._spf.example.com", "127.0.0.2");

  BOOST_CHECK(check(dns, "192.0.2.1").is(SpfResultCode::Pass));
  BOOST_CHECK(check(dns, "192.0.2.2").is(SpfResultCode::Fail));
}

BOOST_AUTO_TEST_CASE(test_include_mechanism) {
  auto dns = std::make_shared<MockDnsResolver>();
  dns->addTxt("example.com", "v=spf1 include:_spf.example.net ~all");
  dns->addTxt("_spf.example.net", "v=spf1 ip4:192.0.2.0/24 -all");

  BOOST_CHECK(check(dns, "192.0.2.5").is(SpfResultCode::Pass));
  // the inner fail is a no-match, the outer ~all decides
  SpfResult soft = check(dns, "198.51.100.5");
  BOOST_CHECK(soft.is(SpfResultCode::SoftFail));
  BOOST_CHECK_EQUAL(soft.authorityDomain(), "example.com");
}

BOOST_AUTO_TEST_CASE(test_include_errors) {
  auto dns = std::make_shared<MockDnsResolver>();
  dns->addTxt("none.example.com", "v=spf1 include:nothing.example.net -all");
  dns->addTxt("temp.example.com", "v=spf1 include:temp.example.net -all");
  dns->setRcode("temp.example.net", DnsRecordType::TXT, DnsResponseCode::ServFail);
  dns->addTxt("perm.example.com", "v=spf1 include:perm.example.net -all");
  dns->addTxt("perm.example.net", "v=spf1 bogus");

  SpfResult none = check(dns, "192.0.2.1", "user@none.example.com");
  BOOST_CHECK(none.is(SpfResultCode::PermError));
  BOOST_CHECK_EQUAL(none.text(),
                    "Included domain 'nothing.example.net' has no applicable sender policy");

  BOOST_CHECK(check(dns, "192.0.2.1", "user@temp.example.com").is(SpfResultCode::TempError));
  BOOST_CHECK(check(dns, "192.0.2.1", "user@perm.example.com").is(SpfResultCode::PermError));
}

BOOST_AUTO_TEST_CASE(test_redirect_modifier) {
  auto dns = std::make_shared<MockDnsResolver>();
  dns->addTxt("example.com", "v=spf1 ip4:203.0.113.1 redirect=_spf.example.com");
  dns->addTxt("_spf.example.com", "v=spf1 ip4:192.0.2.0/24 -all");
  dns->addTxt("dangling.example.com", "v=spf1 redirect=nothing.example.com");

  BOOST_CHECK(check(dns, "203.0.113.1").is(SpfResultCode::Pass));
  BOOST_CHECK(check(dns, "192.0.2.9").is(SpfResultCode::Pass));

  SpfResult fail = check(dns, "198.51.100.1");
  BOOST_CHECK(fail.is(SpfResultCode::Fail));
  BOOST_CHECK_EQUAL(fail.authorityDomain(), "_spf.example.com");

  SpfResult dangling = check(dns, "192.0.2.9", "user@dangling.example.com");
  BOOST_CHECK(dangling.is(SpfResultCode::PermError));

  // a matching mechanism wins over redirect
  auto dns2 = std::make_shared<MockDnsResolver>();
  dns2->addTxt("example.com", "v=spf1 ?all redirect=_spf.example.com");
  dns2->addTxt("_spf.example.com", "v=spf1 -all");
  BOOST_CHECK(check(dns2, "192.0.2.9").is(SpfResultCode::Neutral));
}

BOOST_AUTO_TEST_CASE(test_default_neutral) {
  auto dns = std::make_shared<MockDnsResolver>();
  dns->addTxt("example.com", "v=spf1 ip4:203.0.113.1");

  SpfResult r = check(dns, "192.0.2.1");
  BOOST_CHECK(r.is(SpfResultCode::Neutral));
  BOOST_CHECK_EQUAL(r.text(), "Default neutral result due to no mechanism matches");
}

BOOST_AUTO_TEST_CASE(test_void_lookup_limit) {
  auto dns = std::make_shared<MockDnsResolver>();
  dns->addTxt("example.com", "v=spf1 a:v1.example.com a:v2.example.com a:v3.example.com +all");

  SpfServer server = makeTestServer(dns);
  SpfRequest request = makeMfromRequest("user@example.com", "192.0.2.1");
  SpfResult r = server.process(request);
  BOOST_CHECK(r.is(SpfResultCode::PermError));
  BOOST_CHECK_EQUAL(r.text(), "Maximum void DNS look-ups limit (2) exceeded");
  BOOST_CHECK_EQUAL(request.limits().voidDnsLookups(), 3);

  // two void lookups are fine
  auto dns2 = std::make_shared<MockDnsResolver>();
  dns2->addTxt("example.com", "v=spf1 a:v1.example.com a:v2.example.com +all");
  BOOST_CHECK(check(dns2, "192.0.2.1").is(SpfResultCode::Pass));
}

BOOST_AUTO_TEST_CASE(test_exp_modifier) {
  auto dns = std::make_shared<MockDnsResolver>();
  dns->addTxt("example.com", "v=spf1 -all exp=explain._spf.%{d}");
  dns->addTxt("explain._spf.example.com", "%{i} is not one of %{d}'s designated mail servers.");

  SpfResult r = check(dns, "192.0.2.1");
  BOOST_CHECK(r.is(SpfResultCode::Fail));
  BOOST_CHECK_EQUAL(r.authorityExplanation(),
                    "192.0.2.1 is not one of example.com's designated mail servers.");
}

BOOST_AUTO_TEST_CASE(test_exp_problems_fall_back_to_default) {
  auto dns = std::make_shared<MockDnsResolver>();
  dns->addTxt("example.com", "v=spf1 -all exp=missing.example.com");
  dns->addTxt("bad.example.com", "v=spf1 -all exp=broken.example.com");
  dns->addTxt("broken.example.com", "bad %{x} macro");

  SpfServerConfig cfg;
  cfg.defaultAuthorityExplanation = std::string("Rejected by %{r}");
  SpfResult missing = check(dns, "192.0.2.1", "user@example.com", cfg);
  BOOST_CHECK(missing.is(SpfResultCode::Fail));
  BOOST_CHECK_EQUAL(missing.authorityExplanation(), "Rejected by mx.example.org");

  SpfServerConfig cfg2;
  cfg2.defaultAuthorityExplanation = std::string("Rejected by %{r}");
  SpfResult broken = check(dns, "192.0.2.1", "user@bad.example.com", cfg2);
  BOOST_CHECK(broken.is(SpfResultCode::Fail));
  BOOST_CHECK_EQUAL(broken.authorityExplanation(), "Rejected by mx.example.org");
}

BOOST_AUTO_TEST_CASE(test_no_explanation_for_non_fail) {
  auto dns = std::make_shared<MockDnsResolver>();
  dns->addTxt("example.com", "v=spf1 ~all exp=explain.example.com");
  dns->addTxt("explain.example.com", "go away");

  SpfResult r = check(dns, "192.0.2.1");
  BOOST_CHECK(r.is(SpfResultCode::SoftFail));
  BOOST_CHECK(r.authorityExplanation().empty());
  BOOST_CHECK_EQUAL(dns->queryCount("explain.example.com", DnsRecordType::TXT), 0U);
}

BOOST_AUTO_TEST_SUITE_END()
