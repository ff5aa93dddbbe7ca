/**
 * @file test_join_client.cpp
 * @brief Tests for join_client.hpp
 */

#include "kcore/join_client.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <sys/stat.h>

namespace {

const char kCaPem[] = "-----BEGIN CERTIFICATE-----\nMIIB\n-----END CERTIFICATE-----\n";

/// Answers every request with a canned response and records the requests.
class FakeTransport final : public kcore::JoinTransport {
 public:
  kcore::expected<kcore::JoinResponse, kcore::JoinError> Do(
      const kcore::JoinRequest& req) override {
    requests.push_back(req);
    if (fail) {
      return kcore::expected<kcore::JoinResponse, kcore::JoinError>::error(
          kcore::JoinError::kRequestFailed);
    }
    kcore::JoinResponse resp;
    resp.status = status;
    resp.body = body;
    return kcore::expected<kcore::JoinResponse, kcore::JoinError>::success(std::move(resp));
  }

  int status = 200;
  std::string body;
  bool fail = false;
  std::vector<kcore::JoinRequest> requests;
};

}  // namespace

TEST_CASE("Base64 encodes with padding", "[join]") {
  CHECK(kcore::Base64Encode("") == "");
  CHECK(kcore::Base64Encode("f") == "Zg==");
  CHECK(kcore::Base64Encode("fo") == "Zm8=");
  CHECK(kcore::Base64Encode("foo") == "Zm9v");
  CHECK(kcore::Base64Encode("foobar") == "Zm9vYmFy");
}

TEST_CASE("Base64 decodes padded, unpadded and wrapped input", "[join]") {
  std::string out;
  REQUIRE(kcore::Base64Decode("Zm9vYmE=", out));
  CHECK(out == "fooba");
  REQUIRE(kcore::Base64Decode("Zm9vYmE", out));
  CHECK(out == "fooba");
  REQUIRE(kcore::Base64Decode("Zm9v\nYmFy\n", out));
  CHECK(out == "foobar");
  CHECK_FALSE(kcore::Base64Decode("Zm9v!", out));
  CHECK_FALSE(kcore::Base64Decode("Zg==Zg", out));
}

TEST_CASE("Join server must be https://host:port", "[join]") {
  CHECK(kcore::IsValidJoinServer("https://10.0.0.1:9443"));
  CHECK(kcore::IsValidJoinServer("https://controller.example:9443/"));
  CHECK_FALSE(kcore::IsValidJoinServer("http://10.0.0.1:9443"));
  CHECK_FALSE(kcore::IsValidJoinServer("https://10.0.0.1"));
  CHECK_FALSE(kcore::IsValidJoinServer("https://10.0.0.1:0"));
  CHECK_FALSE(kcore::IsValidJoinServer("https://10.0.0.1:99999"));
  CHECK_FALSE(kcore::IsValidJoinServer("https://10.0.0.1:9443/path"));
}

TEST_CASE("JoinClient parses a token built by EncodeToken", "[join]") {
  std::string token = kcore::EncodeToken("https://10.0.0.1:9443/", kCaPem, "secret");
  auto c = kcore::JoinClient::FromToken(token, nullptr);
  REQUIRE(c.has_value());
  CHECK(c.value().Server() == "https://10.0.0.1:9443");
  CHECK(c.value().CaPem() == kCaPem);
  CHECK(c.value().BearerToken() == "secret");
}

TEST_CASE("JoinClient rejects malformed tokens", "[join]") {
  auto empty = kcore::JoinClient::FromToken("", nullptr);
  REQUIRE(!empty);
  CHECK(empty.get_error() == kcore::JoinError::kMalformedToken);

  auto not_b64 = kcore::JoinClient::FromToken("%%%", nullptr);
  REQUIRE(!not_b64);
  CHECK(not_b64.get_error() == kcore::JoinError::kMalformedToken);

  auto not_json = kcore::JoinClient::FromToken(kcore::Base64Encode("not json"), nullptr);
  REQUIRE(!not_json);
  CHECK(not_json.get_error() == kcore::JoinError::kMalformedToken);

  auto no_users = kcore::JoinClient::FromToken(
      kcore::Base64Encode(R"({"clusters":[{"cluster":{"server":"https://a:1"}}]})"), nullptr);
  REQUIRE(!no_users);
  CHECK(no_users.get_error() == kcore::JoinError::kMalformedToken);

  auto no_token = kcore::JoinClient::FromToken(kcore::EncodeToken("https://a:1", kCaPem, ""),
                                               nullptr);
  REQUIRE(!no_token);
  CHECK(no_token.get_error() == kcore::JoinError::kMalformedToken);
}

TEST_CASE("JoinClient rejects a token with a bad server", "[join]") {
  auto c = kcore::JoinClient::FromToken(kcore::EncodeToken("ftp://a:1", kCaPem, "t"), nullptr);
  REQUIRE(!c);
  CHECK(c.get_error() == kcore::JoinError::kInvalidServer);
}

TEST_CASE("JoinClient GetCA decodes the CA bundle", "[join]") {
  auto transport = std::make_shared<FakeTransport>();
  transport->body = std::string(R"({"cert":")") + kcore::Base64Encode("CERT") +
                    R"(","key":")" + kcore::Base64Encode("KEY") + R"("})";
  auto c = kcore::JoinClient::FromToken(
      kcore::EncodeToken("https://10.0.0.1:9443", kCaPem, "secret"), transport);
  REQUIRE(c.has_value());

  auto ca = c.value().GetCA();
  REQUIRE(ca.has_value());
  CHECK(ca.value().cert == "CERT");
  CHECK(ca.value().key == "KEY");

  REQUIRE(transport->requests.size() == 1U);
  const kcore::JoinRequest& req = transport->requests[0];
  CHECK(req.method == "GET");
  CHECK(req.url == "https://10.0.0.1:9443/v1beta1/ca");
  CHECK(req.bearer_token == "secret");
  CHECK(req.ca_pem == kCaPem);
  CHECK(req.body.empty());
}

TEST_CASE("JoinClient GetCA reports HTTP errors and bad bodies", "[join]") {
  auto transport = std::make_shared<FakeTransport>();
  auto c = kcore::JoinClient::FromToken(
      kcore::EncodeToken("https://10.0.0.1:9443", kCaPem, "secret"), transport);
  REQUIRE(c.has_value());

  transport->status = 403;
  auto denied = c.value().GetCA();
  REQUIRE(!denied);
  CHECK(denied.get_error() == kcore::JoinError::kRequestFailed);

  transport->status = 200;
  transport->body = R"({"cert":"Zm9v"})";
  auto partial = c.value().GetCA();
  REQUIRE(!partial);
  CHECK(partial.get_error() == kcore::JoinError::kBadResponse);

  transport->fail = true;
  auto down = c.value().GetCA();
  REQUIRE(!down);
  CHECK(down.get_error() == kcore::JoinError::kRequestFailed);
}

TEST_CASE("JoinClient JoinEtcd posts the member and joins the initial cluster", "[join]") {
  auto transport = std::make_shared<FakeTransport>();
  transport->body =
      R"({"initialCluster":["a=https://10.0.0.1:2380","b=https://10.0.0.2:2380"]})";
  auto c = kcore::JoinClient::FromToken(
      kcore::EncodeToken("https://10.0.0.1:9443", kCaPem, "secret"), transport);
  REQUIRE(c.has_value());

  auto initial = c.value().JoinEtcd("b", "10.0.0.2");
  REQUIRE(initial.has_value());
  CHECK(initial.value() == "a=https://10.0.0.1:2380,b=https://10.0.0.2:2380");

  REQUIRE(transport->requests.size() == 1U);
  CHECK(transport->requests[0].method == "POST");
  CHECK(transport->requests[0].url == "https://10.0.0.1:9443/v1beta1/etcd/members");
  auto body = nlohmann::json::parse(transport->requests[0].body);
  CHECK(body["node"] == "b");
  CHECK(body["peerAddress"] == "10.0.0.2");

  transport->body = R"({"initialCluster":[]})";
  auto empty = c.value().JoinEtcd("b", "10.0.0.2");
  REQUIRE(!empty);
  CHECK(empty.get_error() == kcore::JoinError::kBadResponse);
}

TEST_CASE("JoinClient without a transport fails requests", "[join]") {
  auto c = kcore::JoinClient::FromToken(
      kcore::EncodeToken("https://10.0.0.1:9443", kCaPem, "secret"), nullptr);
  REQUIRE(c.has_value());
  auto ca = c.value().GetCA();
  REQUIRE(!ca);
  CHECK(ca.get_error() == kcore::JoinError::kRequestFailed);
}

TEST_CASE("CurlTransport splits the status line from the body", "[join]") {
  char tmpl[] = "/tmp/kcore_curl_XXXXXX";
  REQUIRE(::mkdtemp(tmpl) != nullptr);
  std::vector<std::string> seen;
  kcore::CommandRunner runner = [&seen](const std::vector<std::string>& argv,
                                        std::string& out, int& code) {
    seen = argv;
    out = "{\"ok\":true}\n201";
    code = 0;
    return kcore::ProcessResult::kSuccess;
  };
  kcore::CurlTransport transport(std::string(tmpl) + "/scratch", runner);
  kcore::JoinRequest req;
  req.method = "POST";
  req.url = "https://10.0.0.1:9443/v1beta1/etcd/members";
  req.body = "{}";
  req.bearer_token = "secret";
  req.ca_pem = kCaPem;

  auto resp = transport.Do(req);
  REQUIRE(resp.has_value());
  CHECK(resp.value().status == 201);
  CHECK(resp.value().body == "{\"ok\":true}");
  REQUIRE(!seen.empty());
  CHECK(seen.front() == "curl");
  CHECK(seen.back() == req.url);
  CHECK(kcore::FileExists(std::string(tmpl) + "/scratch/join-ca.crt"));
}

TEST_CASE("CurlTransport keeps the bearer token off the command line", "[join]") {
  char tmpl[] = "/tmp/kcore_curl_XXXXXX";
  REQUIRE(::mkdtemp(tmpl) != nullptr);
  const std::string scratch = std::string(tmpl) + "/scratch";
  const std::string token = "abcdef.0123456789abcdef";
  std::vector<std::string> seen;
  std::string header_during_call;
  mode_t header_mode = 0;
  kcore::CommandRunner runner = [&](const std::vector<std::string>& argv, std::string& out,
                                    int& code) {
    seen = argv;
    const std::string header = scratch + "/join-auth.header";
    auto content = kcore::ReadFile(header);
    if (content.has_value()) header_during_call = content.value();
    struct stat st;
    if (::stat(header.c_str(), &st) == 0) header_mode = st.st_mode & 0777;
    out = "{}\n200";
    code = 0;
    return kcore::ProcessResult::kSuccess;
  };
  kcore::CurlTransport transport(scratch, runner);
  kcore::JoinRequest req;
  req.method = "GET";
  req.url = "https://10.0.0.1:9443/v1beta1/ca";
  req.bearer_token = token;
  req.ca_pem = kCaPem;

  REQUIRE(transport.Do(req).has_value());
  REQUIRE(!seen.empty());
  for (const auto& arg : seen) CHECK(arg.find(token) == std::string::npos);
  CHECK(std::find(seen.begin(), seen.end(), "@" + transport.HeaderPath()) != seen.end());
  CHECK(header_during_call == "Authorization: Bearer " + token + "\n");
  CHECK(header_mode == 0600);
  CHECK_FALSE(kcore::FileExists(transport.HeaderPath()));
}

TEST_CASE("CurlTransport removes the token header when curl fails", "[join]") {
  char tmpl[] = "/tmp/kcore_curl_XXXXXX";
  REQUIRE(::mkdtemp(tmpl) != nullptr);
  kcore::CommandRunner runner = [](const std::vector<std::string>&, std::string& out,
                                   int& code) {
    out = "curl: (7) Failed to connect";
    code = 7;
    return kcore::ProcessResult::kSuccess;
  };
  kcore::CurlTransport transport(std::string(tmpl) + "/scratch", runner);
  kcore::JoinRequest req;
  req.method = "GET";
  req.url = "https://10.0.0.1:9443/v1beta1/ca";
  req.bearer_token = "secret";
  req.ca_pem = kCaPem;

  auto r = transport.Do(req);
  REQUIRE(!r);
  CHECK(r.get_error() == kcore::JoinError::kRequestFailed);
  CHECK_FALSE(kcore::FileExists(transport.HeaderPath()));
}
