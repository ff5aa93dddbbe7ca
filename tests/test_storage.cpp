/**
 * @file test_storage.cpp
 * @brief Tests for storage.hpp backend selection and etcd join.
 */

#include "kcore/storage.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <stdlib.h>

namespace {

std::string MakeTempDir() {
  char tmpl[] = "/tmp/kcore_storage_XXXXXX";
  char* dir = ::mkdtemp(tmpl);
  REQUIRE(dir != nullptr);
  return dir;
}

kcore::ProcessResult NoopRunner(const std::vector<std::string>&, std::string& out, int& code) {
  out.clear();
  code = 0;
  return kcore::ProcessResult::kSuccess;
}

bool HasArg(const std::vector<std::string>& args, const std::string& arg) {
  return std::find(args.begin(), args.end(), arg) != args.end();
}

void InstallFakeBinary(const kcore::Paths& paths, const char* name) {
  REQUIRE(kcore::InitDirectory(paths.bin_dir, 0755).has_value());
  REQUIRE(kcore::WriteFileAtomic(paths.bin_dir + "/" + name, "#!/bin/sh\nexit 0\n", 0755)
              .has_value());
}

class MembersTransport final : public kcore::JoinTransport {
 public:
  kcore::expected<kcore::JoinResponse, kcore::JoinError> Do(
      const kcore::JoinRequest& req) override {
    last = req;
    kcore::JoinResponse resp;
    resp.status = 200;
    resp.body = R"({"initialCluster":["peer=https://10.0.0.1:2380","me=https://10.0.0.2:2380"]})";
    return kcore::expected<kcore::JoinResponse, kcore::JoinError>::success(std::move(resp));
  }
  kcore::JoinRequest last;
};

}  // namespace

TEST_CASE("SelectStorageBackend defaults to kine", "[storage]") {
  std::string dir = MakeTempDir();
  kcore::Paths paths = kcore::Paths::FromDataDir(dir);
  kcore::ClusterConfig config = kcore::ClusterConfig::Default(paths);
  kcore::CertificateManager certs(paths, NoopRunner);

  for (const char* type : {"", "kine"}) {
    config.spec.storage.type = type;
    auto b = kcore::SelectStorageBackend(config, false, certs, kcore::optional<kcore::JoinClient>(),
                                         paths);
    REQUIRE(b.has_value());
    CHECK(std::string(b.value()->Name()) == "kine");
    CHECK(b.value()->Endpoint() == "unix://" + paths.run_dir + "/kine.sock");
    CHECK(HasArg(b.value()->Args(), "--listen-address=unix://" + paths.run_dir + "/kine.sock"));
  }
}

TEST_CASE("SelectStorageBackend builds etcd", "[storage]") {
  std::string dir = MakeTempDir();
  kcore::Paths paths = kcore::Paths::FromDataDir(dir);
  kcore::ClusterConfig config = kcore::ClusterConfig::Default(paths);
  config.spec.storage.type = "etcd";
  config.spec.storage.etcd.peer_address = "10.0.0.2";
  kcore::CertificateManager certs(paths, NoopRunner);

  auto b = kcore::SelectStorageBackend(config, false, certs, kcore::optional<kcore::JoinClient>(),
                                       paths);
  REQUIRE(b.has_value());
  CHECK(std::string(b.value()->Name()) == "etcd");
  CHECK(b.value()->Endpoint() == "https://127.0.0.1:2379");
  auto args = b.value()->Args();
  CHECK(HasArg(args, "--listen-peer-urls=https://10.0.0.2:2380"));
  CHECK(HasArg(args, "--cert-file=" + paths.cert_dir + "/etcd.crt"));
  CHECK(HasArg(args, "--trusted-ca-file=" + paths.cert_dir + "/ca.crt"));
}

TEST_CASE("SelectStorageBackend rejects an unknown type", "[storage]") {
  std::string dir = MakeTempDir();
  kcore::Paths paths = kcore::Paths::FromDataDir(dir);
  kcore::ClusterConfig config = kcore::ClusterConfig::Default(paths);
  config.spec.storage.type = "bogus";
  kcore::CertificateManager certs(paths, NoopRunner);

  auto b = kcore::SelectStorageBackend(config, false, certs, kcore::optional<kcore::JoinClient>(),
                                       paths);
  REQUIRE(!b);
  CHECK(b.get_error() == kcore::StorageError::kUnknownStorageType);
}

TEST_CASE("KineBackend Init creates the run directory", "[storage]") {
  std::string dir = MakeTempDir();
  kcore::Paths paths = kcore::Paths::FromDataDir(dir);
  InstallFakeBinary(paths, "kine");
  kcore::KineConfig kine;
  kine.data_source = "sqlite://" + dir + "/kine/state.db";
  kcore::KineBackend backend(kine, paths);

  REQUIRE(backend.Init().has_value());
  CHECK(kcore::FileExists(paths.run_dir));
  CHECK(kcore::FileExists(dir + "/kine"));
  CHECK(HasArg(backend.Args(), "--endpoint=" + kine.data_source));
}

TEST_CASE("EtcdBackend founder starts a new cluster", "[storage]") {
  std::string dir = MakeTempDir();
  kcore::Paths paths = kcore::Paths::FromDataDir(dir);
  InstallFakeBinary(paths, "etcd");
  kcore::EtcdConfig etcd;
  etcd.peer_address = "10.0.0.1";
  kcore::EtcdBackend backend(etcd, false, kcore::CertificateManager(paths, NoopRunner),
                             kcore::optional<kcore::JoinClient>(), paths);

  REQUIRE(backend.Init().has_value());
  CHECK(HasArg(backend.Args(), "--initial-cluster-state=new"));
  CHECK_FALSE(backend.IsJoin());
}

TEST_CASE("EtcdBackend join without a client fails", "[storage]") {
  std::string dir = MakeTempDir();
  kcore::Paths paths = kcore::Paths::FromDataDir(dir);
  InstallFakeBinary(paths, "etcd");
  kcore::EtcdConfig etcd;
  etcd.peer_address = "10.0.0.2";
  kcore::EtcdBackend backend(etcd, true, kcore::CertificateManager(paths, NoopRunner),
                             kcore::optional<kcore::JoinClient>(), paths);

  auto r = backend.Init();
  REQUIRE(!r);
  CHECK(r.get_error() == kcore::ComponentError::kJoinFailed);
}

TEST_CASE("EtcdBackend join adopts the peer's initial cluster", "[storage]") {
  std::string dir = MakeTempDir();
  kcore::Paths paths = kcore::Paths::FromDataDir(dir);
  InstallFakeBinary(paths, "etcd");
  auto transport = std::make_shared<MembersTransport>();
  auto client = kcore::JoinClient::FromToken(
      kcore::EncodeToken("https://10.0.0.1:9443", "CA", "secret"), transport);
  REQUIRE(client.has_value());

  kcore::EtcdConfig etcd;
  etcd.peer_address = "10.0.0.2";
  kcore::EtcdBackend backend(etcd, true, kcore::CertificateManager(paths, NoopRunner),
                             kcore::optional<kcore::JoinClient>(client.value()), paths);

  REQUIRE(backend.Init().has_value());
  CHECK(backend.IsJoin());
  auto args = backend.Args();
  CHECK(HasArg(args, "--initial-cluster=peer=https://10.0.0.1:2380,me=https://10.0.0.2:2380"));
  CHECK(HasArg(args, "--initial-cluster-state=existing"));
  CHECK(transport->last.url == "https://10.0.0.1:9443/v1beta1/etcd/members");
}
