/**
 * @file test_server.cpp
 * @brief Tests for server.hpp: argument parsing, exit codes, planning and
 *        the startup and teardown flow.
 */

#include "kcore/server.hpp"

#include <catch2/catch_test_macros.hpp>

#include <csignal>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <stdlib.h>

namespace {

std::string MakeTempDir() {
  char tmpl[] = "/tmp/kcore_server_XXXXXX";
  char* dir = ::mkdtemp(tmpl);
  REQUIRE(dir != nullptr);
  return dir;
}

kcore::ServerResult Parse(std::vector<const char*> args, kcore::ServerOptions& out) {
  return kcore::ParseServerArgs(static_cast<int>(args.size()), args.data(), out);
}

kcore::ProcessResult NoopRunner(const std::vector<std::string>&, std::string& out, int& code) {
  out.clear();
  code = 0;
  return kcore::ProcessResult::kSuccess;
}

class NullTransport final : public kcore::JoinTransport {
 public:
  kcore::expected<kcore::JoinResponse, kcore::JoinError> Do(
      const kcore::JoinRequest&) override {
    ++calls;
    return kcore::expected<kcore::JoinResponse, kcore::JoinError>::error(
        kcore::JoinError::kRequestFailed);
  }
  int calls = 0;
};

kcore::ClusterConfig TestConfig(const kcore::Paths& paths) {
  kcore::ClusterConfig c = kcore::ClusterConfig::Default(paths);
  c.spec.api.address = "192.168.1.10";
  return c;
}

class JournalComponent final : public kcore::Component {
 public:
  JournalComponent(std::string name, std::vector<std::string>* journal)
      : name_(std::move(name)), journal_(journal) {}

  const char* Name() const noexcept override { return name_.c_str(); }
  kcore::ComponentResult Init() override {
    journal_->push_back("init:" + name_);
    if (fail_init) return kcore::ComponentResult::error(kcore::ComponentError::kInitFailed);
    return kcore::ComponentResult::success();
  }
  kcore::ComponentResult Run() override {
    journal_->push_back("run:" + name_);
    if (fail_run) return kcore::ComponentResult::error(kcore::ComponentError::kRunFailed);
    return kcore::ComponentResult::success();
  }
  kcore::ComponentResult Stop() override {
    journal_->push_back("stop:" + name_);
    return kcore::ComponentResult::success();
  }

  bool fail_init = false;
  bool fail_run = false;

 private:
  std::string name_;
  std::vector<std::string>* journal_;
};

class JournalReconciler final : public kcore::Reconciler {
 public:
  JournalReconciler(std::string name, std::vector<std::string>* journal)
      : name_(std::move(name)), journal_(journal) {}

  kcore::ReconcilerResult Run() override {
    journal_->push_back("run:" + name_);
    return kcore::ReconcilerResult::success();
  }
  kcore::ReconcilerResult Stop() override {
    journal_->push_back("stop:" + name_);
    return kcore::ReconcilerResult::success();
  }

 private:
  std::string name_;
  std::vector<std::string>* journal_;
};

/// Builder adding one journaling reconciler; counts how often it is called.
kcore::ReconcilerBuilder JournalBuilder(std::vector<std::string>* journal, int* builds) {
  return [journal, builds](kcore::ReconcilerSet& set) {
    ++*builds;
    set.TryAdd("rbac", [journal]() -> kcore::expected<kcore::ReconcilerPtr, kcore::ReconcilerError> {
      return kcore::expected<kcore::ReconcilerPtr, kcore::ReconcilerError>::success(
          std::make_unique<JournalReconciler>("rbac", journal));
    });
  };
}

class RecordingBackend final : public kcore::WorkerBackend {
 public:
  explicit RecordingBackend(std::vector<std::string>* journal) : journal_(journal) {}

  kcore::expected<std::string, kcore::WorkerError> CreateBootstrapConfig(uint32_t) override {
    ++calls;
    return kcore::expected<std::string, kcore::WorkerError>::success("bootstrap-doc");
  }
  kcore::expected<void, kcore::WorkerError> SaveBootstrapConfig(const std::string&) override {
    ++calls;
    return kcore::expected<void, kcore::WorkerError>::success();
  }
  void KernelSetup() override { ++calls; }
  kcore::ComponentPtr MakeContainerRuntime() override {
    ++calls;
    return std::make_unique<JournalComponent>("containerd", journal_);
  }
  kcore::ComponentPtr MakeNodeAgent(const std::string&) override {
    ++calls;
    return std::make_unique<JournalComponent>("kubelet", journal_);
  }

  int calls = 0;

 private:
  std::vector<std::string>* journal_;
};

kcore::RetryPolicy FastRetry() {
  kcore::RetryPolicy p;
  p.attempts = 2;
  p.delay_ms = 1;
  p.max_delay_ms = 1;
  return p;
}

}  // namespace

TEST_CASE("ParseServerArgs defaults", "[server]") {
  kcore::ServerOptions opts;
  REQUIRE(Parse({}, opts).has_value());
  CHECK(opts.config_path == "k0s.yaml");
  CHECK(std::string(kcore::kDefaultConfigPath) == "k0s.yaml");
  CHECK(opts.data_dir == "/var/lib/kcore");
  CHECK(opts.profile == "default");
  CHECK_FALSE(opts.enable_worker);
  CHECK_FALSE(opts.debug);
  CHECK(opts.token.empty());
}

TEST_CASE("ParseServerArgs reads every flag and the token", "[server]") {
  kcore::ServerOptions opts;
  REQUIRE(Parse({"-c", "/etc/kcore.yaml", "--enable-worker", "--profile=edge",
                 "--data-dir", "/tmp/kcore", "--debug", "TOKEN"},
                opts).has_value());
  CHECK(opts.config_path == "/etc/kcore.yaml");
  CHECK(opts.enable_worker);
  CHECK(opts.profile == "edge");
  CHECK(opts.data_dir == "/tmp/kcore");
  CHECK(opts.debug);
  CHECK(opts.token == "TOKEN");

  kcore::ServerOptions eq;
  REQUIRE(Parse({"--config=a.json", "--profile", "p", "--data-dir=/d"}, eq).has_value());
  CHECK(eq.config_path == "a.json");
  CHECK(eq.profile == "p");
  CHECK(eq.data_dir == "/d");
}

TEST_CASE("ParseServerArgs rejects bad command lines", "[server]") {
  kcore::ServerOptions opts;
  auto unknown = Parse({"--bogus"}, opts);
  REQUIRE(!unknown);
  CHECK(unknown.get_error() == kcore::ServerError::kUsage);

  kcore::ServerOptions missing;
  auto no_value = Parse({"--config"}, missing);
  REQUIRE(!no_value);
  CHECK(no_value.get_error() == kcore::ServerError::kUsage);

  kcore::ServerOptions extra;
  auto two_tokens = Parse({"a", "b"}, extra);
  REQUIRE(!two_tokens);
  CHECK(two_tokens.get_error() == kcore::ServerError::kUsage);

  kcore::ServerOptions empty;
  CHECK_FALSE(Parse({"--profile="}, empty).has_value());
}

TEST_CASE("ExitCode maps results to process status", "[server]") {
  CHECK(kcore::ExitCode(kcore::ServerResult::success()) == 0);
  CHECK(kcore::ExitCode(kcore::ServerResult::error(kcore::ServerError::kUsage)) == 2);
  CHECK(kcore::ExitCode(kcore::ServerResult::error(kcore::ServerError::kInitFailed)) == 1);
  CHECK(kcore::ExitCode(kcore::ServerResult::error(kcore::ServerError::kWorkerFailed)) == 1);
}

TEST_CASE("PlanControlPlane registers a founder node", "[server]") {
  std::string dir = MakeTempDir();
  kcore::Paths paths = kcore::Paths::FromDataDir(dir);
  kcore::ServerOptions opts;
  kcore::ComponentManager manager;

  auto plan = kcore::PlanControlPlane(TestConfig(paths), opts, paths, manager, NoopRunner);
  REQUIRE(plan.has_value());
  CHECK_FALSE(plan.value().join);
  CHECK(plan.value().storage_type == "kine");
  CHECK(plan.value().storage_endpoint == "unix://" + paths.run_dir + "/kine.sock");
  CHECK(manager.SyncNames() == std::vector<std::string>{"certificates"});
  CHECK(manager.Names() == std::vector<std::string>{
                               "certificates", "kine", "kube-apiserver",
                               "konnectivity-server", "kube-scheduler",
                               "kube-controller-manager", "manifest-applier", "kcore-api",
                               "telemetry"});
  CHECK_FALSE(manager.IsFrozen());
}

TEST_CASE("PlanControlPlane omits telemetry when disabled", "[server]") {
  std::string dir = MakeTempDir();
  kcore::Paths paths = kcore::Paths::FromDataDir(dir);
  kcore::ClusterConfig config = TestConfig(paths);
  config.telemetry.enabled = false;
  kcore::ServerOptions opts;
  kcore::ComponentManager manager;

  REQUIRE(kcore::PlanControlPlane(config, opts, paths, manager, NoopRunner).has_value());
  CHECK(manager.Size() == 8U);
  CHECK(manager.Names().back() == "kcore-api");
}

TEST_CASE("PlanControlPlane syncs the CA first when joining", "[server]") {
  std::string dir = MakeTempDir();
  kcore::Paths paths = kcore::Paths::FromDataDir(dir);
  kcore::ClusterConfig config = TestConfig(paths);
  config.spec.storage.type = "etcd";
  kcore::ServerOptions opts;
  opts.token = kcore::EncodeToken("https://10.0.0.1:9443", "CA", "secret");
  auto transport = std::make_shared<NullTransport>();
  kcore::ComponentManager manager;

  auto plan = kcore::PlanControlPlane(config, opts, paths, manager, NoopRunner, transport);
  REQUIRE(plan.has_value());
  CHECK(plan.value().join);
  CHECK(plan.value().storage_type == "etcd");
  CHECK(manager.SyncNames() == std::vector<std::string>{"ca-syncer", "certificates"});
  CHECK(manager.Names()[2] == "etcd");
  CHECK(transport->calls == 0);
}

TEST_CASE("PlanControlPlane rejects a malformed join token", "[server]") {
  std::string dir = MakeTempDir();
  kcore::Paths paths = kcore::Paths::FromDataDir(dir);
  kcore::ServerOptions opts;
  opts.token = "not-a-token!";
  kcore::ComponentManager manager;

  auto plan = kcore::PlanControlPlane(TestConfig(paths), opts, paths, manager, NoopRunner,
                                      std::make_shared<NullTransport>());
  REQUIRE(!plan);
  CHECK(plan.get_error() == kcore::ServerError::kJoinClientFailed);
  CHECK(manager.Size() == 0U);
}

TEST_CASE("PlanControlPlane rejects an unknown storage type before registering", "[server]") {
  std::string dir = MakeTempDir();
  kcore::Paths paths = kcore::Paths::FromDataDir(dir);
  kcore::ClusterConfig config = TestConfig(paths);
  config.spec.storage.type = "bogus";
  kcore::ServerOptions opts;
  kcore::ComponentManager manager;

  auto plan = kcore::PlanControlPlane(config, opts, paths, manager, NoopRunner);
  REQUIRE(!plan);
  CHECK(plan.get_error() == kcore::ServerError::kUnknownStorageType);
  CHECK(manager.Size() == 0U);
}

TEST_CASE("PlanControlPlane requires a DNS address in the service CIDR", "[server]") {
  std::string dir = MakeTempDir();
  kcore::Paths paths = kcore::Paths::FromDataDir(dir);
  kcore::ClusterConfig config = TestConfig(paths);
  config.spec.network.service_cidr = "10.96.0.0/30";
  kcore::ServerOptions opts;
  kcore::ComponentManager manager;

  auto plan = kcore::PlanControlPlane(config, opts, paths, manager, NoopRunner);
  REQUIRE(!plan);
  CHECK(plan.get_error() == kcore::ServerError::kConfigInvalid);
  CHECK(manager.Size() == 0U);
}

TEST_CASE("RunServer fails on an invalid config file", "[server]") {
  std::string dir = MakeTempDir();
  REQUIRE(kcore::WriteFileAtomic(dir + "/kcore.json",
                                 R"({"spec":{"network":{"serviceCIDR":"nonsense"}}})", 0644)
              .has_value());
  kcore::ServerOptions opts;
  opts.config_path = dir + "/kcore.json";
  opts.data_dir = dir + "/data";

  auto r = kcore::RunServer(opts);
  REQUIRE(!r);
  CHECK(r.get_error() == kcore::ServerError::kConfigInvalid);
  CHECK(kcore::ExitCode(r) == 1);
  CHECK_FALSE(kcore::FileExists(dir + "/data"));
}

TEST_CASE("ServeNode tears down in order after a Start failure", "[server]") {
  const kcore::Paths paths = kcore::Paths::FromDataDir(MakeTempDir());
  std::vector<std::string> journal;
  kcore::ComponentManager manager;
  REQUIRE(manager.AddSync(std::make_unique<JournalComponent>("etcd", &journal)).has_value());
  auto api = std::make_unique<JournalComponent>("kube-apiserver", &journal);
  api->fail_run = true;
  REQUIRE(manager.Add(std::move(api)).has_value());
  REQUIRE(manager.Add(std::make_unique<JournalComponent>("kube-scheduler", &journal)).has_value());

  kcore::ShutdownSequencer shutdown;
  REQUIRE(shutdown.IsValid());
  RecordingBackend backend(&journal);
  int builds = 0;
  kcore::ServerOptions options;
  options.enable_worker = true;

  auto r = kcore::ServeNode(options, paths, manager, shutdown, JournalBuilder(&journal, &builds),
                            backend, FastRetry());
  REQUIRE(!r);
  CHECK(r.get_error() == kcore::ServerError::kStartFailed);
  CHECK(kcore::ExitCode(r) == 1);
  CHECK(shutdown.Signal() == SIGTERM);
  CHECK(builds == 1);
  CHECK(backend.calls == 0);
  CHECK(shutdown.State() == kcore::ShutdownState::kStopped);

  const std::vector<std::string> expected = {
      "init:etcd", "init:kube-apiserver", "init:kube-scheduler",
      "run:etcd", "run:kube-apiserver", "run:kube-scheduler",
      "stop:rbac",
      "stop:kube-scheduler", "stop:kube-apiserver", "stop:etcd"};
  CHECK(journal == expected);
}

TEST_CASE("ServeNode stops reconcilers before components when the worker fails", "[server]") {
  // No admin.conf and no kubelet.conf: the readiness wait gives up.
  const kcore::Paths paths = kcore::Paths::FromDataDir(MakeTempDir());
  std::vector<std::string> journal;
  kcore::ComponentManager manager;
  REQUIRE(manager.Add(std::make_unique<JournalComponent>("kube-apiserver", &journal)).has_value());

  kcore::ShutdownSequencer shutdown;
  RecordingBackend backend(&journal);
  int builds = 0;
  kcore::ServerOptions options;
  options.enable_worker = true;

  auto r = kcore::ServeNode(options, paths, manager, shutdown, JournalBuilder(&journal, &builds),
                            backend, FastRetry());
  REQUIRE(!r);
  CHECK(r.get_error() == kcore::ServerError::kWorkerFailed);
  CHECK(kcore::ExitCode(r) == 1);
  CHECK(shutdown.Signal() == SIGTERM);
  CHECK(backend.calls == 0);

  const std::vector<std::string> expected = {
      "init:kube-apiserver", "run:kube-apiserver", "run:rbac",
      "stop:rbac", "stop:kube-apiserver"};
  CHECK(journal == expected);
}

TEST_CASE("ServeNode hands worker components to the manager and waits for a signal", "[server]") {
  const kcore::Paths paths = kcore::Paths::FromDataDir(MakeTempDir());
  REQUIRE(kcore::WriteFileAtomic(paths.kubelet_auth_config, "kubeconfig", 0600).has_value());
  std::vector<std::string> journal;
  kcore::ComponentManager manager;
  REQUIRE(manager.Add(std::make_unique<JournalComponent>("kube-apiserver", &journal)).has_value());

  kcore::ShutdownSequencer shutdown;
  // Buffered until ServeNode reaches Wait().
  shutdown.Quit(SIGINT);
  RecordingBackend backend(&journal);
  int builds = 0;
  kcore::ServerOptions options;
  options.enable_worker = true;

  auto r = kcore::ServeNode(options, paths, manager, shutdown, JournalBuilder(&journal, &builds),
                            backend, FastRetry());
  CHECK(r.has_value());
  CHECK(kcore::ExitCode(r) == 0);
  CHECK(shutdown.Signal() == SIGINT);

  const std::vector<std::string> expected = {
      "init:kube-apiserver", "run:kube-apiserver", "run:rbac",
      "init:containerd", "init:kubelet", "run:containerd", "run:kubelet",
      "stop:rbac", "stop:kubelet", "stop:containerd", "stop:kube-apiserver"};
  CHECK(journal == expected);
}

TEST_CASE("ServeNode returns at once when Init fails", "[server]") {
  const kcore::Paths paths = kcore::Paths::FromDataDir(MakeTempDir());
  std::vector<std::string> journal;
  kcore::ComponentManager manager;
  auto etcd = std::make_unique<JournalComponent>("etcd", &journal);
  etcd->fail_init = true;
  REQUIRE(manager.AddSync(std::move(etcd)).has_value());
  REQUIRE(manager.Add(std::make_unique<JournalComponent>("kube-apiserver", &journal)).has_value());

  kcore::ShutdownSequencer shutdown;
  RecordingBackend backend(&journal);
  int builds = 0;
  kcore::ServerOptions options;
  options.enable_worker = true;

  auto r = kcore::ServeNode(options, paths, manager, shutdown, JournalBuilder(&journal, &builds),
                            backend, FastRetry());
  REQUIRE(!r);
  CHECK(r.get_error() == kcore::ServerError::kInitFailed);
  CHECK(kcore::ExitCode(r) == 1);
  CHECK(builds == 0);
  CHECK(backend.calls == 0);
  CHECK(shutdown.Signal() == 0);
  const std::vector<std::string> expected = {"init:etcd"};
  CHECK(journal == expected);
}
