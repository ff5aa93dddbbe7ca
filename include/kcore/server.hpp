/**
 * @file server.hpp
 * @brief The "server" command: plan, initialize, start and supervise a
 *        control-plane node until it is asked to stop.
 *
 * Control flow of RunServer():
 *   1. Load and validate the cluster config, create the data and cert dirs.
 *   2. PlanControlPlane(): join decision, storage selection, registration.
 *   3. ServeNode(): ComponentManager::Init() (fail-fast) and Start()
 *      (best-effort).
 *   4. Build the add-on reconcilers; run them if Start succeeded.
 *   5. Optionally enable the worker role.
 *   6. Wait for SIGINT/SIGTERM (or a synthesized request after a start or
 *      worker failure), then stop reconcilers and components.
 */

#ifndef KCORE_SERVER_HPP_
#define KCORE_SERVER_HPP_

#include "kcore/certificates.hpp"
#include "kcore/cluster_config.hpp"
#include "kcore/component_manager.hpp"
#include "kcore/constants.hpp"
#include "kcore/control_plane.hpp"
#include "kcore/join_client.hpp"
#include "kcore/log.hpp"
#include "kcore/reconcilers.hpp"
#include "kcore/shutdown.hpp"
#include "kcore/storage.hpp"
#include "kcore/supervisor.hpp"
#include "kcore/vocabulary.hpp"
#include "kcore/worker.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace kcore {

enum class ServerError : uint8_t {
  kUsage = 0,
  kConfigInvalid,
  kDirectoryFailed,
  kJoinClientFailed,
  kUnknownStorageType,
  kRegistrationFailed,
  kSignalSetupFailed,
  kInitFailed,
  kStartFailed,
  kWorkerFailed,
};

inline const char* ServerErrorToString(ServerError e) noexcept {
  switch (e) {
    case ServerError::kUsage:              return "usage error";
    case ServerError::kConfigInvalid:      return "invalid configuration";
    case ServerError::kDirectoryFailed:    return "cannot create directory";
    case ServerError::kJoinClientFailed:   return "failed to create join client";
    case ServerError::kUnknownStorageType: return "invalid storage type";
    case ServerError::kRegistrationFailed: return "component registration failed";
    case ServerError::kSignalSetupFailed:  return "signal setup failed";
    case ServerError::kInitFailed:         return "component init failed";
    case ServerError::kStartFailed:        return "component start failed";
    case ServerError::kWorkerFailed:       return "worker enablement failed";
  }
  return "unknown";
}

using ServerResult = expected<void, ServerError>;

/// @brief Process exit status: 0 on graceful shutdown, 2 on usage errors,
///        1 on anything else.
inline int ExitCode(const ServerResult& r) noexcept {
  if (r.has_value()) return 0;
  return (r.get_error() == ServerError::kUsage) ? 2 : 1;
}

struct ServerOptions {
  std::string config_path = kDefaultConfigPath;
  bool enable_worker = false;
  std::string profile = kDefaultWorkerProfile;
  std::string data_dir = kDefaultDataDir;
  bool debug = false;
  std::string token;  ///< Join token; empty in founder mode.
};

// ============================================================================
// Command line
// ============================================================================

/**
 * @brief Parse the arguments following "server".
 *
 * server [-c|--config FILE] [--enable-worker] [--profile NAME]
 *        [--data-dir DIR] [--debug] [join-token]
 */
inline ServerResult ParseServerArgs(int argc, const char* const* argv, ServerOptions& out) {
  bool have_token = false;
  for (int i = 0; i < argc; ++i) {
    const char* arg = argv[i];
    auto next = [&](const char* flag) -> const char* {
      if (i + 1 >= argc) {
        KCORE_LOG_ERROR("Server", "%s requires a value", flag);
        return nullptr;
      }
      return argv[++i];
    };
    if (std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--config") == 0) {
      const char* v = next(arg);
      if (v == nullptr) return ServerResult::error(ServerError::kUsage);
      out.config_path = v;
    } else if (std::strncmp(arg, "--config=", 9) == 0) {
      out.config_path = arg + 9;
    } else if (std::strcmp(arg, "--enable-worker") == 0) {
      out.enable_worker = true;
    } else if (std::strcmp(arg, "--profile") == 0) {
      const char* v = next(arg);
      if (v == nullptr) return ServerResult::error(ServerError::kUsage);
      out.profile = v;
    } else if (std::strncmp(arg, "--profile=", 10) == 0) {
      out.profile = arg + 10;
    } else if (std::strcmp(arg, "--data-dir") == 0) {
      const char* v = next(arg);
      if (v == nullptr) return ServerResult::error(ServerError::kUsage);
      out.data_dir = v;
    } else if (std::strncmp(arg, "--data-dir=", 11) == 0) {
      out.data_dir = arg + 11;
    } else if (std::strcmp(arg, "--debug") == 0) {
      out.debug = true;
    } else if (arg[0] == '-') {
      KCORE_LOG_ERROR("Server", "unknown flag %s", arg);
      return ServerResult::error(ServerError::kUsage);
    } else if (!have_token) {
      out.token = arg;
      have_token = true;
    } else {
      KCORE_LOG_ERROR("Server", "unexpected argument %s", arg);
      return ServerResult::error(ServerError::kUsage);
    }
  }
  if (out.config_path.empty() || out.profile.empty() || out.data_dir.empty()) {
    KCORE_LOG_ERROR("Server", "empty flag value");
    return ServerResult::error(ServerError::kUsage);
  }
  return ServerResult::success();
}

// ============================================================================
// Planning
// ============================================================================

struct ControlPlanePlan {
  bool join = false;
  std::string storage_type;
  std::string storage_endpoint;
};

/**
 * @brief Decide founder/join mode, select storage and register the
 *        control-plane components with @p manager. Nothing is started.
 *
 * Registration happens only after every fallible decision, so on error the
 * manager is left empty.
 *
 * @param transport Join transport; nullptr selects CurlTransport.
 */
inline expected<ControlPlanePlan, ServerError> PlanControlPlane(
    const ClusterConfig& config, const ServerOptions& options, const Paths& paths,
    ComponentManager& manager, const CommandRunner& runner,
    std::shared_ptr<JoinTransport> transport = nullptr) {
  using Result = expected<ControlPlanePlan, ServerError>;
  ControlPlanePlan plan;

  KCORE_LOG_INFO("Server", "using public address: %s", config.spec.api.address.c_str());
  std::string sans;
  for (const auto& s : config.spec.api.sans) sans += (sans.empty() ? "" : ",") + s;
  KCORE_LOG_INFO("Server", "using sans: [%s]", sans.c_str());
  auto dns = config.spec.network.DNSAddress();
  if (!dns) {
    KCORE_LOG_ERROR("Server", "no DNS address in service CIDR %s",
                    config.spec.network.service_cidr.c_str());
    return Result::error(ServerError::kConfigInvalid);
  }
  KCORE_LOG_INFO("Server", "DNS address: %s", dns.value().c_str());

  optional<JoinClient> client;
  if (!options.token.empty()) {
    plan.join = true;
    if (transport == nullptr) {
      transport = std::make_shared<CurlTransport>(paths.cert_dir, runner);
    }
    auto c = JoinClient::FromToken(options.token, transport);
    if (!c) {
      KCORE_LOG_ERROR("Server", "failed to create join client: %s",
                      JoinErrorToString(c.get_error()));
      return Result::error(ServerError::kJoinClientFailed);
    }
    client = std::move(c.value());
  }

  CertificateManager certs(paths, runner);
  auto storage = SelectStorageBackend(config, plan.join, certs, client, paths);
  if (!storage) return Result::error(ServerError::kUnknownStorageType);
  plan.storage_type =
      config.spec.storage.type.empty() ? kKineStorageType : config.spec.storage.type;
  plan.storage_endpoint = storage.value()->Endpoint();
  KCORE_LOG_INFO("Server", "using storage backend %s", plan.storage_type.c_str());

  std::vector<ComponentResult> added;
  if (client.has_value()) {
    added.push_back(manager.AddSync(
        std::make_unique<CertificateAuthoritySyncer>(client.value(), paths)));
  }
  added.push_back(manager.AddSync(std::make_unique<CertificateIssuer>(config, certs)));
  added.push_back(manager.Add(std::move(storage.value())));
  added.push_back(manager.Add(
      std::make_unique<ApiServer>(config, plan.storage_endpoint, certs, paths)));
  added.push_back(manager.Add(std::make_unique<Konnectivity>(certs, paths)));
  added.push_back(manager.Add(std::make_unique<Scheduler>(paths)));
  added.push_back(manager.Add(std::make_unique<ControllerManager>(config, certs, paths)));
  added.push_back(manager.Add(std::make_unique<ManifestApplier>(paths, runner)));
  added.push_back(manager.Add(std::make_unique<ControlApi>(options.config_path, paths)));
  if (config.telemetry.enabled) {
    added.push_back(manager.Add(std::make_unique<TelemetryReporter>(config, paths, runner)));
  }
  for (const auto& r : added) {
    if (!r) return Result::error(ServerError::kRegistrationFailed);
  }
  return Result::success(std::move(plan));
}

// ============================================================================
// Run
// ============================================================================

/// @brief Startup phase timings, logged at debug level.
class StartupTimer final {
 public:
  explicit StartupTimer(const char* name)
      : name_(name), start_(std::chrono::steady_clock::now()) {}

  void Checkpoint(const char* label) {
    marks_.emplace_back(label, std::chrono::steady_clock::now());
  }

  void Output() const {
    for (const auto& m : marks_) {
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(m.second - start_);
      KCORE_LOG_DEBUG("Server", "%s: %s at %lld ms", name_, m.first,
                      static_cast<long long>(ms.count()));
    }
  }

 private:
  const char* name_;
  std::chrono::steady_clock::time_point start_;
  std::vector<std::pair<const char*, std::chrono::steady_clock::time_point>> marks_;
};

/// Populates the add-on reconcilers once the components were started.
using ReconcilerBuilder = std::function<void(ReconcilerSet&)>;

/**
 * @brief Drive a planned node: Init, Start, reconcilers, optional worker
 *        role, then block until a shutdown request and tear down.
 *
 * A Start or worker failure requests SIGTERM on @p shutdown so the normal
 * teardown runs; reconcilers are built but not run after a Start failure and
 * the worker step is skipped. An Init failure returns at once.
 *
 * @param worker_backend Used only when options.enable_worker is set.
 */
inline ServerResult ServeNode(const ServerOptions& options, const Paths& paths,
                              ComponentManager& manager, ShutdownSequencer& shutdown,
                              const ReconcilerBuilder& build_reconcilers,
                              WorkerBackend& worker_backend,
                              const RetryPolicy& worker_retry = RetryPolicy()) {
  StartupTimer timer("server-start");

  timer.Checkpoint("starting-component-init");
  if (!manager.Init()) return ServerResult::error(ServerError::kInitFailed);
  timer.Checkpoint("finished-component-init");

  ServerResult result = ServerResult::success();

  timer.Checkpoint("starting-components");
  auto started = manager.Start();
  timer.Checkpoint("finished-starting-components");
  if (!started) {
    KCORE_LOG_ERROR("Server", "failed to start server components: %s",
                    ComponentErrorToString(started.get_error()));
    result = ServerResult::error(ServerError::kStartFailed);
    shutdown.Quit(SIGTERM);
  }

  timer.Checkpoint("starting-reconcilers");
  ReconcilerSet reconcilers;
  if (build_reconcilers) build_reconcilers(reconcilers);
  if (result.has_value()) reconcilers.RunAll();
  timer.Checkpoint("started-reconcilers");

  if (result.has_value() && options.enable_worker) {
    timer.Checkpoint("starting-worker");
    WorkerEnabler enabler(paths, worker_backend, worker_retry);
    auto worker = enabler.Enable(manager, options.profile);
    if (!worker) {
      KCORE_LOG_ERROR("Server", "failed to start worker components: %s",
                      WorkerErrorToString(worker.get_error()));
      result = ServerResult::error(ServerError::kWorkerFailed);
      shutdown.Quit(SIGTERM);
    } else {
      timer.Checkpoint("started-worker");
    }
  }

  timer.Output();

  int signo = shutdown.Wait();
  KCORE_LOG_INFO("Server", "shutting down kcore server (signal %d)", signo);
  auto stopped = shutdown.Shutdown(reconcilers, manager);
  if (!stopped) {
    KCORE_LOG_ERROR("Server", "error while stopping components");
  }
  return result;
}

/**
 * @brief Run the control plane until SIGINT/SIGTERM.
 * @return success after a graceful shutdown; the startup error otherwise.
 */
inline ServerResult RunServer(const ServerOptions& options) {
  if (options.debug) log::SetLevel(log::Level::kDebug);

  const Paths paths = Paths::FromDataDir(options.data_dir);
  auto config = LoadClusterConfig(options.config_path, paths);
  if (!config) return ServerResult::error(ServerError::kConfigInvalid);

  if (!InitDirectory(paths.data_dir, kDataDirMode)) {
    KCORE_LOG_ERROR("Server", "cannot create %s", paths.data_dir.c_str());
    return ServerResult::error(ServerError::kDirectoryFailed);
  }
  if (!InitDirectory(paths.cert_dir, kCertRootDirMode)) {
    KCORE_LOG_ERROR("Server", "cannot create %s", paths.cert_dir.c_str());
    return ServerResult::error(ServerError::kDirectoryFailed);
  }

  const CommandRunner runner = SystemCommandRunner();
  ComponentManager manager;
  auto plan = PlanControlPlane(config.value(), options, paths, manager, runner);
  if (!plan) return ServerResult::error(plan.get_error());

  // Installed before Init so a request during startup stays buffered.
  ShutdownSequencer shutdown;
  if (!shutdown.InstallSignalHandlers()) {
    KCORE_LOG_ERROR("Server", "cannot install signal handlers");
    return ServerResult::error(ServerError::kSignalSetupFailed);
  }

  const ClusterConfig& cluster = config.value();
  SystemWorkerBackend worker_backend(cluster, paths, runner);
  return ServeNode(
      options, paths, manager, shutdown,
      [&cluster, &paths](ReconcilerSet& set) { BuildClusterReconcilers(cluster, paths, set); },
      worker_backend);
}

}  // namespace kcore

#endif  // KCORE_SERVER_HPP_
