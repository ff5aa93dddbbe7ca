/**
 * @file test_shutdown.cpp
 * @brief Tests for shutdown.hpp
 */

#include "kcore/shutdown.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

class JournalComponent final : public kcore::Component {
 public:
  JournalComponent(std::string name, std::vector<std::string>* journal, bool fail_stop = false)
      : name_(std::move(name)), journal_(journal), fail_stop_(fail_stop) {}

  const char* Name() const noexcept override { return name_.c_str(); }
  kcore::ComponentResult Init() override { return kcore::ComponentResult::success(); }
  kcore::ComponentResult Run() override { return kcore::ComponentResult::success(); }
  kcore::ComponentResult Stop() override {
    journal_->push_back("component:" + name_);
    if (fail_stop_) return kcore::ComponentResult::error(kcore::ComponentError::kStopFailed);
    return kcore::ComponentResult::success();
  }

 private:
  std::string name_;
  std::vector<std::string>* journal_;
  bool fail_stop_;
};

class JournalReconciler final : public kcore::Reconciler {
 public:
  JournalReconciler(std::string name, std::vector<std::string>* journal)
      : name_(std::move(name)), journal_(journal) {}

  kcore::ReconcilerResult Run() override { return kcore::ReconcilerResult::success(); }
  kcore::ReconcilerResult Stop() override {
    journal_->push_back("reconciler:" + name_);
    return kcore::ReconcilerResult::success();
  }

 private:
  std::string name_;
  std::vector<std::string>* journal_;
};

kcore::ReconcilerFactory Journaled(const char* name, std::vector<std::string>* journal) {
  std::string n(name);
  return [n, journal]() -> kcore::expected<kcore::ReconcilerPtr, kcore::ReconcilerError> {
    return kcore::expected<kcore::ReconcilerPtr, kcore::ReconcilerError>::success(
        std::make_unique<JournalReconciler>(n, journal));
  };
}

}  // namespace

TEST_CASE("ShutdownSequencer allows a single instance", "[shutdown]") {
  kcore::ShutdownSequencer first;
  CHECK(first.IsValid());
  kcore::ShutdownSequencer second;
  CHECK_FALSE(second.IsValid());
  auto r = second.InstallSignalHandlers();
  REQUIRE(!r);
  CHECK(r.get_error() == kcore::ShutdownError::kAlreadyInstantiated);
}

TEST_CASE("ShutdownSequencer buffers a Quit made before Wait", "[shutdown]") {
  kcore::ShutdownSequencer shutdown;
  REQUIRE(shutdown.IsValid());
  CHECK_FALSE(shutdown.IsShutdownRequested());
  CHECK(shutdown.Signal() == 0);

  shutdown.Quit(SIGINT);
  shutdown.Quit(SIGTERM);
  CHECK(shutdown.IsShutdownRequested());
  CHECK(shutdown.Wait() == SIGINT);
}

TEST_CASE("ShutdownSequencer wakes on a delivered signal", "[shutdown]") {
  kcore::ShutdownSequencer shutdown;
  REQUIRE(shutdown.InstallSignalHandlers().has_value());

  std::thread sender([] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    (void)std::raise(SIGTERM);
  });
  int signo = shutdown.Wait();
  sender.join();
  CHECK(signo == SIGTERM);
}

TEST_CASE("Shutdown stops reconcilers before components", "[shutdown]") {
  std::vector<std::string> journal;
  kcore::ReconcilerSet reconcilers;
  REQUIRE(reconcilers.TryAdd("coredns", Journaled("coredns", &journal)));
  REQUIRE(reconcilers.TryAdd("calico", Journaled("calico", &journal)));

  kcore::ComponentManager manager;
  REQUIRE(manager.Add(std::make_unique<JournalComponent>("storage", &journal)).has_value());
  REQUIRE(manager.Add(std::make_unique<JournalComponent>("apiserver", &journal)).has_value());
  REQUIRE(manager.Init().has_value());
  REQUIRE(manager.Start().has_value());

  kcore::ShutdownSequencer shutdown;
  CHECK(shutdown.State() == kcore::ShutdownState::kRunning);
  shutdown.Quit();
  REQUIRE(shutdown.WaitForShutdown(reconcilers, manager).has_value());
  CHECK(shutdown.State() == kcore::ShutdownState::kStopped);
  CHECK(journal == std::vector<std::string>{"reconciler:coredns", "reconciler:calico",
                                            "component:apiserver", "component:storage"});

  REQUIRE(shutdown.Shutdown(reconcilers, manager).has_value());
  CHECK(journal.size() == 4U);
}

TEST_CASE("Shutdown reports components that failed to stop", "[shutdown]") {
  std::vector<std::string> journal;
  kcore::ReconcilerSet reconcilers;
  kcore::ComponentManager manager;
  REQUIRE(manager.Add(std::make_unique<JournalComponent>("stuck", &journal, true)).has_value());
  REQUIRE(manager.Add(std::make_unique<JournalComponent>("fine", &journal)).has_value());

  kcore::ShutdownSequencer shutdown;
  auto r = shutdown.Shutdown(reconcilers, manager);
  REQUIRE(!r);
  CHECK(r.get_error() == kcore::ComponentError::kStopFailed);
  CHECK(journal == std::vector<std::string>{"component:fine", "component:stuck"});
  CHECK(shutdown.State() == kcore::ShutdownState::kStopped);
}

TEST_CASE("Wait never returns before the request's signal number is set", "[shutdown]") {
  for (int i = 0; i < 200; ++i) {
    kcore::ShutdownSequencer shutdown;
    REQUIRE(shutdown.IsValid());
    std::thread requester([&shutdown] { shutdown.Quit(SIGINT); });
    int signo = shutdown.Wait();
    requester.join();
    REQUIRE(signo == SIGINT);
    REQUIRE(shutdown.IsShutdownRequested());
  }
}

TEST_CASE("Quit without a signal number requests SIGTERM", "[shutdown]") {
  kcore::ShutdownSequencer shutdown;
  shutdown.Quit(0);
  CHECK(shutdown.IsShutdownRequested());
  CHECK(shutdown.Wait() == SIGTERM);
}
