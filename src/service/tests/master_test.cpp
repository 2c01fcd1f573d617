#include <gtest/gtest.h>

#include <functional>
#include <thread>

#include "../include/master.hpp"
#include "../include/worker.hpp"
#include "testutils.hpp"

using testutils::TempDir;

namespace {

bool waitFor(const std::function<bool()> &condition,
             std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

FlowConfig makeFlow(const TempDir &dir, const std::string &name,
                    bool enabled = true) {
  fs::create_directories(dir / (name + "/in"));
  return FlowConfig::fromJson({{"name", name},
                               {"sourceDirectory", (dir / (name + "/in")).string()},
                               {"targetDirectory", (dir / (name + "/out")).string()},
                               {"postProcessAction", "DELETE"},
                               {"pollInterval", 1},
                               {"enabled", enabled}});
}

}  // namespace

// ============= Master::runOnce =============

TEST(MasterTest, RunOnceProcessesEnabledFlows) {
  TempDir dir;
  auto first = makeFlow(dir, "first");
  auto second = makeFlow(dir, "second");
  auto disabled = makeFlow(dir, "disabled", false);
  testutils::writeFile(dir / "first/in/a.txt", "a");
  testutils::writeFile(dir / "second/in/b.txt", "b");
  testutils::writeFile(dir / "disabled/in/c.txt", "c");

  Master master([&] { return std::vector<FlowConfig>{first, second, disabled}; });
  std::vector<RunReport> reports;

  EXPECT_EQ(master.runOnce(&reports), 0);
  ASSERT_EQ(reports.size(), 2u);
  EXPECT_EQ(reports[0].flowName, "first");
  EXPECT_EQ(reports[0].delivered, 1u);
  EXPECT_EQ(reports[1].flowName, "second");
  EXPECT_TRUE(fs::exists(dir / "first/out/a.txt"));
  EXPECT_TRUE(fs::exists(dir / "second/out/b.txt"));
  EXPECT_TRUE(fs::exists(dir / "disabled/in/c.txt"));
  EXPECT_FALSE(fs::exists(dir / "disabled/out"));
  EXPECT_EQ(master.getWorkerCount(), 0u);
}

TEST(MasterTest, RunOnceFatalErrorGivesExitCodeOne) {
  TempDir dir;
  auto good = makeFlow(dir, "good");
  auto broken = makeFlow(dir, "broken");
  broken.sourceDirectory = (dir / "missing").string();
  testutils::writeFile(dir / "good/in/a.txt", "a");

  Master master([&] { return std::vector<FlowConfig>{broken, good}; });
  std::vector<RunReport> reports;

  EXPECT_EQ(master.runOnce(&reports), 1);
  ASSERT_EQ(reports.size(), 2u);
  EXPECT_TRUE(reports[0].fatalError.has_value());
  EXPECT_FALSE(reports[0].succeeded());
  EXPECT_EQ(reports[1].delivered, 1u);
}

TEST(MasterTest, RunOnceFileErrorsDoNotChangeExitCode) {
  TempDir dir;
  auto flow = makeFlow(dir, "flow");
  testutils::writeFile(dir / "flow/in/a.txt", "a");
  fs::create_directories(dir / "flow/out/a.txt");

  Master master([&] { return std::vector<FlowConfig>{flow}; });
  std::vector<RunReport> reports;

  EXPECT_EQ(master.runOnce(&reports), 0);
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].errors, 1u);
}

TEST(MasterTest, MetricsSnapshotCoversTransfers) {
  TempDir dir;
  auto flow = makeFlow(dir, "flow");
  testutils::writeFile(dir / "flow/in/a.txt", "abc");

  Master master([&] { return std::vector<FlowConfig>{flow}; });
  ASSERT_EQ(master.runOnce(), 0);

  const std::string snapshot = master.metricsSnapshot();
  EXPECT_NE(snapshot.find("files_delivered"), std::string::npos) << snapshot;
  EXPECT_NE(snapshot.find("bytes_delivered"), std::string::npos) << snapshot;
  EXPECT_NE(snapshot.find("file_transfer_time_count"), std::string::npos)
      << snapshot;
}

// ============= Master::start/stop =============

TEST(MasterTest, StartSpawnsWorkerPerEnabledFlow) {
  TempDir dir;
  auto flows = std::vector<FlowConfig>{makeFlow(dir, "one"), makeFlow(dir, "two"),
                                       makeFlow(dir, "off", false)};
  testutils::writeFile(dir / "one/in/a.txt", "a");

  Master master([&] { return flows; });
  ASSERT_TRUE(master.start());
  EXPECT_EQ(master.getState(), Master::State::RUNNING);
  EXPECT_EQ(master.getWorkerCount(), 2u);
  EXPECT_FALSE(master.start());

  EXPECT_TRUE(waitFor([&] { return fs::exists(dir / "one/out/a.txt"); }));
  master.healthCheck();
  EXPECT_EQ(master.getWorkerCount(), 2u);

  master.stop();
  EXPECT_EQ(master.getState(), Master::State::STOPPED);
  EXPECT_EQ(master.getWorkerCount(), 0u);
}

TEST(MasterTest, ProviderFailureIsFatal) {
  Master master([]() -> std::vector<FlowConfig> {
    throw std::runtime_error("config unavailable");
  });
  EXPECT_FALSE(master.start());
  EXPECT_EQ(master.getState(), Master::State::FATAL);
  master.stop();
  EXPECT_EQ(master.getState(), Master::State::STOPPED);
}

// ============= Worker =============

TEST(WorkerTest, RunsImmediatelyAndStops) {
  TempDir dir;
  auto flow = makeFlow(dir, "flow");
  testutils::writeFile(dir / "flow/in/a.txt", "a");
  auto audit = std::make_shared<testutils::RecordingAuditSink>();

  Worker worker(flow, audit);
  EXPECT_FALSE(worker.lastReport().has_value());

  worker.start();
  EXPECT_TRUE(worker.isRunning());
  ASSERT_TRUE(waitFor([&] { return worker.runsCompleted() >= 1; }));

  auto report = worker.lastReport();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->delivered, 1u);
  EXPECT_GE(audit->count(AuditEventType::RUN_COMPLETED), 1u);

  worker.stop();
  EXPECT_FALSE(worker.isRunning());
  EXPECT_FALSE(worker.isAlive());
}

TEST(WorkerTest, FatalRunKeepsWorkerAlive) {
  TempDir dir;
  auto flow = makeFlow(dir, "flow");
  flow.sourceDirectory = (dir / "missing").string();

  Worker worker(flow, std::make_shared<testutils::RecordingAuditSink>());
  worker.start();
  ASSERT_TRUE(waitFor([&] { return worker.runsCompleted() >= 1; }));

  auto report = worker.lastReport();
  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(report->fatalError.has_value());
  EXPECT_TRUE(worker.isAlive());
  worker.stop();
}

TEST(WorkerTest, PauseAndResume) {
  TempDir dir;
  auto flow = makeFlow(dir, "flow");
  Worker worker(flow, std::make_shared<testutils::RecordingAuditSink>());

  worker.pause();
  EXPECT_FALSE(worker.isPaused());

  worker.start();
  ASSERT_TRUE(waitFor([&] { return worker.runsCompleted() >= 1; }));
  worker.pause();
  EXPECT_TRUE(worker.isPaused());

  const auto runs = worker.runsCompleted();
  testutils::writeFile(dir / "flow/in/late.txt", "x");
  std::this_thread::sleep_for(std::chrono::milliseconds(1500));
  EXPECT_LE(worker.runsCompleted(), runs + 1);

  worker.resume();
  EXPECT_FALSE(worker.isPaused());
  EXPECT_TRUE(waitFor([&] { return fs::exists(dir / "flow/out/late.txt"); }));

  worker.stopGracefully();
  EXPECT_FALSE(worker.isRunning());
}

TEST(WorkerTest, RestartAfterStop) {
  TempDir dir;
  auto flow = makeFlow(dir, "flow");
  Worker worker(flow, std::make_shared<testutils::RecordingAuditSink>());

  worker.start();
  ASSERT_TRUE(waitFor([&] { return worker.runsCompleted() >= 1; }));
  worker.restart();
  EXPECT_TRUE(worker.isRunning());
  ASSERT_TRUE(waitFor([&] { return worker.runsCompleted() >= 2; }));
  worker.stop();
}
