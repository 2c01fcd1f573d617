#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

#include "../include/auditsink.hpp"
#include "../include/executioncontext.hpp"
#include "../include/steprecorder.hpp"
#include "fbr/MetricsCollector.hpp"
#include "testutils.hpp"

TEST(AuditEventTest, JsonCarriesNonEmptyFields) {
  AuditEvent event;
  event.type = AuditEventType::FILE_TRANSFERRED;
  event.flow = "invoices";
  event.fileName = "a.pdf";
  event.path = "/out/a.pdf";
  event.bytes = 42;
  event.timestamp = testutils::localTime(2024, 3, 1, 10, 0, 0);

  auto json = event.toJson();
  EXPECT_EQ(json["event"], "FILE_TRANSFERRED");
  EXPECT_EQ(json["flow"], "invoices");
  EXPECT_EQ(json["file"], "a.pdf");
  EXPECT_EQ(json["path"], "/out/a.pdf");
  EXPECT_EQ(json["bytes"], 42);
  EXPECT_EQ(json["timestamp"], "2024-03-01T10:00:00");
  EXPECT_FALSE(json.contains("detail"));
}

TEST(AuditEventTest, RunEventHasNoFileFields) {
  AuditEvent event;
  event.type = AuditEventType::RUN_COMPLETED;
  event.flow = "f";
  event.detail = "summary";

  auto json = event.toJson();
  EXPECT_EQ(json["event"], "RUN_COMPLETED");
  EXPECT_EQ(json["detail"], "summary");
  EXPECT_FALSE(json.contains("file"));
  EXPECT_FALSE(json.contains("path"));
}

TEST(AuditEventTest, LoggerSinkToleratesInvalidUtf8) {
  AuditEvent event;
  event.flow = "f";
  event.fileName = std::string("bad\xff\xfe", 5);
  EXPECT_NO_THROW(LoggerAuditSink().publish(event));
}

TEST(StepRecorderTest, KeepsStepsAndUpdatesCounters) {
  auto &metrics = fbr::MetricsCollector::instance();
  MetricsStepRecorder recorder;
  const double collectedBefore = metrics.counterValue("files_collected");
  const double deliveredBefore = metrics.counterValue("files_delivered");
  const double bytesBefore = metrics.counterValue("bytes_delivered");

  recorder.recordFile("a.txt", IStepRecorder::kReadForProcessing, 10);
  recorder.recordFile("a.txt", "/out/a.txt", 10);
  recorder.recordFile("b.txt", "/out/b.txt", 5);

  auto steps = recorder.steps();
  ASSERT_EQ(steps.size(), 3u);
  EXPECT_EQ(steps[0].destination, IStepRecorder::kReadForProcessing);
  EXPECT_EQ(steps[2].fileName, "b.txt");
  EXPECT_EQ(steps[2].bytes, 5u);

  EXPECT_DOUBLE_EQ(metrics.counterValue("files_collected") - collectedBefore, 1.0);
  EXPECT_DOUBLE_EQ(metrics.counterValue("files_delivered") - deliveredBefore, 2.0);
  EXPECT_DOUBLE_EQ(metrics.counterValue("bytes_delivered") - bytesBefore, 15.0);
}

TEST(StepRecorderTest, BeginRunClearsStepsButKeepsCounters) {
  auto &metrics = fbr::MetricsCollector::instance();
  MetricsStepRecorder recorder;
  recorder.recordFile("a.txt", "/out/a.txt", 7);
  const double deliveredAfterFirst = metrics.counterValue("files_delivered");

  recorder.beginRun();
  EXPECT_TRUE(recorder.steps().empty());
  EXPECT_DOUBLE_EQ(metrics.counterValue("files_delivered"), deliveredAfterFirst);

  recorder.recordFile("b.txt", IStepRecorder::kReadForProcessing, 3);
  ASSERT_EQ(recorder.steps().size(), 1u);
  EXPECT_EQ(recorder.steps()[0].fileName, "b.txt");
}

TEST(AuditEventTest, PublishAuditContainsSinkFailure) {
  testutils::MockAuditSink sink;
  EXPECT_CALL(sink, publish(::testing::_))
      .WillOnce(::testing::Throw(std::runtime_error("audit down")));

  AuditEvent event;
  event.type = AuditEventType::RUN_COMPLETED;
  event.flow = "f";
  EXPECT_NO_THROW(publishAudit(sink, event));
}

TEST(ExecutionContextTest, FlagsAndDeliveryState) {
  ExecutionContext context("flow");
  EXPECT_EQ(context.flowName(), "flow");
  EXPECT_FALSE(context.receiverProcessingSuccessful().has_value());
  EXPECT_FALSE(context.flag(ExecutionContext::kSkipPostProcessing));

  context.attributes()[ExecutionContext::kSkipPostProcessing] = "yes";
  EXPECT_FALSE(context.flag(ExecutionContext::kSkipPostProcessing));
  EXPECT_TRUE(context.flag(ExecutionContext::kSkipPostProcessing, true));

  context.attributes()[ExecutionContext::kSkipPostProcessing] = true;
  EXPECT_TRUE(context.flag(ExecutionContext::kSkipPostProcessing));

  context.setReceiverProcessingSuccessful(false);
  context.addSuccessfulFile("a.txt");
  EXPECT_EQ(context.receiverProcessingSuccessful(), std::optional<bool>(false));
  EXPECT_EQ(context.successfulFiles(), std::vector<std::string>{"a.txt"});
}
