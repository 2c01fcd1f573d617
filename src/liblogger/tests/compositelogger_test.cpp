#include <gtest/gtest.h>

#include <vector>

#include "fbr/compositelogger.hpp"

namespace {

class RecordingLogger : public fbr::ILogger {
 public:
  void init(const fbr::LogLevel level) override { setLogLevel(level); }
  void setLogLevel(fbr::LogLevel level) override { currentLevel_ = level; }
  void flush() override { ++flushes; }

  std::vector<std::string> lines;
  int flushes = 0;

 protected:
  void log(fbr::LogLevel level, const std::string& message) override {
    if (shouldSkipLog(level)) return;
    lines.push_back(fbr::leveltoString(level) + ":" + message);
  }
  bool shouldSkipLog(fbr::LogLevel level) const override {
    return static_cast<int>(level) < static_cast<int>(currentLevel_.load());
  }
};

}  // namespace

TEST(CompositeLoggerTest, FansOutToEveryLogger) {
  auto first = std::make_shared<RecordingLogger>();
  auto second = std::make_shared<RecordingLogger>();
  fbr::CompositeLogger composite{first, second};

  composite.warning("disk almost full");

  ASSERT_EQ(first->lines.size(), 1u);
  ASSERT_EQ(second->lines.size(), 1u);
  EXPECT_EQ(first->lines[0], "WARNING:disk almost full");
}

TEST(CompositeLoggerTest, LevelPropagatesToChildren) {
  auto child = std::make_shared<RecordingLogger>();
  fbr::CompositeLogger composite;
  composite.addLogger(child);
  composite.setLogLevel(fbr::LogLevel::LOG_ERROR);

  composite.info("dropped");
  composite.error("kept");

  ASSERT_EQ(child->lines.size(), 1u);
  EXPECT_EQ(child->lines[0], "ERROR:kept");
}

TEST(CompositeLoggerTest, AddIsIdempotentAndRemoveWorks) {
  auto child = std::make_shared<RecordingLogger>();
  fbr::CompositeLogger composite;
  composite.addLogger(child);
  composite.addLogger(child);
  EXPECT_EQ(composite.loggerCount(), 1u);

  composite.removeLogger(child);
  composite.info("nobody listens");
  EXPECT_TRUE(child->lines.empty());
}

TEST(CompositeLoggerTest, FlushReachesChildren) {
  auto child = std::make_shared<RecordingLogger>();
  fbr::CompositeLogger composite{child};
  composite.flush();
  EXPECT_EQ(child->flushes, 1);
}
