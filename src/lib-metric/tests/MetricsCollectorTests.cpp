#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "fbr/MetricsCollector.hpp"

using namespace fbr;

class MetricsCollectorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    collector_ = &MetricsCollector::instance();
    // Сброс состояния перед каждым тестом
    collector_->reset();
  }

  MetricsCollector* collector_;
};

// 1. Тест базовой функциональности счетчиков
TEST_F(MetricsCollectorTest, CounterBasicOperations) {
  EXPECT_NO_THROW(
      collector_->registerCounter("files_delivered", "Delivered files"));

  collector_->incrementCounter("files_delivered");
  collector_->incrementCounter("files_delivered", 2);

  EXPECT_DOUBLE_EQ(collector_->counterValue("files_delivered"), 3.0);
  std::string metrics = collector_->exportPrometheus();
  EXPECT_NE(metrics.find("filebridge_files_delivered 3"), std::string::npos);
  EXPECT_NE(metrics.find("# HELP filebridge_files_delivered Delivered files"),
            std::string::npos);
}

// 2. Тест обработки ошибок
TEST_F(MetricsCollectorTest, ErrorHandling) {
  collector_->registerCounter("errors");
  EXPECT_TRUE(collector_->hasCounter("errors"));
  EXPECT_THROW(collector_->registerCounter("errors"), std::runtime_error);

  // Инкремент незарегистрированного счетчика
  EXPECT_NO_THROW(collector_->incrementCounter("unknown_metric"));
  EXPECT_FALSE(collector_->hasCounter("unknown_metric"));
  EXPECT_DOUBLE_EQ(collector_->counterValue("unknown_metric"), 0.0);
}

TEST_F(MetricsCollectorTest, EnsureCounterIsIdempotent) {
  collector_->ensureCounter("files_collected", "Collected files");
  collector_->incrementCounter("files_collected");
  EXPECT_NO_THROW(collector_->ensureCounter("files_collected"));
  EXPECT_DOUBLE_EQ(collector_->counterValue("files_collected"), 1.0);
}

TEST_F(MetricsCollectorTest, RejectsInvalidNames) {
  EXPECT_THROW(collector_->registerCounter(""), std::invalid_argument);
  EXPECT_THROW(collector_->registerCounter("9lives"), std::invalid_argument);
  EXPECT_THROW(collector_->registerCounter("bytes-delivered"),
               std::invalid_argument);
}

// 3. Тест работы с временем выполнения задач
TEST_F(MetricsCollectorTest, TaskTimeRecording) {
  collector_->recordTaskTime("file_transfer_time",
                             std::chrono::milliseconds(150));
  collector_->recordTaskTime("file_transfer_time",
                             std::chrono::milliseconds(350));

  EXPECT_EQ(collector_->taskCount("file_transfer_time"), 2u);
  EXPECT_EQ(collector_->taskTimeSum("file_transfer_time"), 500u);

  std::string metrics = collector_->exportPrometheus();
  EXPECT_NE(metrics.find("filebridge_file_transfer_time_sum 500"),
            std::string::npos);
  EXPECT_NE(metrics.find("filebridge_file_transfer_time_count 2"),
            std::string::npos);
}

// 4. Тест многопоточной работы
TEST_F(MetricsCollectorTest, ConcurrentAccess) {
  constexpr int THREADS = 4;
  constexpr int ITERATIONS = 10000;

  collector_->registerCounter("concurrent_counter");

  auto worker = [this]() {
    for (int i = 0; i < ITERATIONS; ++i) {
      collector_->incrementCounter("concurrent_counter");
    }
  };

  std::vector<std::thread> threads;
  for (int i = 0; i < THREADS; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_DOUBLE_EQ(collector_->counterValue("concurrent_counter"),
                   THREADS * ITERATIONS);
}

TEST_F(MetricsCollectorTest, ResetClearsEverything) {
  collector_->registerCounter("files_collected");
  collector_->incrementCounter("files_collected");
  collector_->recordTaskTime("file_transfer_time",
                             std::chrono::milliseconds(5));

  collector_->reset();

  EXPECT_FALSE(collector_->hasCounter("files_collected"));
  EXPECT_EQ(collector_->taskCount("file_transfer_time"), 0u);
  EXPECT_TRUE(collector_->exportPrometheus().empty());
}

// 5. Тест формата экспорта
TEST_F(MetricsCollectorTest, ExportFormatValidation) {
  collector_->registerCounter("format_test", "Test help text");
  collector_->incrementCounter("format_test", 3.5);

  std::string expected =
      "# HELP filebridge_format_test Test help text\n"
      "# TYPE filebridge_format_test counter\n"
      "filebridge_format_test 3.5\n";

  EXPECT_NE(collector_->exportPrometheus().find(expected), std::string::npos);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
