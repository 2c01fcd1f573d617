#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <unistd.h>
#include <vector>

#include "../include/auditsink.hpp"
#include "../include/fileops.hpp"
#include "../include/steprecorder.hpp"

namespace fs = std::filesystem;

namespace testutils {

/// Временный каталог, удаляемый вместе с содержимым
class TempDir {
 public:
  explicit TempDir(const std::string &prefix = "filebridge-test") {
    static std::atomic<int> counter{0};
    path_ = fs::temp_directory_path() /
            (prefix + "-" + std::to_string(::getpid()) + "-" +
             std::to_string(counter.fetch_add(1)));
    fs::remove_all(path_);
    fs::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    // Вернуть права, снятые тестами read-only
    for (auto it = fs::recursive_directory_iterator(path_, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
      fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add,
                      ec);
    }
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }
  fs::path operator/(const std::string &name) const { return path_ / name; }

 private:
  fs::path path_;
};

inline void writeFile(const fs::path &path, const std::string &content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string readFile(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

inline std::vector<char> bytes(const std::string &text) {
  return std::vector<char>(text.begin(), text.end());
}

/// Имена файлов каталога (без подкаталогов), отсортированные
inline std::vector<std::string> listNames(const fs::path &dir) {
  std::vector<std::string> names;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    names.push_back(entry.path().filename().string());
  }
  std::sort(names.begin(), names.end());
  return names;
}

/// Момент локального времени
inline std::chrono::system_clock::time_point localTime(int year, int month,
                                                       int day, int hour = 0,
                                                       int minute = 0,
                                                       int second = 0) {
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

inline fileops::Clock fixedClock(std::chrono::system_clock::time_point tp) {
  return [tp] { return tp; };
}

class MockAuditSink : public IAuditSink {
 public:
  MOCK_METHOD(void, publish, (const AuditEvent &event), (override));
};

/// Запоминает события для проверок по типу
class RecordingAuditSink : public IAuditSink {
 public:
  void publish(const AuditEvent &event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  }

  std::vector<AuditEvent> events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  std::size_t count(AuditEventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(events_.begin(), events_.end(),
                      [type](const AuditEvent &e) { return e.type == type; }));
  }

 private:
  mutable std::mutex mutex_;
  std::vector<AuditEvent> events_;
};

class MockStepRecorder : public IStepRecorder {
 public:
  MOCK_METHOD(void, recordFile,
              (const std::string &fileName, const std::string &destination,
               std::uintmax_t bytes),
              (override));
};

}  // namespace testutils
