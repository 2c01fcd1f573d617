#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace fbr {

enum class RotationType { NONE, SIZE, TIME };

struct RotationConfig {
  bool enabled = false;
  RotationType type = RotationType::NONE;
  std::size_t maxFileSizeBytes = 0;  // порог ротации по размеру
  std::chrono::seconds rotationInterval{0};
  std::chrono::system_clock::time_point lastRotationTime =
      std::chrono::system_clock::now();

  RotationConfig() = default;
};

class IRotatableLogger {
 public:
  virtual void setRotationConfig(const RotationConfig& config) = 0;
  virtual RotationConfig getRotationConfig() const = 0;
  virtual ~IRotatableLogger() = default;
};

}  // namespace fbr
