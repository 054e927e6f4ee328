#pragma once

#include <cstdint>
#include <string>

namespace matrixforge {

struct RuntimeConfig {
  int shards{0}; // 0 = auto (hardware_concurrency)
  int executors{2};
  int max_queue_length{1024};

  auto operator==(const RuntimeConfig &) const -> bool = default;
};

struct OrchestratorConfig {
  int poll_interval_ms{1000};
  int cancel_debounce{5};
  int queue_report_after_ms{5000};

  auto operator==(const OrchestratorConfig &) const -> bool = default;
};

struct StorageConfig {
  std::string root{"./matrixforge-data"};

  auto operator==(const StorageConfig &) const -> bool = default;
};

struct ExecutorConfig {
  int timeout_sec{3600};
  std::string shell{"/bin/sh"};

  auto operator==(const ExecutorConfig &) const -> bool = default;
};

struct LogConfig {
  std::string level{"info"};
  std::string file;

  auto operator==(const LogConfig &) const -> bool = default;
};

struct SystemConfig {
  RuntimeConfig runtime;
  OrchestratorConfig orchestrator;
  StorageConfig storage;
  ExecutorConfig executor;
  LogConfig log;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace matrixforge
