#include "matrixforge/config/config.hpp"
#include "matrixforge/config/toml_util.hpp"

#include "matrixforge/core/error.hpp"
#include "matrixforge/util/log.hpp"

#include <boost/lexical_cast.hpp>
#include <cstdlib>
#include <string>
#include <string_view>

namespace matrixforge {
namespace detail {

struct RuntimeToml {
  int shards{0};
  int executors{2};
  int max_queue_length{1024};
};

struct OrchestratorToml {
  int poll_interval_ms{1000};
  int cancel_debounce{5};
  int queue_report_after_ms{5000};
};

struct StorageToml {
  std::string root{"./matrixforge-data"};
};

struct ExecutorToml {
  int timeout_sec{3600};
  std::string shell{"/bin/sh"};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct SystemToml {
  RuntimeToml runtime{};
  OrchestratorToml orchestrator{};
  StorageToml storage{};
  ExecutorToml executor{};
  LogToml log{};
};

} // namespace detail
} // namespace matrixforge

namespace glz {
template <> struct meta<matrixforge::detail::RuntimeToml> {
  using T = matrixforge::detail::RuntimeToml;
  static constexpr auto value =
      object("shards", &T::shards, "executors", &T::executors,
             "max_queue_length", &T::max_queue_length);
};

template <> struct meta<matrixforge::detail::OrchestratorToml> {
  using T = matrixforge::detail::OrchestratorToml;
  static constexpr auto value =
      object("poll_interval_ms", &T::poll_interval_ms, "cancel_debounce",
             &T::cancel_debounce, "queue_report_after_ms",
             &T::queue_report_after_ms);
};

template <> struct meta<matrixforge::detail::StorageToml> {
  using T = matrixforge::detail::StorageToml;
  static constexpr auto value = object("root", &T::root);
};

template <> struct meta<matrixforge::detail::ExecutorToml> {
  using T = matrixforge::detail::ExecutorToml;
  static constexpr auto value =
      object("timeout_sec", &T::timeout_sec, "shell", &T::shell);
};

template <> struct meta<matrixforge::detail::LogToml> {
  using T = matrixforge::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<matrixforge::detail::SystemToml> {
  using T = matrixforge::detail::SystemToml;
  static constexpr auto value =
      object("runtime", &T::runtime, "orchestrator", &T::orchestrator,
             "storage", &T::storage, "executor", &T::executor, "log", &T::log);
};
} // namespace glz

namespace matrixforge {
namespace {

auto apply_env_overrides(SystemConfig &cfg) -> void {
  if (const char *v = std::getenv("MATRIXFORGE_RUNTIME_SHARDS"); v != nullptr) {
    cfg.runtime.shards = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("MATRIXFORGE_RUNTIME_EXECUTORS");
      v != nullptr) {
    cfg.runtime.executors = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("MATRIXFORGE_RUNTIME_MAX_QUEUE_LENGTH");
      v != nullptr) {
    cfg.runtime.max_queue_length = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("MATRIXFORGE_POLL_INTERVAL_MS");
      v != nullptr) {
    cfg.orchestrator.poll_interval_ms = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("MATRIXFORGE_CANCEL_DEBOUNCE"); v != nullptr) {
    cfg.orchestrator.cancel_debounce = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("MATRIXFORGE_QUEUE_REPORT_AFTER_MS");
      v != nullptr) {
    cfg.orchestrator.queue_report_after_ms = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("MATRIXFORGE_STORAGE_ROOT"); v != nullptr) {
    cfg.storage.root = v;
  }
  if (const char *v = std::getenv("MATRIXFORGE_EXECUTOR_TIMEOUT_SEC");
      v != nullptr) {
    cfg.executor.timeout_sec = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("MATRIXFORGE_EXECUTOR_SHELL"); v != nullptr) {
    cfg.executor.shell = v;
  }
  if (const char *v = std::getenv("MATRIXFORGE_LOG_LEVEL"); v != nullptr) {
    cfg.log.level = v;
  }
  if (const char *v = std::getenv("MATRIXFORGE_LOG_FILE"); v != nullptr) {
    cfg.log.file = v;
  }
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  std::string diagnostic;
  auto raw_result =
      toml_util::parse_toml<detail::SystemToml>(toml_text, &diagnostic);
  if (!raw_result) {
    log::error("Invalid system configuration: {}", diagnostic);
    return fail(raw_result.error());
  }
  auto &raw = *raw_result;

  SystemConfig cfg{};
  cfg.runtime.shards = raw.runtime.shards;
  cfg.runtime.executors = raw.runtime.executors;
  cfg.runtime.max_queue_length = raw.runtime.max_queue_length;

  cfg.orchestrator.poll_interval_ms = raw.orchestrator.poll_interval_ms;
  cfg.orchestrator.cancel_debounce = raw.orchestrator.cancel_debounce;
  cfg.orchestrator.queue_report_after_ms =
      raw.orchestrator.queue_report_after_ms;

  cfg.storage.root = std::move(raw.storage.root);

  cfg.executor.timeout_sec = raw.executor.timeout_sec;
  cfg.executor.shell = std::move(raw.executor.shell);

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  apply_env_overrides(cfg);

  if (auto key = ConfigLoader::first_invalid_key(cfg)) {
    log::error("Invalid system configuration: {} is out of range", *key);
    return fail(Error::ParseError);
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load(std::string_view path) -> Result<SystemConfig> {
  return path.empty() ? load_from_string("") : load_from_file(path);
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(std::filesystem::path(path));
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid MATRIXFORGE_* override: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::first_invalid_key(const SystemConfig &cfg)
    -> std::optional<std::string_view> {
  if (cfg.runtime.shards < 0)
    return "runtime.shards";
  if (cfg.runtime.executors <= 0)
    return "runtime.executors";
  if (cfg.runtime.max_queue_length <= 0)
    return "runtime.max_queue_length";
  if (cfg.orchestrator.poll_interval_ms <= 0)
    return "orchestrator.poll_interval_ms";
  if (cfg.orchestrator.cancel_debounce <= 0)
    return "orchestrator.cancel_debounce";
  if (cfg.orchestrator.queue_report_after_ms < 0)
    return "orchestrator.queue_report_after_ms";
  if (cfg.storage.root.empty())
    return "storage.root";
  if (cfg.executor.timeout_sec <= 0)
    return "executor.timeout_sec";
  if (cfg.executor.shell.empty())
    return "executor.shell";
  return std::nullopt;
}

} // namespace matrixforge
