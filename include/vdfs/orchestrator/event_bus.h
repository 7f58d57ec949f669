#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vdfs::orchestrator {

  // structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  // kStorage carries node-store and codec internals; it has its own threshold
  // so that --full_debug can open it independently of --debug.
  enum class EventCategory { kLifecycle, kDiagnostics, kStorage };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  const char* SeverityToString(EventSeverity severity);
  const char* CategoryToString(EventCategory category);

  // Hex SHA-256 of input (OpenSSL EVP). Empty input yields an empty string.
  std::string HashForTelemetry(std::string_view input);

  struct LoggingConfig {
    EventSeverity lifecycle_threshold{EventSeverity::kError};
    EventSeverity storage_threshold{EventSeverity::kWarning};
    std::optional<std::filesystem::path> json_log_path;
    size_t json_log_max_bytes{10 * 1024 * 1024};

    // Reads VDFS_LOG_PATH and VDFS_LOG_MAX_SIZE, then applies the CLI debug switches.
    static LoggingConfig FromEnvironment(bool debugging, bool full_debugging);
  };

  // Human-readable sink on std::clog:
  //   [2026-01-01 12:00:00 - ERROR] [exporter.export_all] - message key=value
  class ConsoleLogger {
  public:
    explicit ConsoleLogger(std::ostream& out = std::clog);
    void Log(const Event& event);
    void SetThreshold(EventCategory category, EventSeverity severity);
    bool Enabled(EventCategory category, EventSeverity severity) const;

  private:
    std::ostream* out_;
    EventSeverity lifecycle_threshold_{EventSeverity::kError};
    EventSeverity storage_threshold_{EventSeverity::kWarning};
  };

  class JsonLineLogger {
  public:
    JsonLineLogger(std::filesystem::path log_path, size_t max_bytes);
    void Log(const Event& event);
    const std::filesystem::path& LogPath() const noexcept { return log_path_; }

  private:
    std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    void EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    size_t max_bytes_;
    const size_t max_files_ = 3;
  };

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    EventBus();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);
    void Configure(const LoggingConfig& config);
    ConsoleLogger& Console() noexcept { return console_; }

  private:
    std::mutex mutex_;
    std::vector<Subscriber> subscribers_;
    ConsoleLogger console_;
    std::unique_ptr<JsonLineLogger> json_logger_;
  };

  // Convenience wrapper around EventBus::Instance().Publish().
  void PublishEvent(EventCategory category, EventSeverity severity, std::string event_id,
                    std::string message, std::vector<EventField> fields = {});

  void ResetEventBusForTesting(); // drops subscribers and sinks

} // namespace vdfs::orchestrator
