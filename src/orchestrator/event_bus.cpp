#include "vdfs/orchestrator/event_bus.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>

#include <openssl/evp.h>

#include "vdfs/error.h"
#include "vdfs/errors.h"

namespace vdfs::orchestrator {
namespace {

struct EventBusSingletonStorage {
  std::once_flag once;
  std::unique_ptr<EventBus> instance;

  void Reset() {
    instance.reset();
    this->~EventBusSingletonStorage();
    new (this) EventBusSingletonStorage();
  }
};

std::mutex& EventBusSingletonMutex() {
  static std::mutex mutex;
  return mutex;
}

EventBusSingletonStorage& EventBusSingleton() {
  static EventBusSingletonStorage storage;
  return storage;
}

struct PublishReentrancyGuard {
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

constexpr size_t kDefaultJsonLogMaxBytes = 10 * 1024 * 1024;

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

std::string RenderFieldValue(const EventField& field) {
  switch (field.privacy) {
  case FieldPrivacy::kRedact:
    return "[redacted]";
  case FieldPrivacy::kHash:
    return HashForTelemetry(field.value);
  case FieldPrivacy::kPublic:
    break;
  }
  return field.value;
}

std::string BuildEventJson(const Event& event, const std::string& timestamp) {
  std::string payload;
  payload.reserve(256);
  payload += "{\"ts\":\"" + EscapeJson(timestamp) + "\"";
  payload += ",\"severity\":\"";
  payload += SeverityToString(event.severity);
  payload += "\",\"category\":\"";
  payload += CategoryToString(event.category);
  payload += "\"";
  if (!event.event_id.empty()) {
    payload += ",\"event_id\":\"" + EscapeJson(event.event_id) + "\"";
  }
  if (!event.message.empty()) {
    payload += ",\"message\":\"" + EscapeJson(event.message) + "\"";
  }
  for (const auto& field : event.fields) {
    payload += ",\"" + EscapeJson(field.key) + "\":";
    const auto value = RenderFieldValue(field);
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      payload += value;
    } else {
      payload += "\"" + EscapeJson(value) + "\"";
    }
  }
  payload.push_back('}');
  return payload;
}

std::string FormatLocalTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::optional<size_t> ParseSize(const char* env) {
  if (!env || *env == '\0') {
    return std::nullopt;
  }
  unsigned long long value = 0;
  const auto length = std::strlen(env);
  auto [ptr, ec] = std::from_chars(env, env + length, value);
  if (ec != std::errc() || ptr != env + length || value == 0) {
    return std::nullopt;
  }
  return static_cast<size_t>(std::min<unsigned long long>(value, std::numeric_limits<size_t>::max()));
}

}  // namespace

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  case EventCategory::kStorage:
    return "storage";
  }
  return "diagnostics";
}

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int length = 0;
  if (EVP_Digest(input.data(), input.size(), digest.data(), &length, EVP_sha256(), nullptr) != 1) {
    throw Error{ErrorDomain::Dependency, errors::dependency::kDigestFailed,
                std::string(errors::msg::kDigestFailed)};
  }
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < length; ++i) {
    oss << std::setw(2) << static_cast<int>(digest[i]);
  }
  return oss.str();
}

LoggingConfig LoggingConfig::FromEnvironment(bool debugging, bool full_debugging) {
  LoggingConfig config;
  if (const char* path = std::getenv("VDFS_LOG_PATH"); path && *path) {
    config.json_log_path = std::filesystem::path(path);
  }
  config.json_log_max_bytes =
      ParseSize(std::getenv("VDFS_LOG_MAX_SIZE")).value_or(kDefaultJsonLogMaxBytes);
  if (debugging || full_debugging) {
    config.lifecycle_threshold = EventSeverity::kDebug;
  }
  if (full_debugging) {
    config.storage_threshold = EventSeverity::kDebug;
  }
  return config;
}

ConsoleLogger::ConsoleLogger(std::ostream& out) : out_(&out) {}

void ConsoleLogger::SetThreshold(EventCategory category, EventSeverity severity) {
  if (category == EventCategory::kStorage) {
    storage_threshold_ = severity;
  } else {
    lifecycle_threshold_ = severity;
  }
}

bool ConsoleLogger::Enabled(EventCategory category, EventSeverity severity) const {
  const auto threshold =
      category == EventCategory::kStorage ? storage_threshold_ : lifecycle_threshold_;
  return severity >= threshold;
}

void ConsoleLogger::Log(const Event& event) {
  if (!Enabled(event.category, event.severity)) {
    return;
  }
  std::string level = SeverityToString(event.severity);
  std::transform(level.begin(), level.end(), level.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  std::ostringstream line;
  line << '[' << FormatLocalTimestamp(std::chrono::system_clock::now()) << " - " << level << "] ["
       << (event.event_id.empty() ? CategoryToString(event.category) : event.event_id.c_str())
       << "] - " << event.message;
  for (const auto& field : event.fields) {
    line << ' ' << field.key << '=' << RenderFieldValue(field);
  }
  (*out_) << line.str() << std::endl;
}

JsonLineLogger::JsonLineLogger(std::filesystem::path log_path, size_t max_bytes)
    : log_path_(std::move(log_path)), max_bytes_(max_bytes == 0 ? kDefaultJsonLogMaxBytes : max_bytes) {}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return;
  }
  std::error_code ec;
  if (log_path_.has_parent_path()) {
    std::filesystem::create_directories(log_path_.parent_path(), ec);
  }
  stream_.open(log_path_, std::ios::app);
}

void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  std::error_code ec;
  const auto current = std::filesystem::exists(log_path_, ec) ? std::filesystem::file_size(log_path_, ec) : 0;
  if (ec || current + incoming_bytes <= max_bytes_) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  for (size_t index = max_files_ - 1; index > 0; --index) {
    auto from = log_path_;
    from += "." + std::to_string(index);
    auto to = log_path_;
    to += "." + std::to_string(index + 1);
    if (std::filesystem::exists(from, ec)) {
      std::filesystem::rename(from, to, ec);
    }
  }
  auto first = log_path_;
  first += ".1";
  std::filesystem::rename(log_path_, first, ec);
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto line = BuildEventJson(event, FormatTimestamp(std::chrono::system_clock::now()));
  RotateIfNeeded(line.size() + 1);
  EnsureOpen();
  if (!stream_.is_open()) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}" << std::endl;
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
}

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  {
    std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
    std::call_once(storage.once, [&storage]() { storage.instance = std::make_unique<EventBus>(); });
  }
  return *storage.instance;
}

EventBus::EventBus() = default;

void EventBus::Configure(const LoggingConfig& config) {
  std::lock_guard<std::mutex> guard(mutex_);
  console_.SetThreshold(EventCategory::kLifecycle, config.lifecycle_threshold);
  console_.SetThreshold(EventCategory::kStorage, config.storage_threshold);
  if (config.json_log_path) {
    json_logger_ = std::make_unique<JsonLineLogger>(*config.json_log_path, config.json_log_max_bytes);
  } else {
    json_logger_.reset();
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(mutex_);
  subscribers_.push_back(std::move(fn));
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard reentrancy(in_publish);
  std::vector<Subscriber> targets;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    targets = subscribers_;
    console_.Log(event);
    if (json_logger_) {
      try {
        json_logger_->Log(event);
      } catch (const std::exception& err) {
        std::clog << "{\"event\":\"logger_error\",\"message\":\"json log write failed\",\"detail\":\""
                  << EscapeJson(err.what()) << "\"}" << std::endl;
      }
    }
  }
  for (const auto& subscriber : targets) {
    subscriber(event);
  }
}

void PublishEvent(EventCategory category, EventSeverity severity, std::string event_id,
                  std::string message, std::vector<EventField> fields) {
  Event event;
  event.category = category;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

void ResetEventBusForTesting() {
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  EventBusSingleton().Reset();
}

}  // namespace vdfs::orchestrator
