#include "platform_log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

namespace clipsync::platform::log {

namespace {

std::mutex g_log_mutex;
LogCallback g_log_cb = nullptr;
void* g_log_user = nullptr;
std::atomic<std::uint8_t> g_min_level{static_cast<std::uint8_t>(Level::kInfo)};

bool IsDelimiter(char ch) {
  const unsigned char uc = static_cast<unsigned char>(ch);
  return std::isspace(uc) != 0 || ch == ',' || ch == ';';
}

std::string ToLowerAscii(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string RedactInline(std::string_view message) {
  std::string out(message);
  std::string lower = ToLowerAscii(out);
  static constexpr const char* kKeys[] = {"token", "password", "secret", "key"};
  for (const char* key : kKeys) {
    const std::string pattern = std::string(key) + "=";
    std::size_t pos = 0;
    while (true) {
      pos = lower.find(pattern, pos);
      if (pos == std::string::npos) {
        break;
      }
      std::size_t start = pos + pattern.size();
      std::size_t end = start;
      while (end < out.size() && !IsDelimiter(out[end])) {
        ++end;
      }
      if (end > start) {
        out.replace(start, end - start, "***");
        lower.replace(start, end - start, "***");
        pos = start + 3;
      } else {
        pos = start;
      }
    }
  }
  return out;
}

void DefaultSink(Level level,
                 std::string_view tag,
                 std::string_view message,
                 const Field* fields,
                 std::size_t field_count) {
  std::string line;
  line.reserve(64 + message.size() + field_count * 16);
  line.append("[clipsync] ");
  line.append(LevelName(level));
  if (!tag.empty()) {
    line.push_back(' ');
    line.append(tag.data(), tag.size());
  }
  line.append(": ");
  line.append(message.data(), message.size());
  for (std::size_t i = 0; i < field_count; ++i) {
    const auto& field = fields[i];
    if (field.key.empty()) {
      continue;
    }
    line.push_back(' ');
    line.append(field.key.data(), field.key.size());
    line.push_back('=');
    line.append(field.value.data(), field.value.size());
  }
  line.push_back('\n');
  FILE* out = (level == Level::kError || level == Level::kWarn) ? stderr : stdout;
  std::fwrite(line.data(), 1, line.size(), out);
  std::fflush(out);
}

}  // namespace

void SetLogCallback(LogCallback cb, void* user_data) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_log_cb = cb;
  g_log_user = cb ? user_data : nullptr;
}

void SetMinLevel(Level level) {
  g_min_level.store(static_cast<std::uint8_t>(level));
}

Level MinLevel() {
  return static_cast<Level>(g_min_level.load());
}

bool ParseLevel(std::string_view text, Level& out) {
  const std::string t = ToLowerAscii(text);
  if (t == "debug") {
    out = Level::kDebug;
    return true;
  }
  if (t == "info") {
    out = Level::kInfo;
    return true;
  }
  if (t == "warn" || t == "warning") {
    out = Level::kWarn;
    return true;
  }
  if (t == "error") {
    out = Level::kError;
    return true;
  }
  return false;
}

const char* LevelName(Level level) {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
  }
  return "INFO";
}

void Log(Level level, std::string_view tag, std::string_view message) {
  Log(level, tag, message, {});
}

void Log(Level level,
         std::string_view tag,
         std::string_view message,
         std::initializer_list<Field> fields) {
  if (static_cast<std::uint8_t>(level) < g_min_level.load()) {
    return;
  }
  const std::string redacted = RedactInline(message);
  std::vector<std::string> values;
  values.reserve(fields.size());
  for (const auto& field : fields) {
    values.push_back(RedactValue(field.key, field.value));
  }
  std::vector<Field> safe;
  safe.reserve(fields.size());
  std::size_t i = 0;
  for (const auto& field : fields) {
    safe.push_back(Field{field.key, values[i++]});
  }
  const std::string tag_str(tag);

  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_log_cb) {
    g_log_cb(level, tag_str.c_str(), redacted.c_str(), safe.data(), safe.size(),
             g_log_user);
    return;
  }
  DefaultSink(level, tag_str, redacted, safe.data(), safe.size());
}

bool IsSensitiveKey(std::string_view key) {
  if (key.empty()) {
    return false;
  }
  const std::string lower = ToLowerAscii(key);
  if (lower.find("token") != std::string::npos ||
      lower.find("password") != std::string::npos ||
      lower.find("secret") != std::string::npos) {
    return true;
  }
  if (lower.find("key") != std::string::npos) {
    return lower.find("key_id") == std::string::npos &&
           lower.find("keyid") == std::string::npos;
  }
  return false;
}

std::string RedactValue(std::string_view key, std::string_view value) {
  if (IsSensitiveKey(key)) {
    return "***";
  }
  return std::string(value);
}

std::string RedactMessage(std::string_view message) {
  return RedactInline(message);
}

}  // namespace clipsync::platform::log
