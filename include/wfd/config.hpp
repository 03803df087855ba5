/**
 * @file config.hpp
 * @brief INI configuration store and the manager settings read from it.
 *
 * Design:
 *   - ConfigStore: flat "section + key = value" storage with typed getters
 *   - ConfigParser<Backend>: per-format parser, specialized for IniBackend
 *   - Config<Backend>: store plus file/buffer loading
 *   - LoadManagerConfig: maps the [p2p] [manager] [log] sections onto
 *     ManagerConfig with clamping
 *
 * The INI backend is built on the inih library (WFD_CONFIG_INI_ENABLED).
 * Without it ConfigStore still works through Set() and parsing reports
 * kFormatNotSupported.
 *
 * Usage:
 * @code
 *   wfd::IniConfig cfg;
 *   if (cfg.LoadFile("wfd.ini").has_value()) {
 *     wfd::ManagerConfig mc = wfd::LoadManagerConfig(cfg);
 *   }
 * @endcode
 */

#ifndef WFD_CONFIG_HPP_
#define WFD_CONFIG_HPP_

#include "wfd/backend.hpp"
#include "wfd/log.hpp"
#include "wfd/manager_config.hpp"
#include "wfd/platform.hpp"
#include "wfd/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifdef WFD_CONFIG_INI_ENABLED
#include <ini.h>
#endif

namespace wfd {

// ============================================================================
// Backend tag
// ============================================================================

/// INI format (inih).
struct IniBackend {};

// ============================================================================
// ConfigStore - Flat key-value storage
// ============================================================================

class ConfigStore {
 public:
  // --- Typed Getters ---

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  // --- Optional Getters ---

  /**
   * @brief Integer value, or empty if absent or not a number.
   *
   * Out-of-range values saturate at INT32_MIN / INT32_MAX.
   */
  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);
    if (end == e->value) return {};
    // strtol saturates at LONG_MIN/LONG_MAX; long may be wider than int32_t.
    if (val > static_cast<long>(INT32_MAX)) val = INT32_MAX;
    if (val < static_cast<long>(INT32_MIN)) val = INT32_MIN;
    return optional<int32_t>{static_cast<int32_t>(val)};
  }

  // --- Mutation ---

  /**
   * @brief Insert or overwrite one value (command-line overrides, tests).
   * @return false when the store is full.
   */
  bool Set(const char* section, const char* key, const char* value) {
    WFD_ASSERT(section != nullptr && key != nullptr);
    return AddEntry(section, key, value);
  }

  // --- Query ---

  bool HasSection(const char* section) const {
    WFD_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (StrCaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

 protected:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxKeyLen = 64;
  static constexpr uint32_t kMaxValueLen = 128;

  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  bool AddEntry(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0; i < count_; ++i) {
      if (StrCaseEqual(entries_[i].section, section) &&
          StrCaseEqual(entries_[i].key, key)) {
        SafeCopy(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) return false;
    Entry& e = entries_[count_];
    SafeCopy(e.section, section, kMaxKeyLen);
    SafeCopy(e.key, key, kMaxKeyLen);
    SafeCopy(e.value, value, kMaxValueLen);
    ++count_;
    return true;
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    WFD_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (StrCaseEqual(entries_[i].section, section) &&
          StrCaseEqual(entries_[i].key, key))
        return &entries_[i];
    }
    return nullptr;
  }

  static bool StrCaseEqual(const char* a, const char* b) noexcept {
    while (*a != '\0' && *b != '\0') {
      char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
      char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
      if (la != lb) return false;
      ++a; ++b;
    }
    return *a == *b;
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
    if (src == nullptr) { dst[0] = '\0'; return; }
    uint32_t i = 0;
    while (i < (dst_size - 1U) && src[i] != '\0') { dst[i] = src[i]; ++i; }
    dst[i] = '\0';
  }

  static bool ParseBool(const char* str) noexcept {
    if (str == nullptr) return false;
    return StrCaseEqual(str, "true") || StrCaseEqual(str, "1") ||
           StrCaseEqual(str, "yes") || StrCaseEqual(str, "on");
  }

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Default: format not supported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef WFD_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                                const char* path) {
    Context ctx{&store, false};
    int result = ini_parse(path, Handler, &ctx);
    if (result == -1)
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    return Finish(ctx, result);
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                  const char* data) {
    Context ctx{&store, false};
    return Finish(ctx, ini_parse_string(data, Handler, &ctx));
  }

 private:
  struct Context {
    ConfigStore* store;
    bool full;
  };

  static expected<void, ConfigError> Finish(const Context& ctx, int result) {
    if (ctx.full)
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* ctx = static_cast<Context*>(user);
    if (ctx->store->AddEntry(section ? section : "", name ? name : "",
                             value ? value : "")) {
      return 1;
    }
    ctx->full = true;
    return 0;
  }
};
#endif

// ============================================================================
// Config<Backend>
// ============================================================================

template <typename Backend>
class Config final : public ConfigStore {
 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(const char* path) {
    WFD_ASSERT(path != nullptr);
    return ConfigParser<Backend>::ParseFile(*this, path);
  }

  /** @brief Parse a NUL-terminated in-memory document. */
  expected<void, ConfigError> LoadBuffer(const char* data) {
    WFD_ASSERT(data != nullptr);
    return ConfigParser<Backend>::ParseBuffer(*this, data);
  }
};

using IniConfig = Config<IniBackend>;

inline const char* ConfigErrorName(ConfigError err) noexcept {
  switch (err) {
    case ConfigError::kFileNotFound:       return "file not found";
    case ConfigError::kParseError:         return "parse error";
    case ConfigError::kFormatNotSupported: return "format not supported";
    case ConfigError::kBufferFull:         return "too many entries";
  }
  return "unknown";
}

// ============================================================================
// ManagerConfig
// ============================================================================

namespace detail {

inline uint32_t ClampDepth(optional<int32_t> raw, uint32_t fallback,
                           uint32_t max) noexcept {
  if (!raw.has_value()) return fallback;
  int32_t v = raw.value();
  if (v < 1) return 1U;
  if (static_cast<uint32_t>(v) > max) return max;
  return static_cast<uint32_t>(v);
}

}  // namespace detail

/**
 * @brief Read manager settings from a loaded store.
 *
 * Keys: [p2p] interface, [manager] command_queue_depth (1..1024),
 * [manager] event_capacity (1..4096), [log] level. Absent or unparsable
 * values keep their defaults; an invalid interface name is logged and
 * replaced by the default.
 */
inline ManagerConfig LoadManagerConfig(const ConfigStore& store) {
  ManagerConfig cfg;

  if (store.HasKey("p2p", "interface")) {
    const char* name = store.GetString("p2p", "interface");
    auto valid = ValidateInterfaceName(name);
    if (valid.has_value()) {
      cfg.interface_name = valid.value();
    } else {
      WFD_LOG_WARN("Config", "ignoring [p2p] interface: %s",
                   valid.get_error().What());
    }
  }

  cfg.command_queue_depth = detail::ClampDepth(
      store.FindInt("manager", "command_queue_depth"), cfg.command_queue_depth,
      kMaxCommandQueueDepth);
  cfg.event_capacity = detail::ClampDepth(store.FindInt("manager", "event_capacity"),
                                          cfg.event_capacity, kMaxEventCapacity);
  cfg.log_level = log::ParseLevel(store.GetString("log", "level", nullptr),
                                  cfg.log_level);
  return cfg;
}

}  // namespace wfd

#endif  // WFD_CONFIG_HPP_
