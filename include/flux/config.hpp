/**
 * @file config.hpp
 * @brief INI configuration store with template-based backend dispatch.
 *
 * Design:
 *   - Tag dispatch: IniBackend type tag
 *   - Template specialization: ConfigParser<Backend> per-format parser
 *   - Variadic Config<Backends...> so further formats slot in later
 *   - ConfigStore holds the flat "section + key = value" data and getters
 *
 * The INI parser is inih, enabled by FLUX_CONFIG_INI_ENABLED (set by the
 * CMake build when inih is installed). Without it every load returns
 * ConfigError::kFormatNotSupported.
 *
 * Usage:
 * @code
 *   flux::IniConfig ini;
 *   if (ini.LoadFile("pool.ini")) {
 *     auto cfg = flux::LoadPoolConfig(ini, "pool");
 *     if (cfg) auto pool = flux::WorkPool::Create("ingest", cfg.value());
 *   }
 * @endcode
 */

#ifndef FLUX_CONFIG_HPP_
#define FLUX_CONFIG_HPP_

#include "flux/log.hpp"
#include "flux/platform.hpp"
#include "flux/vocabulary.hpp"
#include "flux/work_pool.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <tuple>

#ifdef FLUX_CONFIG_INI_ENABLED
#include <ini.h>
#endif

namespace flux {

// ============================================================================
// ConfigFormat / Backend tags
// ============================================================================

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
};

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "cfg") ||
           detail::CaseEqual(ext, "conf");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  /// Present and fully numeric, else empty.
  optional<int64_t> FindInt64(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    errno = 0;
    long long val = std::strtoll(e->value, &end, 10);
    if (end == e->value || *end != '\0' || errno == ERANGE) return {};
    return optional<int64_t>{static_cast<int64_t>(val)};
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

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
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
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
    FLUX_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key))
        return &entries_[i];
    }
    return nullptr;
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
    if (src == nullptr) {
      dst[0] = '\0';
      return;
    }
    uint32_t i = 0;
    while (i < (dst_size - 1U) && src[i] != '\0') {
      dst[i] = src[i];
      ++i;
    }
    dst[i] = '\0';
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Default: format not compiled in. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef FLUX_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    int result = ini_parse(path, Handler, &store);
    if (result == -1)
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (result != 0) {
      FLUX_LOG_WARN("Config", "%s: parse error at line %d", path, result);
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data) {
    int result = ini_parse_string(data, Handler, &store);
    if (result != 0) {
      FLUX_LOG_WARN("Config", "buffer: parse error at line %d", result);
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name, const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    return s->AddEntry(section ? section : "", name ? name : "", value ? value : "") ? 1 : 0;
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    FLUX_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  /// @p data must be null-terminated.
  expected<void, ConfigError> LoadBuffer(const char* data, ConfigFormat format) {
    FLUX_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseBuffer(*this, data);
    if constexpr (sizeof...(Rest) > 0) return DispatchBuffer<Rest...>(data, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }
};

using IniConfig = Config<IniBackend>;

// ============================================================================
// PoolConfig loading
// ============================================================================

/**
 * @brief Read WorkPool sizing from @p section.
 *
 * Keys: min_workers, max_workers (required), metric_interval_ms (optional).
 * Bounds are checked by WorkPool::Create, not here.
 *
 * @return kMissingKey if a required key is absent, kInvalidValue if a value
 *         is not an integer (or metric_interval_ms is negative).
 */
inline expected<PoolConfig, ConfigError> LoadPoolConfig(const ConfigStore& store,
                                                        const char* section) {
  static constexpr const char* kRequired[] = {"min_workers", "max_workers"};
  for (const char* key : kRequired) {
    if (!store.HasKey(section, key)) {
      FLUX_LOG_ERROR("Config", "[%s] missing %s", section, key);
      return expected<PoolConfig, ConfigError>::error(ConfigError::kMissingKey);
    }
  }

  optional<int64_t> min_workers = store.FindInt64(section, "min_workers");
  optional<int64_t> max_workers = store.FindInt64(section, "max_workers");
  if (!min_workers || !max_workers) {
    FLUX_LOG_ERROR("Config", "[%s] worker bounds must be integers", section);
    return expected<PoolConfig, ConfigError>::error(ConfigError::kInvalidValue);
  }

  PoolConfig cfg;
  cfg.min_workers = min_workers.value();
  cfg.max_workers = max_workers.value();

  if (store.HasKey(section, "metric_interval_ms")) {
    optional<int64_t> interval = store.FindInt64(section, "metric_interval_ms");
    if (!interval || interval.value() < 0 || interval.value() > UINT32_MAX) {
      FLUX_LOG_ERROR("Config", "[%s] bad metric_interval_ms", section);
      return expected<PoolConfig, ConfigError>::error(ConfigError::kInvalidValue);
    }
    cfg.metric_interval_ms = static_cast<uint32_t>(interval.value());
  }
  return expected<PoolConfig, ConfigError>::success(cfg);
}

}  // namespace flux

#endif  // FLUX_CONFIG_HPP_
