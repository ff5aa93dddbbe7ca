/**
 * @file config.hpp
 * @brief Cluster configuration file reader with compile-time format backends.
 *
 * Backends are opt-in at build time and composed with Config<Backends...>:
 *   - YamlBackend : fkYAML        (KCORE_CONFIG_YAML_ENABLED)
 *   - JsonBackend : nlohmann/json (KCORE_CONFIG_JSON_ENABLED)
 *   - IniBackend  : inih          (KCORE_CONFIG_INI_ENABLED)
 *
 * Every format lands in the same flat ConfigStore. Nested mappings become
 * dotted sections and sequences of scalars are joined with ',':
 *
 * @code
 *   spec:
 *     api:
 *       sans: [10.0.0.1, node1]
 * @endcode
 *
 * is stored as section "spec.api", key "sans", value "10.0.0.1,node1".
 * Section and key lookups ignore ASCII case.
 */

#ifndef KCORE_CONFIG_HPP_
#define KCORE_CONFIG_HPP_

#include "kcore/log.hpp"
#include "kcore/platform.hpp"
#include "kcore/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#ifdef KCORE_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef KCORE_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef KCORE_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

/// Config files larger than this are rejected with kBufferFull.
#ifndef KCORE_CONFIG_MAX_FILE_SIZE
#define KCORE_CONFIG_MAX_FILE_SIZE (256U * 1024U)
#endif

namespace kcore {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline bool EqualsIgnoreCase(const std::string& a, const char* b) noexcept {
  size_t i = 0;
  for (; i < a.size() && b[i] != '\0'; ++i) {
    if (AsciiLower(a[i]) != AsciiLower(b[i])) return false;
  }
  return i == a.size() && b[i] == '\0';
}

/// Extension of the last path component, without the dot ("" if none).
inline std::string FileExtension(const std::string& path) {
  size_t slash = path.rfind('/');
  size_t dot = path.rfind('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return std::string();
  }
  return path.substr(dot + 1U);
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::EqualsIgnoreCase(ext, "yaml") || detail::EqualsIgnoreCase(ext, "yml");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::EqualsIgnoreCase(ext, "json");
  }
};

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::EqualsIgnoreCase(ext, "ini") || detail::EqualsIgnoreCase(ext, "conf");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Flat (section, key) -> string store filled by the format parsers.
 *
 * A later value for the same section and key replaces the earlier one.
 */
class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = Find(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key, int32_t default_val = 0) const {
    long v = 0;
    return ParseLong(Find(section, key), v) ? static_cast<int32_t>(v) : default_val;
  }

  /// Values outside 1..65535 yield @p default_val.
  uint16_t GetPort(const char* section, const char* key, uint16_t default_val = 0) const {
    long v = 0;
    if (!ParseLong(Find(section, key), v) || v < 1 || v > 65535) return default_val;
    return static_cast<uint16_t>(v);
  }

  bool GetBool(const char* section, const char* key, bool default_val = false) const {
    const Entry* e = Find(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) return optional<bool>();
    return optional<bool>(ParseBool(e->value));
  }

  bool HasSection(const char* section) const {
    KCORE_ASSERT(section != nullptr);
    for (const auto& e : entries_) {
      if (detail::EqualsIgnoreCase(e.section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return Find(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return static_cast<uint32_t>(entries_.size()); }

  void Set(const std::string& section, const std::string& key, std::string value) {
    for (auto& e : entries_) {
      if (detail::EqualsIgnoreCase(e.section, section.c_str()) &&
          detail::EqualsIgnoreCase(e.key, key.c_str())) {
        e.value = std::move(value);
        return;
      }
    }
    entries_.push_back(Entry{section, key, std::move(value)});
  }

  /// Store @p value under a dotted @p path ("a.b.c": section "a.b", key "c").
  void SetPath(const std::string& path, std::string value) {
    size_t dot = path.rfind('.');
    if (dot == std::string::npos) {
      Set(std::string(), path, std::move(value));
    } else {
      Set(path.substr(0, dot), path.substr(dot + 1U), std::move(value));
    }
  }

 protected:
  static expected<std::string, ConfigError> ReadAll(const char* path) {
    using Result = expected<std::string, ConfigError>;
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) return Result::error(ConfigError::kFileNotFound);
    std::string data;
    char chunk[4096];
    size_t n;
    while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0) {
      data.append(chunk, n);
      if (data.size() > KCORE_CONFIG_MAX_FILE_SIZE) break;
    }
    bool read_error = std::ferror(f) != 0;
    std::fclose(f);
    if (read_error) return Result::error(ConfigError::kParseError);
    if (data.size() > KCORE_CONFIG_MAX_FILE_SIZE) return Result::error(ConfigError::kBufferFull);
    return Result::success(std::move(data));
  }

 private:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  const Entry* Find(const char* section, const char* key) const {
    KCORE_ASSERT(section != nullptr && key != nullptr);
    for (const auto& e : entries_) {
      if (detail::EqualsIgnoreCase(e.section, section) &&
          detail::EqualsIgnoreCase(e.key, key)) {
        return &e;
      }
    }
    return nullptr;
  }

  static bool ParseLong(const Entry* e, long& out) {
    if (e == nullptr || e->value.empty()) return false;
    char* end = nullptr;
    out = std::strtol(e->value.c_str(), &end, 10);
    return end != e->value.c_str() && *end == '\0';
  }

  static bool ParseBool(const std::string& s) noexcept {
    return detail::EqualsIgnoreCase(s, "true") || detail::EqualsIgnoreCase(s, "yes") ||
           detail::EqualsIgnoreCase(s, "on") || s == "1";
  }

  std::vector<Entry> entries_;

};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// Backends that were not compiled in report kFormatNotSupported.
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> Parse(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef KCORE_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store, const std::string& text) {
    if (ini_parse_string(text.c_str(), &ConfigParser::OnEntry, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int OnEntry(void* user, const char* section, const char* name, const char* value) {
    static_cast<ConfigStore*>(user)->Set(section != nullptr ? section : "",
                                         name != nullptr ? name : "",
                                         value != nullptr ? value : "");
    return 1;
  }
};
#endif

#ifdef KCORE_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store, const std::string& text) {
    auto root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    Walk(store, root, std::string());
    return expected<void, ConfigError>::success();
  }

 private:
  static void Walk(ConfigStore& store, const nlohmann::json& object, const std::string& prefix) {
    for (const auto& item : object.items()) {
      const std::string path = prefix.empty() ? item.key() : prefix + "." + item.key();
      const nlohmann::json& v = item.value();
      if (v.is_object()) {
        Walk(store, v, path);
      } else if (v.is_array()) {
        std::string joined;
        for (const auto& element : v) {
          if (!joined.empty()) joined += ',';
          joined += Scalar(element);
        }
        store.SetPath(path, std::move(joined));
      } else {
        store.SetPath(path, Scalar(v));
      }
    }
  }

  static std::string Scalar(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return std::string();
    return v.dump();
  }
};
#endif

#ifdef KCORE_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store, const std::string& text) {
    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(text);
    } catch (const fkyaml::exception& e) {
      KCORE_LOG_ERROR("Config", "yaml: %s", e.what());
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    Walk(store, root, std::string());
    return expected<void, ConfigError>::success();
  }

 private:
  static void Walk(ConfigStore& store, fkyaml::node& mapping, const std::string& prefix) {
    for (auto it = mapping.begin(); it != mapping.end(); ++it) {
      const std::string name = it.key().get_value<std::string>();
      const std::string path = prefix.empty() ? name : prefix + "." + name;
      fkyaml::node& v = *it;
      if (v.is_mapping()) {
        Walk(store, v, path);
      } else if (v.is_sequence()) {
        std::string joined;
        for (auto& element : v) {
          if (!joined.empty()) joined += ',';
          joined += Scalar(element);
        }
        store.SetPath(path, std::move(joined));
      } else {
        store.SetPath(path, Scalar(v));
      }
    }
  }

  static std::string Scalar(const fkyaml::node& v) {
    if (v.is_string()) return v.get_value<std::string>();
    if (v.is_boolean()) return v.get_value<bool>() ? "true" : "false";
    if (v.is_integer()) return std::to_string(v.get_value<int64_t>());
    if (v.is_float_number()) {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%g", v.get_value<double>());
      return buf;
    }
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

/**
 * @brief ConfigStore that loads any of @p Backends.
 *
 * With kAuto the format follows the file extension; an unknown or missing
 * extension selects the first backend.
 */
template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");
  using Primary = typename std::tuple_element<0, std::tuple<Backends...>>::type;

 public:
  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    KCORE_ASSERT(path != nullptr);
    auto text = ReadAll(path);
    if (!text) return expected<void, ConfigError>::error(text.get_error());
    if (format == ConfigFormat::kAuto) format = FormatFor(detail::FileExtension(path));
    return Dispatch<Backends...>(format, text.value());
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size, ConfigFormat format) {
    KCORE_ASSERT(data != nullptr);
    if (format == ConfigFormat::kAuto) format = Primary::kFormat;
    return Dispatch<Backends...>(format, std::string(data, size));
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> Dispatch(ConfigFormat format, const std::string& text) {
    if (First::kFormat == format) return ConfigParser<First>::Parse(*this, text);
    if constexpr (sizeof...(Rest) > 0) {
      return Dispatch<Rest...>(format, text);
    } else {
      return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
    }
  }

  static ConfigFormat FormatFor(const std::string& ext) {
    ConfigFormat found = Primary::kFormat;
    bool matched = false;
    // Fold over the backends; the first match wins.
    (void)std::initializer_list<int>{
        (!matched && Backends::MatchesExtension(ext)
             ? (found = Backends::kFormat, matched = true, 0)
             : 0)...};
    return found;
  }
};

/// Every compiled-in backend, YAML first (the default file is k0s.yaml).
using MultiConfig = Config<
#ifdef KCORE_CONFIG_YAML_ENABLED
    YamlBackend
#endif
#if defined(KCORE_CONFIG_YAML_ENABLED) && \
    (defined(KCORE_CONFIG_JSON_ENABLED) || defined(KCORE_CONFIG_INI_ENABLED))
    ,
#endif
#ifdef KCORE_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(KCORE_CONFIG_JSON_ENABLED) && defined(KCORE_CONFIG_INI_ENABLED)
    ,
#endif
#ifdef KCORE_CONFIG_INI_ENABLED
    IniBackend
#endif
    >;

#ifdef KCORE_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif
#ifdef KCORE_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef KCORE_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif

}  // namespace kcore

#endif  // KCORE_CONFIG_HPP_
