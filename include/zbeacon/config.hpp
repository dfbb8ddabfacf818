/**
 * @file config.hpp
 * @brief Configuration file reading for beacon startup options.
 *
 * A file is read whole, parsed by the library for its format and flattened
 * into ConfigValues, a small table of section/key -> text. Typed lookups
 * are left to the consumer (see LoadBeaconOptions in beacon_agent.hpp).
 *
 *   - INI  via inih              (ZBEACON_CONFIG_INI_ENABLED)
 *   - JSON via nlohmann/json     (ZBEACON_CONFIG_JSON_ENABLED)
 *   - YAML via fkYAML            (ZBEACON_CONFIG_YAML_ENABLED)
 *
 * JSON and YAML: members of a top-level object are sections, their scalar
 * members are keys. Top-level scalars land in the "" section.
 *
 * @code
 *   zbeacon::ConfigValues values;
 *   if (zbeacon::LoadConfigFile("beacon.ini", values)) {
 *     zbeacon::LoadBeaconOptions(values, options);
 *   }
 * @endcode
 */

#ifndef ZBEACON_CONFIG_HPP_
#define ZBEACON_CONFIG_HPP_

#include "zbeacon/platform.hpp"
#include "zbeacon/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <strings.h>

#ifdef ZBEACON_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef ZBEACON_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef ZBEACON_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#include <string>
#endif

namespace zbeacon {

// ============================================================================
// Constants
// ============================================================================

#ifndef ZBEACON_CONFIG_MAX_ENTRIES
#define ZBEACON_CONFIG_MAX_ENTRIES 32U
#endif

#ifndef ZBEACON_CONFIG_MAX_FILE_SIZE
#define ZBEACON_CONFIG_MAX_FILE_SIZE 4096U
#endif

using ConfigName = FixedString<31>;
using ConfigText = FixedString<127>;

enum class ConfigFormat : uint8_t { kIni = 0, kJson, kYaml };

/** @brief Format implied by the file extension; empty if unrecognized. */
inline optional<ConfigFormat> ConfigFormatFromPath(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  const char* dot = std::strrchr((slash != nullptr) ? slash : path, '.');
  if (dot == nullptr) return optional<ConfigFormat>();
  const char* ext = dot + 1;
  if (::strcasecmp(ext, "ini") == 0 || ::strcasecmp(ext, "conf") == 0) {
    return optional<ConfigFormat>(ConfigFormat::kIni);
  }
  if (::strcasecmp(ext, "json") == 0) {
    return optional<ConfigFormat>(ConfigFormat::kJson);
  }
  if (::strcasecmp(ext, "yaml") == 0 || ::strcasecmp(ext, "yml") == 0) {
    return optional<ConfigFormat>(ConfigFormat::kYaml);
  }
  return optional<ConfigFormat>();
}

// ============================================================================
// ConfigValues
// ============================================================================

struct ConfigEntry {
  ConfigName section;
  ConfigName key;
  ConfigText value;
};

/**
 * @brief Parsed section/key -> text table. Names compare case-insensitively;
 *        overlong names and values are truncated.
 */
class ConfigValues {
 public:
  /** @return false when a new entry does not fit. */
  bool Set(const char* section, const char* key, const char* value) noexcept {
    const size_t at = IndexOf(section, key);
    if (at < entries_.size()) {
      entries_[at].value.assign(TruncateToCapacity, value);
      return true;
    }
    ConfigEntry entry;
    entry.section.assign(TruncateToCapacity, section);
    entry.key.assign(TruncateToCapacity, key);
    entry.value.assign(TruncateToCapacity, value);
    return entries_.push_back(entry);
  }

  /** @brief Raw text of @p key, nullptr if absent. */
  const char* Find(const char* section, const char* key) const noexcept {
    const size_t at = IndexOf(section, key);
    return (at < entries_.size()) ? entries_[at].value.c_str() : nullptr;
  }

  bool Contains(const char* section, const char* key) const noexcept {
    return Find(section, key) != nullptr;
  }

  /** @brief Whole-string decimal integer; anything else is absent. */
  optional<int32_t> FindInt(const char* section, const char* key) const noexcept {
    const char* text = Find(section, key);
    if (text == nullptr || *text == '\0') return optional<int32_t>();
    char* end = nullptr;
    long v = std::strtol(text, &end, 10);
    if (*end != '\0' || v < INT32_MIN || v > INT32_MAX) {
      return optional<int32_t>();
    }
    return optional<int32_t>(static_cast<int32_t>(v));
  }

  /** @brief true/yes/on/1 or false/no/off/0; anything else is absent. */
  optional<bool> FindBool(const char* section, const char* key) const noexcept {
    const char* text = Find(section, key);
    if (text == nullptr) return optional<bool>();
    static constexpr const char* kTrue[] = {"true", "yes", "on", "1"};
    static constexpr const char* kFalse[] = {"false", "no", "off", "0"};
    for (const char* word : kTrue) {
      if (::strcasecmp(text, word) == 0) return optional<bool>(true);
    }
    for (const char* word : kFalse) {
      if (::strcasecmp(text, word) == 0) return optional<bool>(false);
    }
    return optional<bool>();
  }

  size_t Size() const noexcept { return entries_.size(); }
  void Clear() noexcept { entries_.clear(); }

 private:
  /** @return Size() when absent. */
  size_t IndexOf(const char* section, const char* key) const noexcept {
    size_t i = 0;
    for (; i < entries_.size(); ++i) {
      if (::strcasecmp(entries_[i].section.c_str(), section) == 0 &&
          ::strcasecmp(entries_[i].key.c_str(), key) == 0) {
        break;
      }
    }
    return i;
  }

  FixedVector<ConfigEntry, ZBEACON_CONFIG_MAX_ENTRIES> entries_;
};

// ============================================================================
// Format Parsers
// ============================================================================

namespace detail {

#ifdef ZBEACON_CONFIG_INI_ENABLED
struct IniSink {
  ConfigValues* out;
  bool full;
};

inline int OnIniValue(void* user, const char* section, const char* name,
                      const char* value) {
  auto* sink = static_cast<IniSink*>(user);
  if (sink->out->Set(section, name, value)) return 1;
  sink->full = true;
  return 0;
}

inline expected<void, ConfigError> ParseIni(const char* text,
                                            ConfigValues& out) {
  IniSink sink{&out, false};
  int line = ::ini_parse_string(text, &OnIniValue, &sink);
  if (sink.full) {
    return expected<void, ConfigError>::error(ConfigError::kBufferFull);
  }
  if (line != 0) {
    return expected<void, ConfigError>::error(ConfigError::kParseError);
  }
  return expected<void, ConfigError>::success();
}
#endif

#ifdef ZBEACON_CONFIG_JSON_ENABLED
/** @return false for values with no single-line text form. */
inline bool JsonScalarText(const nlohmann::json& v, ConfigText& out) {
  char num[24];
  switch (v.type()) {
    case nlohmann::json::value_t::string:
      out.assign(TruncateToCapacity, v.get_ref<const std::string&>().c_str());
      return true;
    case nlohmann::json::value_t::boolean:
      out.assign(TruncateToCapacity, v.get<bool>() ? "true" : "false");
      return true;
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
      (void)std::snprintf(num, sizeof(num), "%lld",
                          static_cast<long long>(v.get<int64_t>()));
      out.assign(TruncateToCapacity, num);
      return true;
    default:
      return false;
  }
}

inline expected<void, ConfigError> ParseJson(const char* text,
                                             ConfigValues& out) {
  nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return expected<void, ConfigError>::error(ConfigError::kParseError);
  }
  ConfigText value;
  for (const auto& top : doc.items()) {
    if (top.value().is_object()) {
      for (const auto& member : top.value().items()) {
        if (!JsonScalarText(member.value(), value)) continue;
        if (!out.Set(top.key().c_str(), member.key().c_str(), value.c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    } else if (JsonScalarText(top.value(), value)) {
      if (!out.Set("", top.key().c_str(), value.c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
  }
  return expected<void, ConfigError>::success();
}
#endif

#ifdef ZBEACON_CONFIG_YAML_ENABLED
inline bool YamlScalarText(const fkyaml::node& v, ConfigText& out) {
  if (v.is_string()) {
    out.assign(TruncateToCapacity, v.get_value<std::string>().c_str());
  } else if (v.is_boolean()) {
    out.assign(TruncateToCapacity, v.get_value<bool>() ? "true" : "false");
  } else if (v.is_integer()) {
    char num[24];
    (void)std::snprintf(num, sizeof(num), "%lld",
                        static_cast<long long>(v.get_value<int64_t>()));
    out.assign(TruncateToCapacity, num);
  } else {
    return false;
  }
  return true;
}

inline expected<void, ConfigError> ParseYaml(const char* text,
                                             ConfigValues& out) {
  fkyaml::node doc = fkyaml::node::deserialize(std::string(text));
  if (!doc.is_mapping()) {
    return expected<void, ConfigError>::error(ConfigError::kParseError);
  }
  ConfigText value;
  for (auto top = doc.begin(); top != doc.end(); ++top) {
    const std::string section = top.key().get_value<std::string>();
    const fkyaml::node& body = *top;
    if (body.is_mapping()) {
      for (auto member = body.begin(); member != body.end(); ++member) {
        if (!YamlScalarText(*member, value)) continue;
        const std::string key = member.key().get_value<std::string>();
        if (!out.Set(section.c_str(), key.c_str(), value.c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    } else if (YamlScalarText(body, value)) {
      if (!out.Set("", section.c_str(), value.c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
  }
  return expected<void, ConfigError>::success();
}
#endif

}  // namespace detail

/**
 * @brief Parse null-terminated @p text in @p format into @p out.
 * @return kFormatNotSupported when that format is not compiled in.
 */
inline expected<void, ConfigError> ParseConfigText(ConfigFormat format,
                                                   const char* text,
                                                   ConfigValues& out) {
  switch (format) {
#ifdef ZBEACON_CONFIG_INI_ENABLED
    case ConfigFormat::kIni:
      return detail::ParseIni(text, out);
#endif
#ifdef ZBEACON_CONFIG_JSON_ENABLED
    case ConfigFormat::kJson:
      return detail::ParseJson(text, out);
#endif
#ifdef ZBEACON_CONFIG_YAML_ENABLED
    case ConfigFormat::kYaml:
      return detail::ParseYaml(text, out);
#endif
    default:
      (void)text;
      (void)out;
      return expected<void, ConfigError>::error(
          ConfigError::kFormatNotSupported);
  }
}

/**
 * @brief Read @p path (at most ZBEACON_CONFIG_MAX_FILE_SIZE - 1 bytes) and
 *        parse it in the format named by its extension.
 */
inline expected<void, ConfigError> LoadConfigFile(const char* path,
                                                  ConfigValues& out) {
  auto format = ConfigFormatFromPath(path);
  if (!format.has_value()) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  FILE* f = std::fopen(path, "rb");
  if (f == nullptr) {
    return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
  }
  char text[ZBEACON_CONFIG_MAX_FILE_SIZE];
  const size_t n = std::fread(text, 1, sizeof(text) - 1, f);
  const bool too_big = (n == sizeof(text) - 1) && std::fgetc(f) != EOF;
  (void)std::fclose(f);
  if (too_big) {
    return expected<void, ConfigError>::error(ConfigError::kBufferFull);
  }
  text[n] = '\0';
  return ParseConfigText(format.value(), text, out);
}

}  // namespace zbeacon

#endif  // ZBEACON_CONFIG_HPP_
