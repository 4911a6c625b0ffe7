/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file config.hpp
 * @brief Section/key configuration store with tag-dispatched file backends.
 *
 * Backends (CMake opt-in):
 *   - IniBackend  : inih library  (TETHER_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (TETHER_CONFIG_JSON_ENABLED)
 *
 * Both formats flatten to "section + key = value". JSON top-level objects are
 * sections; top-level scalars land in the "" section. Section and key lookup
 * is case-insensitive. Values are unbounded strings because remote command
 * templates routinely exceed a line.
 *
 * Usage:
 * @code
 *   tether::IniConfig cfg;
 *   cfg.LoadFile("tether.ini");
 *   uint16_t port = cfg.GetPort("listener", "port", 4444);
 * @endcode
 */

#ifndef TETHER_CONFIG_HPP_
#define TETHER_CONFIG_HPP_

#include "tether/platform.hpp"
#include "tether/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <tuple>
#include <vector>

#ifdef TETHER_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef TETHER_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

namespace tether {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
};

namespace detail {

inline bool CaseEqual(const std::string& a, const std::string& b) noexcept {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    char la = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] + 32) : a[i];
    char lb = (b[i] >= 'A' && b[i] <= 'Z') ? static_cast<char>(b[i] + 32) : b[i];
    if (la != lb) return false;
  }
  return true;
}

}  // namespace detail

// ============================================================================
// Backend Tag Types
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "cfg") ||
           detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  // --- Typed Getters ---

  std::string GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : std::string(default_val);
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    long val = std::strtol(e->value.c_str(), &end, 10);
    return (end == e->value.c_str()) ? default_val : static_cast<int32_t>(val);
  }

  /** @brief Non-negative integer; negative or malformed values yield the default. */
  uint32_t GetUint(const char* section, const char* key,
                   uint32_t default_val = 0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    long long val = std::strtoll(e->value.c_str(), &end, 10);
    if (end == e->value.c_str() || val < 0 || val > 0xFFFFFFFFLL) {
      return default_val;
    }
    return static_cast<uint32_t>(val);
  }

  uint16_t GetPort(const char* section, const char* key,
                   uint16_t default_val = 0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    long val = std::strtol(e->value.c_str(), &end, 10);
    if (end == e->value.c_str()) return default_val;
    if (val < 0) return 0;
    if (val > 65535) return 65535;
    return static_cast<uint16_t>(val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  // --- Query ---

  bool HasSection(const char* section) const {
    TETHER_ASSERT(section != nullptr);
    for (const Entry& e : entries_) {
      if (detail::CaseEqual(e.section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

 protected:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  std::vector<Entry> entries_;

  /** @brief Insert or overwrite; later files override earlier ones. */
  void SetEntry(const std::string& section, const std::string& key,
                const std::string& value) {
    for (Entry& e : entries_) {
      if (detail::CaseEqual(e.section, section) &&
          detail::CaseEqual(e.key, key)) {
        e.value = value;
        return;
      }
    }
    entries_.push_back(Entry{section, key, value});
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    TETHER_ASSERT(section != nullptr && key != nullptr);
    for (const Entry& e : entries_) {
      if (detail::CaseEqual(e.section, section) &&
          detail::CaseEqual(e.key, key)) {
        return &e;
      }
    }
    return nullptr;
  }

  static expected<std::string, ConfigError> ReadFile(const char* path) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<std::string, ConfigError>::error(
          ConfigError::kFileNotFound);
    }
    std::string out;
    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
      out.append(buf, n);
    }
    std::fclose(f);
    return expected<std::string, ConfigError>::success(std::move(out));
  }

  static bool ParseBool(const std::string& str) noexcept {
    return detail::CaseEqual(str, "true") || detail::CaseEqual(str, "1") ||
           detail::CaseEqual(str, "yes") || detail::CaseEqual(str, "on");
  }

  static std::string GetExtension(const char* path) {
    std::string p(path);
    size_t slash = p.find_last_of("/\\");
    size_t dot = p.rfind('.');
    if (dot == std::string::npos ||
        (slash != std::string::npos && dot < slash)) {
      return std::string();
    }
    return p.substr(dot + 1);
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
  static expected<void, ConfigError> ParseBuffer(ConfigStore&,
                                                 const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef TETHER_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    int result = ini_parse(path, Handler, &store);
    if (result == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    if (ini_parse_string(data.c_str(), Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    s->SetEntry(section ? section : "", name ? name : "", value ? value : "");
    return 1;
  }
};
#endif

#ifdef TETHER_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.SetEntry(it.key(), kit.key(), ToStr(*kit));
        }
      } else {
        store.SetEntry("", it.key(), ToStr(*it));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    return n.dump();
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

  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    TETHER_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& data,
                                         ConfigFormat format) {
    return DispatchBuffer<Backends...>(data, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                           ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchFile<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const std::string& data,
                                             ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchBuffer<Rest...>(data, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const {
    std::string ext = GetExtension(path);
    if (ext.empty()) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const std::string& ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

// ============================================================================
// Convenience Type Aliases
// ============================================================================

#if defined(TETHER_CONFIG_INI_ENABLED) && defined(TETHER_CONFIG_JSON_ENABLED)
using MultiConfig = Config<IniBackend, JsonBackend>;
#elif defined(TETHER_CONFIG_INI_ENABLED)
using MultiConfig = Config<IniBackend>;
#elif defined(TETHER_CONFIG_JSON_ENABLED)
using MultiConfig = Config<JsonBackend>;
#endif

#ifdef TETHER_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef TETHER_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif

}  // namespace tether

#endif  // TETHER_CONFIG_HPP_
