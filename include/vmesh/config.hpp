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
 * @brief Section/key configuration store with pluggable parser backends.
 *
 * Backends are selected by tag type and compiled in on demand:
 *   - IniBackend  : inih library       (VMESH_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json       (VMESH_CONFIG_JSON_ENABLED)
 *
 * Every format is flattened to "section + key = value". Section and key
 * lookups are case-insensitive. Later entries overwrite earlier ones, so a
 * store can be layered from several sources.
 *
 * @code
 *   vmesh::FileConfig cfg;
 *   if (cfg.LoadFile("node.ini").has_value()) {
 *     uint16_t port = cfg.GetPort("mesh", "control_port", 8888);
 *   }
 * @endcode
 */

#ifndef VMESH_CONFIG_HPP_
#define VMESH_CONFIG_HPP_

#include "vmesh/platform.hpp"
#include "vmesh/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <tuple>

#ifdef VMESH_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef VMESH_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

namespace vmesh {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
};

// ============================================================================
// Backend Tags
// ============================================================================

namespace detail {

inline std::string ToLower(const char* s) {
  std::string out(s != nullptr ? s : "");
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c + 32);
  }
  return out;
}

inline const char* FileExtension(const char* path) noexcept {
  const char* dot = nullptr;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '.') dot = p;
    if (*p == '/') dot = nullptr;
  }
  return (dot != nullptr) ? dot + 1 : nullptr;
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) {
    std::string e = detail::ToLower(ext);
    return e == "ini" || e == "cfg" || e == "conf";
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) {
    return detail::ToLower(ext) == "json";
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  /// Insert or overwrite one entry.
  void Set(const char* section, const char* key, const char* value) {
    entries_[MakeKey(section, key)] = (value != nullptr) ? value : "";
  }

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const std::string* v = Find(section, key);
    return (v != nullptr) ? v->c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    return FindInt(section, key).value_or(default_val);
  }

  /// Negative values clamp to 0, values above 65535 clamp to 65535.
  uint16_t GetPort(const char* section, const char* key,
                   uint16_t default_val = 0) const {
    optional<int64_t> v = ParseInt(Find(section, key));
    if (!v.has_value()) return default_val;
    if (v.value() < 0) return 0;
    if (v.value() > 65535) return 65535;
    return static_cast<uint16_t>(v.value());
  }

  /// Returns the default for missing, non-numeric or negative values.
  uint32_t GetUint32(const char* section, const char* key,
                     uint32_t default_val = 0) const {
    optional<int64_t> v = ParseInt(Find(section, key));
    if (!v.has_value() || v.value() < 0 || v.value() > 0xFFFFFFFFLL) {
      return default_val;
    }
    return static_cast<uint32_t>(v.value());
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const std::string* v = Find(section, key);
    return (v != nullptr) ? ParseBool(*v) : default_val;
  }

  optional<int32_t> FindInt(const char* section, const char* key) const {
    optional<int64_t> v = ParseInt(Find(section, key));
    if (!v.has_value()) return {};
    return optional<int32_t>{static_cast<int32_t>(v.value())};
  }

  bool HasKey(const char* section, const char* key) const {
    return Find(section, key) != nullptr;
  }

  bool HasSection(const char* section) const {
    std::string prefix = detail::ToLower(section) + '.';
    auto it = entries_.lower_bound(prefix);
    return it != entries_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

  void Clear() noexcept { entries_.clear(); }

 protected:
  static std::string MakeKey(const char* section, const char* key) {
    return detail::ToLower(section) + '.' + detail::ToLower(key);
  }

  const std::string* Find(const char* section, const char* key) const {
    VMESH_ASSERT(section != nullptr && key != nullptr);
    auto it = entries_.find(MakeKey(section, key));
    return (it != entries_.end()) ? &it->second : nullptr;
  }

  static optional<int64_t> ParseInt(const std::string* s) {
    if (s == nullptr || s->empty()) return {};
    char* end = nullptr;
    long long val = std::strtoll(s->c_str(), &end, 10);
    if (end == s->c_str()) return {};
    return optional<int64_t>{static_cast<int64_t>(val)};
  }

  static bool ParseBool(const std::string& s) {
    std::string v = detail::ToLower(s.c_str());
    return v == "true" || v == "1" || v == "yes" || v == "on";
  }

  static expected<std::string, ConfigError> ReadFile(const char* path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
      return expected<std::string, ConfigError>::error(
          ConfigError::kFileNotFound);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return expected<std::string, ConfigError>::success(ss.str());
  }

  std::map<std::string, std::string> entries_;

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Backend not compiled in. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                  uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef VMESH_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                                const char* path) {
    int rc = ini_parse(path, Handler, &store);
    if (rc == -1)
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (rc != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                  const char* data,
                                                  uint32_t size) {
    // ini_parse_string needs a terminated buffer.
    std::string text(data, size);
    if (ini_parse_string(text.c_str(), Handler, &store) != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    static_cast<ConfigStore*>(user)->Set(section, name, value);
    return 1;
  }
};
#endif

#ifdef VMESH_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                                const char* path) {
    auto text = ConfigStore::ReadFile(path);
    if (!text.has_value())
      return expected<void, ConfigError>::error(text.get_error());
    return ParseBuffer(store, text.value().data(),
                       static_cast<uint32_t>(text.value().size()));
  }

  /// Top-level objects become sections; top-level scalars go to section "".
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                  const char* data,
                                                  uint32_t size) {
    auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = root.begin(); it != root.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.Set(it.key().c_str(), kit.key().c_str(), ToStr(*kit).c_str());
        }
      } else {
        store.Set("", it.key().c_str(), ToStr(*it).c_str());
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
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    VMESH_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                          ConfigFormat format) {
    VMESH_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                            ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                              ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchBuffer<Rest...>(data, size, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const {
    const char* ext = detail::FileExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }
};

// ============================================================================
// FileConfig: every backend compiled into this build
// ============================================================================

#if defined(VMESH_CONFIG_INI_ENABLED) && defined(VMESH_CONFIG_JSON_ENABLED)
using FileConfig = Config<IniBackend, JsonBackend>;
#elif defined(VMESH_CONFIG_INI_ENABLED)
using FileConfig = Config<IniBackend>;
#elif defined(VMESH_CONFIG_JSON_ENABLED)
using FileConfig = Config<JsonBackend>;
#endif

}  // namespace vmesh

#endif  // VMESH_CONFIG_HPP_
