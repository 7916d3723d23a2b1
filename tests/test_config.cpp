/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - section/key store and parser backends.
 */

#include "vmesh/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>
#include <string>

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("ConfigStore lookups are case-insensitive", "[config]") {
  vmesh::ConfigStore store;
  store.Set("Mesh", "Control_Port", "9000");
  REQUIRE(store.HasKey("mesh", "control_port"));
  REQUIRE(store.HasSection("MESH"));
  REQUIRE_FALSE(store.HasSection("audio"));
  REQUIRE(store.GetInt("mesh", "control_port") == 9000);
}

TEST_CASE("ConfigStore typed getters fall back to defaults", "[config]") {
  vmesh::ConfigStore store;
  store.Set("t", "word", "abc");
  store.Set("t", "negative", "-5");
  store.Set("t", "flag", "Yes");

  REQUIRE(store.GetInt("t", "word", 3) == 3);
  REQUIRE(store.GetUint32("t", "negative", 11) == 11U);
  REQUIRE(store.GetUint32("t", "missing", 12) == 12U);
  REQUIRE(store.GetBool("t", "flag"));
  REQUIRE_FALSE(store.GetBool("t", "word"));
  REQUIRE(std::strcmp(store.GetString("t", "none", "dflt"), "dflt") == 0);
  REQUIRE_FALSE(store.FindInt("t", "word").has_value());
}

TEST_CASE("ConfigStore GetPort clamps out-of-range values", "[config]") {
  vmesh::ConfigStore store;
  store.Set("net", "low", "-1");
  store.Set("net", "high", "70000");
  store.Set("net", "ok", "8888");
  REQUIRE(store.GetPort("net", "low", 1) == 0);
  REQUIRE(store.GetPort("net", "high", 1) == 65535);
  REQUIRE(store.GetPort("net", "ok", 1) == 8888);
}

TEST_CASE("ConfigStore later entries overwrite earlier ones", "[config]") {
  vmesh::ConfigStore store;
  store.Set("a", "k", "1");
  store.Set("A", "K", "2");
  REQUIRE(store.EntryCount() == 1U);
  REQUIRE(store.GetInt("a", "k") == 2);
  store.Clear();
  REQUIRE(store.EntryCount() == 0U);
}

// ============================================================================
// INI backend (inih)
// ============================================================================

#ifdef VMESH_CONFIG_INI_ENABLED

using IniCfg = vmesh::Config<vmesh::IniBackend>;

TEST_CASE("INI LoadBuffer basic", "[config][ini]") {
  const char* ini_data =
      "[mesh]\n"
      "node_id = node-a\n"
      "control_port = 9100\n"
      "; comment\n"
      "[timing]\n"
      "node_timeout_ms = 20000\n";

  IniCfg cfg;
  auto result = cfg.LoadBuffer(ini_data,
                               static_cast<uint32_t>(std::strlen(ini_data)),
                               vmesh::ConfigFormat::kIni);
  REQUIRE(result.has_value());
  REQUIRE(std::strcmp(cfg.GetString("mesh", "node_id"), "node-a") == 0);
  REQUIRE(cfg.GetPort("mesh", "control_port") == 9100);
  REQUIRE(cfg.GetUint32("timing", "node_timeout_ms") == 20000U);
}

TEST_CASE("INI malformed buffer is a parse error", "[config][ini]") {
  const char* bad = "[mesh\nport 1\n";
  IniCfg cfg;
  auto result = cfg.LoadBuffer(bad, static_cast<uint32_t>(std::strlen(bad)),
                               vmesh::ConfigFormat::kIni);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == vmesh::ConfigError::kParseError);
}

TEST_CASE("INI LoadFile round trip and missing file", "[config][ini]") {
  const char* path = "/tmp/vmesh_test_config.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fputs("[mesh]\ndisplay_name = kitchen\n", f);
  std::fclose(f);

  IniCfg cfg;
  REQUIRE(cfg.LoadFile(path).has_value());
  REQUIRE(std::strcmp(cfg.GetString("mesh", "display_name"), "kitchen") == 0);
  std::remove(path);

  auto missing = cfg.LoadFile("/tmp/vmesh_no_such_file.ini");
  REQUIRE(!missing.has_value());
  REQUIRE(missing.get_error() == vmesh::ConfigError::kFileNotFound);
}

TEST_CASE("INI format not compiled in is reported", "[config][ini]") {
  IniCfg cfg;
  auto r = cfg.LoadBuffer("{}", 2, vmesh::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == vmesh::ConfigError::kFormatNotSupported);
}

#endif  // VMESH_CONFIG_INI_ENABLED

// ============================================================================
// JSON backend (nlohmann/json)
// ============================================================================

#ifdef VMESH_CONFIG_JSON_ENABLED

using JsonCfg = vmesh::Config<vmesh::JsonBackend>;

TEST_CASE("JSON LoadBuffer flattens objects into sections", "[config][json]") {
  const char* json_data =
      R"({"mesh": {"control_port": 9200, "display_name": "hall"},
          "scan": {"batch_size": 8}})";
  JsonCfg cfg;
  auto result = cfg.LoadBuffer(json_data,
                               static_cast<uint32_t>(std::strlen(json_data)),
                               vmesh::ConfigFormat::kJson);
  REQUIRE(result.has_value());
  REQUIRE(cfg.GetPort("mesh", "control_port") == 9200);
  REQUIRE(std::strcmp(cfg.GetString("mesh", "display_name"), "hall") == 0);
  REQUIRE(cfg.GetUint32("scan", "batch_size") == 8U);
}

TEST_CASE("JSON invalid document is a parse error", "[config][json]") {
  JsonCfg cfg;
  const char* bad = "{\"mesh\": ";
  auto r = cfg.LoadBuffer(bad, static_cast<uint32_t>(std::strlen(bad)),
                          vmesh::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == vmesh::ConfigError::kParseError);
}

#endif  // VMESH_CONFIG_JSON_ENABLED
