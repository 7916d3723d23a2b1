/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "vmesh/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

TEST_CASE("Log level defaults", "[log]") {
#ifdef NDEBUG
  REQUIRE(vmesh::log::GetLevel() == vmesh::log::Level::kInfo);
#else
  REQUIRE(vmesh::log::GetLevel() == vmesh::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = vmesh::log::GetLevel();
  vmesh::log::SetLevel(vmesh::log::Level::kError);
  REQUIRE(vmesh::log::GetLevel() == vmesh::log::Level::kError);
  vmesh::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!vmesh::log::IsInitialized());
  vmesh::log::Init();
  REQUIRE(vmesh::log::IsInitialized());
  vmesh::log::Shutdown();
  REQUIRE(!vmesh::log::IsInitialized());
}

TEST_CASE("Log macros compile and run", "[log]") {
  auto prev = vmesh::log::GetLevel();
  vmesh::log::SetLevel(vmesh::log::Level::kDebug);
  VMESH_LOG_DEBUG("Test", "debug %d", 1);
  VMESH_LOG_INFO("Test", "info %s", "msg");
  VMESH_LOG_WARN("Test", "warn");
  VMESH_LOG_ERROR("Test", "error %d %d", 1, 2);
  vmesh::log::SetLevel(prev);
  REQUIRE(true);
}

TEST_CASE("Log filters below threshold", "[log]") {
  auto prev = vmesh::log::GetLevel();
  vmesh::log::SetLevel(vmesh::log::Level::kOff);
  VMESH_LOG_ERROR("Test", "should not appear");
  vmesh::log::SetLevel(vmesh::log::Level::kWarn);
  VMESH_LOG_INFO("Test", "info filtered");
  VMESH_LOG_WARN("Test", "warn passes");
  vmesh::log::SetLevel(prev);
  REQUIRE(true);
}

TEST_CASE("Log truncates oversized lines", "[log]") {
  std::string long_msg(2 * VMESH_LOG_LINE_MAX, 'x');
  VMESH_LOG_INFO("Test", "%s", long_msg.c_str());
  VMESH_LOG_INFO("Test", "");
  REQUIRE(true);
}
