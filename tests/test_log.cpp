/**
 * @file test_log.cpp
 * @brief Catch2 tests for flux::log.
 */

#include "flux/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

struct Entry {
  flux::log::Level level;
  std::string category;
  std::string message;
};

void Collect(flux::log::Level level, const char* category, const char* message, void* context) {
  static_cast<std::vector<Entry>*>(context)->push_back(Entry{level, category, message});
}

}  // namespace

TEST_CASE("log Init and Shutdown toggle the initialized flag", "[log]") {
  flux::log::Init();
  REQUIRE(flux::log::IsInitialized());
  flux::log::Shutdown();
  REQUIRE_FALSE(flux::log::IsInitialized());
}

TEST_CASE("log SetLevel round-trips", "[log]") {
  const flux::log::Level saved = flux::log::GetLevel();
  flux::log::SetLevel(flux::log::Level::kWarn);
  REQUIRE(flux::log::GetLevel() == flux::log::Level::kWarn);
  flux::log::SetLevel(saved);
}

TEST_CASE("log sink receives formatted messages", "[log]") {
  const flux::log::Level saved = flux::log::GetLevel();
  std::vector<Entry> entries;
  flux::log::SetSink(&Collect, &entries);
  flux::log::SetLevel(flux::log::Level::kInfo);

  FLUX_LOG_INFO("WorkPool", "started %d workers", 4);
  FLUX_LOG_WARN("Queue", "plain");

  flux::log::SetSink(nullptr);
  flux::log::SetLevel(saved);

  REQUIRE(entries.size() == 2U);
  REQUIRE(entries[0].level == flux::log::Level::kInfo);
  REQUIRE(entries[0].category == "WorkPool");
  REQUIRE(entries[0].message == "started 4 workers");
  REQUIRE(entries[1].category == "Queue");
  REQUIRE(entries[1].message == "plain");
}

TEST_CASE("log drops messages below the runtime level", "[log]") {
  const flux::log::Level saved = flux::log::GetLevel();
  std::vector<Entry> entries;
  flux::log::SetSink(&Collect, &entries);
  flux::log::SetLevel(flux::log::Level::kError);

  FLUX_LOG_INFO("Stream", "hidden");
  FLUX_LOG_WARN("Stream", "hidden too");
  FLUX_LOG_ERROR("Stream", "shown");

  flux::log::SetLevel(flux::log::Level::kOff);
  FLUX_LOG_ERROR("Stream", "off");

  flux::log::SetSink(nullptr);
  flux::log::SetLevel(saved);

  REQUIRE(entries.size() == 1U);
  REQUIRE(entries[0].message == "shown");
}
