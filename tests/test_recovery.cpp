/**
 * @file test_recovery.cpp
 * @brief Catch2 tests for flux::RecoveryHandler.
 */

#include "flux/recovery.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Captured {
  std::mutex mtx;
  std::vector<std::string> lines;
};

void CaptureSink(flux::log::Level /*level*/, const char* category, const char* message,
                 void* context) {
  auto* c = static_cast<Captured*>(context);
  if (std::strcmp(category, "Recovery") != 0) return;
  std::lock_guard<std::mutex> lock(c->mtx);
  c->lines.emplace_back(message);
}

bool AnyContains(const std::vector<std::string>& lines, const char* needle) {
  for (const auto& l : lines) {
    if (l.find(needle) != std::string::npos) return true;
  }
  return false;
}

}  // namespace

TEST_CASE("RecoveryHandler passes results through", "[recovery]") {
  auto ok = flux::RecoveryHandler("t", [] { return flux::WorkResult::success(); });
  REQUIRE(ok.has_value());

  auto failed =
      flux::RecoveryHandler("t", [] { return flux::WorkResult::error(flux::WorkError::kFailed); });
  REQUIRE_FALSE(failed.has_value());
  REQUIRE(failed.get_error() == flux::WorkError::kFailed);
}

TEST_CASE("RecoveryHandler contains std::exception", "[recovery]") {
  Captured cap;
  flux::log::SetSink(&CaptureSink, &cap);

  auto r = flux::RecoveryHandler("ingest", []() -> flux::WorkResult {
    throw std::runtime_error("boom");
  });
  flux::log::SetSink(nullptr);

  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == flux::WorkError::kException);
  REQUIRE(AnyContains(cap.lines, "ingest-Panic"));
  REQUIRE(AnyContains(cap.lines, "Error: boom"));
  REQUIRE(AnyContains(cap.lines, "ingest--END"));
}

TEST_CASE("RecoveryHandler contains non-standard exceptions", "[recovery]") {
  Captured cap;
  flux::log::SetSink(&CaptureSink, &cap);

  auto r = flux::RecoveryHandler("odd", []() -> flux::WorkResult { throw 17; });
  flux::log::SetSink(nullptr);

  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == flux::WorkError::kUnknownException);
  REQUIRE(AnyContains(cap.lines, "unknown exception"));
}
