/***
 * Name: pyscope::metrics::Metrics
 * Purpose: OO metrics interface with static registry. Analysis stages inherit
 *   this class and use ScopedTimer plus helper methods to record metrics.
 * Inputs: Phase identifiers and payloads (AST geometry, named counters)
 * Outputs: A static registry accessible by the application for reporting.
 * Theory of Operation: All instances share a static Registry and enabled flag.
 *   Writers take the registry mutex; readers print a snapshot after the run.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "ast/Geometry.h"

namespace pyscope {

namespace metrics {

class Metrics {
 public:
  enum class Phase { ReadFile, Parse, Extract, Render, BuildGraph, Export };

  struct Registry {
    bool enabled{false};
    std::vector<std::pair<Phase, std::uint64_t>> durations_ns;
    ast::ASTGeometry ast_geom{};
    std::vector<std::pair<std::string, std::uint64_t>> counters; // in first-recorded order
  };

  class ScopedTimer {
   public:
    explicit ScopedTimer(Phase phase)
        : phase_(phase), start_(std::chrono::steady_clock::now()) {}
    ~ScopedTimer() noexcept {
      if (!reg_.enabled) return;
      auto end = std::chrono::steady_clock::now();
      auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count();
      const std::lock_guard<std::mutex> lock(mu_);
      reg_.durations_ns.emplace_back(phase_, static_cast<std::uint64_t>(ns));
    }
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

   private:
    Phase phase_;
    std::chrono::time_point<std::chrono::steady_clock> start_;
  };

  static void Enable(bool on) {
    const std::lock_guard<std::mutex> lock(mu_);
    reg_.enabled = on;
  }
  static Registry& GetRegistry() { return reg_; }
  static void Reset();
  // Adds `delta` to the named counter, creating it on first use
  static void AddCounter(const std::string& name, std::uint64_t delta);
  static void SetASTGeometry(const ast::ASTGeometry& g) {
    const std::lock_guard<std::mutex> lock(mu_);
    if (reg_.enabled) reg_.ast_geom = g;
  }

  static void PrintMetrics(const Registry& reg, std::ostream& out);
  static void PrintMetricsJson(const Registry& reg, std::ostream& out);

 protected:
  Metrics() = default;

 private:
  static Registry reg_;
  static std::mutex mu_;
};

}  // namespace metrics
}  // namespace pyscope
