#pragma once

#include <z3++.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace blockplan::z3 {

/// Solver parameters derived from LayoutOptions
struct SolverConfig {
    unsigned timeout_ms = 30000;          // wall-clock limit per check
    bool produce_unsat_cores = true;      // plain solvers only; the optimizer
                                          // reports cores for its assumptions
};

/// Owns the z3::context of one layout solve; every variable, constant and
/// optimizer of that solve is created through it
class Z3Context {
public:
    explicit Z3Context(const SolverConfig& config = {});
    ~Z3Context();

    Z3Context(const Z3Context&) = delete;
    Z3Context& operator=(const Z3Context&) = delete;
    Z3Context(Z3Context&&) noexcept;
    Z3Context& operator=(Z3Context&&) noexcept;

    [[nodiscard]] ::z3::context& ctx() noexcept { return *ctx_; }
    [[nodiscard]] const ::z3::context& ctx() const noexcept { return *ctx_; }

    /// Optimizer with the configured timeout. The limit is a solver
    /// parameter, never a process-wide one
    [[nodiscard]] ::z3::optimize make_optimizer();

    /// Satisfiability-only solver, used to probe encodings in isolation
    [[nodiscard]] ::z3::solver make_solver();

    [[nodiscard]] ::z3::expr make_int_var(const std::string& name);
    [[nodiscard]] ::z3::expr make_bool_var(const std::string& name);
    [[nodiscard]] ::z3::expr int_val(std::int64_t v);

    /// Sum of the terms; the constant 0 for an empty vector
    [[nodiscard]] ::z3::expr sum(const ::z3::expr_vector& terms);

    [[nodiscard]] const SolverConfig& config() const noexcept { return config_; }

    /// Why the optimizer stopped with `unknown` ("timeout", "canceled", ...)
    [[nodiscard]] static std::string stop_reason(const ::z3::optimize& opt);

private:
    std::unique_ptr<::z3::context> ctx_;
    SolverConfig config_;
};

/// Wall-clock stopwatch for build and solve phases
class SolveTimer {
public:
    SolveTimer() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_);
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace blockplan::z3
