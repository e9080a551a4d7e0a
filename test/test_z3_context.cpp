/**
 * @file test_z3_context.cpp
 * @brief Unit tests for Z3 context management and constraint tracking
 *
 * Tests the Z3Context wrapper class, including:
 * - Context creation and variable helpers
 * - Optimizer creation and minimization
 * - Tracked hard constraints and unsat-core provenance
 * - Model verification for interrupted searches
 * - Result and model extraction helpers
 * - Per-context solver timeouts
 */

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// Z3 headers
#include <z3++.h>

#include "blockplan/z3/constraint_tracker.hpp"
#include "blockplan/z3/context.hpp"
#include "blockplan/z3/result.hpp"

using namespace blockplan::z3;

namespace {

// Test configuration
constexpr unsigned DEFAULT_TIMEOUT_MS = 5000;

// ============================================================================
// Test Helpers
// ============================================================================

struct TestResult {
    bool passed;
    std::string name;
    std::string message;
    std::chrono::milliseconds duration;

    TestResult(const std::string& n, bool p, const std::string& msg = "")
        : passed(p), name(n), message(msg), duration(0) {}
};

class TestRunner {
public:
    template<typename F>
    void run(const std::string& name, F&& test_fn) {
        auto start = std::chrono::steady_clock::now();
        try {
            test_fn();
            auto end = std::chrono::steady_clock::now();
            auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

            TestResult result(name, true);
            result.duration = dur;
            results_.push_back(result);
            std::cout << "[PASS] " << name << " (" << dur.count() << "ms)\n";
        }
        catch (const ::z3::exception& e) {
            TestResult result(name, false, e.msg());
            results_.push_back(result);
            std::cout << "[FAIL] " << name << ": Z3 exception: " << e.msg() << "\n";
        }
        catch (const std::exception& e) {
            auto end = std::chrono::steady_clock::now();
            auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

            TestResult result(name, false, e.what());
            result.duration = dur;
            results_.push_back(result);
            std::cout << "[FAIL] " << name << ": " << e.what() << "\n";
        }
    }

    void summary() const {
        int passed = 0, failed = 0;
        for (const auto& r : results_) {
            if (r.passed) ++passed;
            else ++failed;
        }
        std::cout << "\n=== Summary ===\n";
        std::cout << "Passed: " << passed << ", Failed: " << failed << "\n";
    }

    bool all_passed() const {
        for (const auto& r : results_) {
            if (!r.passed) return false;
        }
        return true;
    }

private:
    std::vector<TestResult> results_;
};

/// Fails the running test (independent of NDEBUG)
void check(bool condition, const char* what) {
    if (!condition) {
        throw std::runtime_error(std::string("check failed: ") + what);
    }
}

SolverConfig test_config() {
    SolverConfig config;
    config.timeout_ms = DEFAULT_TIMEOUT_MS;
    return config;
}

// ============================================================================
// Z3 Context Tests
// ============================================================================

/// Test basic context creation
void test_context_creation() {
    Z3Context ctx(test_config());

    ::z3::expr x = ctx.make_int_var("x");
    ::z3::expr y = ctx.make_int_var("y");
    ::z3::expr sum = x + y;

    check(sum.is_arith(), "sum of ints is arithmetic");
    check(ctx.make_bool_var("b").is_bool(), "bool var has bool sort");
    check(ctx.config().timeout_ms == DEFAULT_TIMEOUT_MS, "timeout kept");
}

/// Context can be moved without losing its expressions' owner
void test_context_move() {
    Z3Context a(test_config());
    Z3Context b(std::move(a));

    ::z3::expr x = b.make_int_var("x");
    ::z3::solver s = b.make_solver();
    s.add(x == 3);
    check(s.check() == ::z3::sat, "moved context still usable");
}

/// Empty sums are the constant 0
void test_empty_sum() {
    Z3Context ctx(test_config());
    ::z3::expr_vector none(ctx.ctx());
    ::z3::expr s = ctx.sum(none);

    int64_t value = -1;
    check(s.simplify().is_numeral_i64(value), "empty sum is a numeral");
    check(value == 0, "empty sum is zero");
}

/// Optimizer minimizes a bounded objective
void test_optimizer_minimize() {
    Z3Context ctx(test_config());
    ::z3::optimize opt = ctx.make_optimizer();

    ::z3::expr w = ctx.make_int_var("w");
    ::z3::expr h = ctx.make_int_var("h");
    opt.add(w >= 10 && h >= 4);
    opt.add(w * 1 + h * 1 >= 20);
    opt.minimize(w + 2 * h);

    check(opt.check() == ::z3::sat, "optimizer finds a model");
    ::z3::model model = opt.get_model();
    ModelExtractor ex(model);
    check(ex.get_int_or(w, -1) == 16, "w pushed up");
    check(ex.get_int_or(h, -1) == 4, "h at its minimum");
}

/// Tracked constraints name themselves in the unsat core
void test_unsat_core_provenance() {
    Z3Context ctx(test_config());
    ::z3::optimize opt = ctx.make_optimizer();
    ConstraintTracker tracker(ctx.ctx());

    ::z3::expr gap = ctx.make_int_var("gap");
    tracker.add_definition(opt, gap >= 0);
    tracker.add_hard(opt, gap == 0,
        ConstraintProvenance::make(ConstraintProvenance::Kind::Adjacency,
                                   "lab__0", "touch sterilization", "sterilization__0"));
    tracker.add_hard(opt, gap >= 50,
        ConstraintProvenance::make(ConstraintProvenance::Kind::Separation,
                                   "lab__0", "gap >= 50 from sterilization", "sterilization__0"));
    tracker.add_hard(opt, ctx.make_int_var("unrelated") >= 3,
        ConstraintProvenance::make(ConstraintProvenance::Kind::Size,
                                   "consult__0", "width >= 3"));

    check(tracker.tracked_constraints() == 3, "three tracked constraints");
    check(tracker.total_constraints() == 4, "definition recorded too");

    ::z3::check_result r = opt.check(tracker.assumptions());
    check(r == ::z3::unsat, "touch and separation conflict");

    auto core = tracker.analyze_unsat_core(opt.unsat_core());
    bool has_adjacency = false;
    bool has_separation = false;
    for (const auto& p : core) {
        if (p.kind == ConstraintProvenance::Kind::Adjacency) has_adjacency = true;
        if (p.kind == ConstraintProvenance::Kind::Separation) has_separation = true;
    }
    check(has_adjacency && has_separation, "core holds both families");
}

/// With tracking disabled constraints are asserted directly
void test_tracking_disabled() {
    Z3Context ctx(test_config());
    ::z3::optimize opt = ctx.make_optimizer();
    ConstraintTracker tracker(ctx.ctx(), false);

    ::z3::expr x = ctx.make_int_var("x");
    tracker.add_hard(opt, x >= 5,
        ConstraintProvenance::make(ConstraintProvenance::Kind::Size, "a__0", "x >= 5"));

    check(!tracker.tracking_enabled(), "tracking off");
    check(tracker.assumptions().empty(), "no assumptions");
    check(tracker.tracked_constraints() == 0, "nothing tracked");

    opt.add(x <= 4);
    check(opt.check() == ::z3::unsat, "constraint still enforced");
}

/// A model is verified against every recorded constraint
void test_model_verification() {
    Z3Context ctx(test_config());
    ::z3::optimize opt = ctx.make_optimizer();
    ConstraintTracker tracker(ctx.ctx());

    ::z3::expr x = ctx.make_int_var("x");
    tracker.add_definition(opt, x >= 0);
    tracker.add_hard(opt, x <= 5,
        ConstraintProvenance::make(ConstraintProvenance::Kind::FloorBounds, "a__0", "x <= 5"));

    check(opt.check(tracker.assumptions()) == ::z3::sat, "satisfiable");
    check(tracker.all_hard_satisfied(opt.get_model()), "own model verifies");

    ::z3::solver other = ctx.make_solver();
    other.add(x == 7);
    check(other.check() == ::z3::sat, "other model exists");
    check(!tracker.all_hard_satisfied(other.get_model()), "x = 7 violates x <= 5");
}

/// Provenance lookup and per-kind queries
void test_provenance_lookup() {
    Z3Context ctx(test_config());
    ::z3::optimize opt = ctx.make_optimizer();
    ConstraintTracker tracker(ctx.ctx());

    ::z3::expr x = ctx.make_int_var("x");
    tracker.add_hard(opt, x >= 1,
        ConstraintProvenance::make(ConstraintProvenance::Kind::Size, "a__0", "w >= 1"));
    tracker.add_hard(opt, x <= 9,
        ConstraintProvenance::make(ConstraintProvenance::Kind::FloorBounds, "a__0", "x + w <= W"));
    tracker.add_hard(opt, x != 4,
        ConstraintProvenance::make(ConstraintProvenance::Kind::Size, "b__0", "h >= 1"));

    check(tracker.get_by_kind(ConstraintProvenance::Kind::Size).size() == 2, "two size constraints");

    ::z3::expr_vector lits = tracker.assumptions();
    check(lits.size() == 3, "three literals");
    const ConstraintProvenance* p = tracker.get_provenance(lits[1]);
    check(p != nullptr && p->description == "x + w <= W", "literal maps back to its constraint");
    check(tracker.get_provenance(x) == nullptr, "plain variable has no provenance");

    std::string report = tracker.generate_report();
    check(report.find("size: 2") != std::string::npos, "report groups by kind");

    tracker.clear();
    check(tracker.total_constraints() == 0, "cleared");
}

/// Solve outcome factories and summaries
void test_solve_outcome() {
    SolveOutcome err = SolveOutcome::make_error("boom");
    check(err.status == SolveOutcome::Status::Error, "error status");
    check(!err.has_model(), "no model on error");
    check(err.summary().find("boom") != std::string::npos, "summary carries message");

    std::vector<ConstraintProvenance> core;
    core.push_back(ConstraintProvenance::make(ConstraintProvenance::Kind::Separation,
                                              "a__0", "gap >= 50"));
    SolveOutcome unsat = SolveOutcome::make_unsat(std::move(core), std::chrono::milliseconds(3));
    check(unsat.is_unsat(), "unsat status");
    check(std::string(unsat.status_string()) == "UNSAT", "status string");
    check(unsat.summary().find("[separation] gap >= 50") != std::string::npos, "core listed");

    SolveOutcome unknown = SolveOutcome::make_unknown("timeout", std::chrono::milliseconds(10));
    check(std::string(unknown.status_string()) == "UNKNOWN", "unknown status");
}

/// Model extraction of ints and bools, with defaults
void test_model_extraction() {
    Z3Context ctx(test_config());
    ::z3::solver s = ctx.make_solver();

    ::z3::expr x = ctx.make_int_var("x");
    ::z3::expr b = ctx.make_bool_var("b");
    s.add(x == 42 && b);
    check(s.check() == ::z3::sat, "sat");

    ::z3::model model = s.get_model();
    ModelExtractor ex(model);
    check(ex.get_int(x) == std::optional<std::int64_t>(42), "int value");
    check(ex.get_bool_or(b, false), "bool value");
    // Model completion assigns unconstrained variables
    check(ex.get_int(ctx.make_int_var("free")).has_value(), "completion");
    check(ex.get_int_or(b, -5) == -5, "bool read as int falls back");
}

/// Timeout parameter produces unknown on a hard instance
void test_unknown_reason() {
    SolverConfig config;
    config.timeout_ms = 1;
    Z3Context ctx(config);
    ::z3::optimize opt = ctx.make_optimizer();

    // Nonlinear search that a 1ms budget cannot finish
    ::z3::expr a = ctx.make_int_var("a");
    ::z3::expr b = ctx.make_int_var("b");
    ::z3::expr c = ctx.make_int_var("c");
    opt.add(a > 1 && b > 1 && c > 1);
    opt.add(a * a * a + b * b * b == c * c * c + 7919);
    opt.minimize(a + b + c);

    ::z3::check_result r = opt.check();
    if (r == ::z3::unknown) {
        check(!Z3Context::stop_reason(opt).empty(), "reason reported");
    }
}

/// A short limit on one context leaves contexts created afterwards alone
void test_timeouts_independent() {
    SolverConfig short_config;
    short_config.timeout_ms = 1;
    Z3Context short_ctx(short_config);
    ::z3::optimize short_opt = short_ctx.make_optimizer();

    Z3Context ctx(test_config());
    ::z3::optimize opt = ctx.make_optimizer();

    // Pairwise non-overlap of eight squares: well past 1ms, well under the default
    std::vector<::z3::expr> xs;
    for (int i = 0; i < 8; ++i) {
        ::z3::expr x = ctx.make_int_var("x" + std::to_string(i));
        opt.add(x >= 0 && x + 10 <= 200);
        xs.push_back(x);
    }
    for (size_t i = 0; i < xs.size(); ++i) {
        for (size_t j = i + 1; j < xs.size(); ++j) {
            opt.add(xs[i] + 10 <= xs[j] || xs[j] + 10 <= xs[i]);
        }
    }
    ::z3::expr_vector all(ctx.ctx());
    for (const auto& x : xs) all.push_back(x);
    opt.minimize(ctx.sum(all));

    check(opt.check() == ::z3::sat, "second context solves to the end");
    ::z3::model model = opt.get_model();
    ModelExtractor ex(model);
    std::int64_t total = 0;
    for (const auto& x : xs) total += ex.get_int_or(x, -1);
    check(total == 280, "packed at 0, 10, ..., 70");
}

/// Every rule family has its own name in conflict reports
void test_kind_names() {
    using Kind = ConstraintProvenance::Kind;
    const Kind families[] = {
        Kind::FloorBounds, Kind::NonOverlap, Kind::Size, Kind::DoorPerimeter,
        Kind::EntryCount, Kind::EntryConnection, Kind::Adjacency, Kind::Separation,
        Kind::Distance, Kind::Orientation,
    };
    for (Kind k : families) {
        check(std::string(constraint_kind_name(k)) != "other", "family named");
    }
    check(std::string(constraint_kind_name(Kind::Other)) == "other", "fallback name");
    check(std::string(constraint_kind_name(Kind::EntryCount)) == "entry-count", "entry-count name");
}

} // namespace

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== Z3 Context Unit Tests ===\n\n";

    TestRunner runner;

    runner.run("context_creation", test_context_creation);
    runner.run("context_move", test_context_move);
    runner.run("empty_sum", test_empty_sum);
    runner.run("optimizer_minimize", test_optimizer_minimize);
    runner.run("unsat_core_provenance", test_unsat_core_provenance);
    runner.run("tracking_disabled", test_tracking_disabled);
    runner.run("model_verification", test_model_verification);
    runner.run("provenance_lookup", test_provenance_lookup);
    runner.run("solve_outcome", test_solve_outcome);
    runner.run("model_extraction", test_model_extraction);
    runner.run("unknown_reason", test_unknown_reason);
    runner.run("timeouts_independent", test_timeouts_independent);
    runner.run("kind_names", test_kind_names);

    runner.summary();

    return runner.all_passed() ? 0 : 1;
}
