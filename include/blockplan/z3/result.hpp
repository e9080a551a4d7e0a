#pragma once

#include "blockplan/z3/constraint_tracker.hpp"

#include <z3++.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace blockplan::z3 {

/// What a single optimize::check produced
struct SolveOutcome {
    enum class Status {
        Optimal,       // sat, optimum proven
        Suboptimal,    // stopped early; the retained model satisfies every hard constraint
        Unsat,         // hard constraints conflict
        Unknown,       // stopped early without a usable model
        Error          // Z3 raised an exception
    };

    Status status = Status::Unknown;
    std::optional<::z3::model> model;
    std::vector<ConstraintProvenance> unsat_core;   // Unsat only
    std::string error_message;                      // stop reason or exception text
    std::chrono::milliseconds solve_time{0};

    [[nodiscard]] bool has_model() const noexcept { return model.has_value(); }
    [[nodiscard]] bool is_unsat() const noexcept { return status == Status::Unsat; }

    [[nodiscard]] const char* status_string() const noexcept {
        switch (status) {
            case Status::Optimal:    return "OPTIMAL";
            case Status::Suboptimal: return "SUBOPTIMAL";
            case Status::Unsat:      return "UNSAT";
            case Status::Unknown:    return "UNKNOWN";
            case Status::Error:      return "ERROR";
            default:                 return "INVALID";
        }
    }

    [[nodiscard]] std::string summary() const {
        std::ostringstream out;
        out << "Solve outcome: " << status_string() << " after " << solve_time.count() << "ms\n";
        if (!unsat_core.empty()) {
            out << "Conflicting constraints (" << unsat_core.size() << "):\n";
            for (const auto& p : unsat_core) {
                out << "  - [" << constraint_kind_name(p.kind) << "] " << p.description << "\n";
            }
        }
        if (!error_message.empty()) {
            out << "Reason: " << error_message << "\n";
        }
        return out.str();
    }

    static SolveOutcome make_optimal(::z3::model&& m, std::chrono::milliseconds time) {
        return with_model(Status::Optimal, std::move(m), time);
    }

    static SolveOutcome make_suboptimal(::z3::model&& m, std::chrono::milliseconds time) {
        return with_model(Status::Suboptimal, std::move(m), time);
    }

    static SolveOutcome make_unsat(std::vector<ConstraintProvenance>&& core,
                                   std::chrono::milliseconds time) {
        SolveOutcome r;
        r.status = Status::Unsat;
        r.unsat_core = std::move(core);
        r.solve_time = time;
        return r;
    }

    static SolveOutcome make_unknown(const std::string& reason, std::chrono::milliseconds time) {
        SolveOutcome r;
        r.error_message = reason;
        r.solve_time = time;
        return r;
    }

    static SolveOutcome make_error(const std::string& msg) {
        SolveOutcome r;
        r.status = Status::Error;
        r.error_message = msg;
        return r;
    }

private:
    static SolveOutcome with_model(Status status, ::z3::model&& m, std::chrono::milliseconds time) {
        SolveOutcome r;
        r.status = status;
        r.model = std::move(m);
        r.solve_time = time;
        return r;
    }
};

/// Reads integer and boolean values out of a model with completion enabled.
/// Holds a reference: the model must outlive the extractor.
class ModelExtractor {
public:
    explicit ModelExtractor(const ::z3::model& model) : model_(model) {}

    [[nodiscard]] std::optional<std::int64_t> get_int(const ::z3::expr& e) const {
        try {
            ::z3::expr val = model_.eval(e, true);
            std::int64_t out = 0;
            if (val.is_numeral_i64(out)) {
                return out;
            }
        } catch (const ::z3::exception&) {
            // sort mismatch: not an integer term
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<bool> get_bool(const ::z3::expr& e) const {
        try {
            ::z3::expr val = model_.eval(e, true);
            if (val.is_true()) return true;
            if (val.is_false()) return false;
        } catch (const ::z3::exception&) {
            // sort mismatch: not a boolean term
        }
        return std::nullopt;
    }

    [[nodiscard]] std::int64_t get_int_or(const ::z3::expr& e, std::int64_t fallback) const {
        return get_int(e).value_or(fallback);
    }

    [[nodiscard]] bool get_bool_or(const ::z3::expr& e, bool fallback) const {
        return get_bool(e).value_or(fallback);
    }

private:
    const ::z3::model& model_;
};

} // namespace blockplan::z3
