#include "blockplan/z3/context.hpp"
#include "blockplan/log.hpp"

namespace blockplan::z3 {

Z3Context::Z3Context(const SolverConfig& config)
    : ctx_(std::make_unique<::z3::context>())
    , config_(config) {
    log_msg(LogLevel::Debug, "[Z3] Initializing context (timeout=%ums, unsat_cores=%d)",
            config_.timeout_ms, config_.produce_unsat_cores ? 1 : 0);
}

Z3Context::~Z3Context() = default;

Z3Context::Z3Context(Z3Context&&) noexcept = default;
Z3Context& Z3Context::operator=(Z3Context&&) noexcept = default;

::z3::optimize Z3Context::make_optimizer() {
    ::z3::optimize opt(*ctx_);
    ::z3::params p(*ctx_);
    p.set("timeout", config_.timeout_ms);
    opt.set(p);
    return opt;
}

::z3::solver Z3Context::make_solver() {
    ::z3::solver s(*ctx_);
    ::z3::params p(*ctx_);
    p.set("timeout", config_.timeout_ms);
    if (config_.produce_unsat_cores) {
        p.set("unsat_core", true);
    }
    s.set(p);
    return s;
}

::z3::expr Z3Context::make_int_var(const std::string& name) {
    return ctx_->int_const(name.c_str());
}

::z3::expr Z3Context::make_bool_var(const std::string& name) {
    return ctx_->bool_const(name.c_str());
}

::z3::expr Z3Context::int_val(std::int64_t v) {
    return ctx_->int_val(static_cast<int64_t>(v));
}

::z3::expr Z3Context::sum(const ::z3::expr_vector& terms) {
    if (terms.empty()) {
        return int_val(0);
    }
    return ::z3::sum(terms);
}

std::string Z3Context::stop_reason(const ::z3::optimize& opt) {
    Z3_string reason = Z3_optimize_get_reason_unknown(opt.ctx(), opt);
    return reason ? std::string(reason) : std::string("unknown");
}

} // namespace blockplan::z3
