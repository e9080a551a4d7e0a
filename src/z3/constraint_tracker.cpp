#include "blockplan/z3/constraint_tracker.hpp"

#include <map>
#include <sstream>

namespace blockplan::z3 {

const char* constraint_kind_name(ConstraintProvenance::Kind kind) noexcept {
    using Kind = ConstraintProvenance::Kind;
    switch (kind) {
        case Kind::FloorBounds:     return "floor-bounds";
        case Kind::NonOverlap:      return "non-overlap";
        case Kind::Size:            return "size";
        case Kind::DoorPerimeter:   return "door-perimeter";
        case Kind::EntryCount:      return "entry-count";
        case Kind::EntryConnection: return "entry-connection";
        case Kind::Adjacency:       return "adjacency";
        case Kind::Separation:      return "separation";
        case Kind::Distance:        return "distance";
        case Kind::Orientation:     return "orientation";
        default:                    return "other";
    }
}

ConstraintTracker::ConstraintTracker(::z3::context& ctx, bool tracking_enabled)
    : ctx_(ctx)
    , tracking_enabled_(tracking_enabled) {}

std::string ConstraintTracker::make_tracking_name(unsigned id) const {
    return "__track_" + std::to_string(id);
}

void ConstraintTracker::add_hard(::z3::optimize& opt,
                                 const ::z3::expr& constraint,
                                 const ConstraintProvenance& provenance) {
    constraints_.push_back(constraint);

    if (!tracking_enabled_) {
        opt.add(constraint);
        return;
    }

    unsigned id = next_id_++;
    std::string name = make_tracking_name(id);
    ::z3::expr lit = ctx_.bool_const(name.c_str());

    opt.add(::z3::implies(lit, constraint));

    ConstraintProvenance prov = provenance;
    prov.tracking_literal = lit;
    name_to_index_[name] = provenance_.size();
    provenance_.push_back(std::move(prov));
    tracking_exprs_.push_back(lit);
}

void ConstraintTracker::add_definition(::z3::optimize& opt, const ::z3::expr& constraint) {
    constraints_.push_back(constraint);
    opt.add(constraint);
}

std::vector<ConstraintProvenance> ConstraintTracker::analyze_unsat_core(
    const ::z3::expr_vector& core) const
{
    std::vector<ConstraintProvenance> result;
    for (unsigned i = 0; i < core.size(); ++i) {
        if (const auto* prov = get_provenance(core[i])) {
            result.push_back(*prov);
        }
    }
    return result;
}

::z3::expr_vector ConstraintTracker::assumptions() const {
    ::z3::expr_vector lits(ctx_);
    for (const auto& e : tracking_exprs_) {
        lits.push_back(e);
    }
    return lits;
}

bool ConstraintTracker::all_hard_satisfied(const ::z3::model& model) const {
    for (const auto& c : constraints_) {
        ::z3::expr value = model.eval(c, true);
        if (!value.is_true()) {
            return false;
        }
    }
    return true;
}

const ConstraintProvenance* ConstraintTracker::get_provenance(const ::z3::expr& tracking_lit) const {
    std::string name = tracking_lit.to_string();
    auto it = name_to_index_.find(name);
    if (it == name_to_index_.end()) {
        return nullptr;
    }
    return &provenance_[it->second];
}

std::vector<ConstraintProvenance> ConstraintTracker::get_by_kind(ConstraintProvenance::Kind kind) const {
    std::vector<ConstraintProvenance> result;
    for (const auto& p : provenance_) {
        if (p.kind == kind) {
            result.push_back(p);
        }
    }
    return result;
}

void ConstraintTracker::clear() {
    next_id_ = 0;
    provenance_.clear();
    constraints_.clear();
    tracking_exprs_.clear();
    name_to_index_.clear();
}

std::string ConstraintTracker::generate_report() const {
    std::map<std::string, size_t> counts;
    for (const auto& p : provenance_) {
        ++counts[constraint_kind_name(p.kind)];
    }

    std::ostringstream out;
    out << "Constraint Tracker Report\n";
    out << "  Asserted constraints: " << constraints_.size()
        << " (" << provenance_.size() << " tracked)\n";
    for (const auto& [kind, count] : counts) {
        out << "  " << kind << ": " << count << "\n";
    }
    return out.str();
}

} // namespace blockplan::z3
