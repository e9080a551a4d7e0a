#include "blockplan/rule_resolution.hpp"
#include "blockplan/log.hpp"

#include <algorithm>

namespace blockplan {

namespace {

/// Candidate sizes used when no explicit bound is given
std::vector<DimensionPair> size_candidates(const DimensionRules& dims,
                                           const LayoutContext& context) {
    std::vector<DimensionPair> out;
    if (context.treatment_rooms) {
        for (const auto& tier : dims.tiers) {
            if (tier.matches(*context.treatment_rooms)) out.push_back(tier.size);
        }
        if (!out.empty()) return out;
    }
    for (const auto& tier : dims.tiers) out.push_back(tier.size);
    for (const auto& v : dims.variants) out.push_back(v);
    return out;
}

template<typename Pick>
std::optional<std::int64_t> pick_side(const std::vector<DimensionPair>& candidates,
                                      std::optional<std::int64_t> DimensionPair::* side,
                                      Pick pick) {
    std::optional<std::int64_t> best;
    for (const auto& c : candidates) {
        const auto& v = c.*side;
        if (!v) continue;
        best = best ? pick(*best, *v) : *v;
    }
    return best;
}

std::int64_t take_min(std::int64_t a, std::int64_t b) { return std::min(a, b); }
std::int64_t take_max(std::int64_t a, std::int64_t b) { return std::max(a, b); }

} // namespace

ResolvedSize resolve_size(const RoomTypeRule& rule,
                          const LayoutContext& context,
                          std::vector<std::string>& notes) {
    const DimensionRules& dims = rule.dimensions;
    ResolvedSize out;

    auto candidates = size_candidates(dims, context);

    out.min_width = dims.minimum.width
        ? dims.minimum.width
        : pick_side(candidates, &DimensionPair::width, take_min);
    out.min_height = dims.minimum.length
        ? dims.minimum.length
        : pick_side(candidates, &DimensionPair::length, take_min);
    out.max_width = dims.maximum.width
        ? dims.maximum.width
        : pick_side(candidates, &DimensionPair::width, take_max);
    out.max_height = dims.maximum.length
        ? dims.maximum.length
        : pick_side(candidates, &DimensionPair::length, take_max);
    out.ideal_width = dims.ideal.width;
    out.ideal_height = dims.ideal.length;

    // Candidate maxima only bound size when they came from an actual size list
    // and do not contradict an explicit minimum
    if (out.max_width && out.min_width && *out.max_width < *out.min_width && !dims.maximum.width) {
        out.max_width.reset();
    }
    if (out.max_height && out.min_height && *out.max_height < *out.min_height && !dims.maximum.length) {
        out.max_height.reset();
    }

    if (dims.unresolved && (!out.min_width || !out.min_height)) {
        std::string note = "room type '" + rule.id +
                           "': size is TBD, minimum size not enforced";
        log_msg(LogLevel::Info, "%s", note.c_str());
        notes.push_back(std::move(note));
    }

    return out;
}

ResolvedEntries resolve_entries(const RoomTypeRule& rule,
                                const LayoutContext& context,
                                std::vector<std::string>& notes) {
    const EntryCountRule& entries = rule.entries;
    ResolvedEntries out;

    if (entries.min_entries) out.min_entries = *entries.min_entries;
    out.max_entries = entries.max_entries;

    if (!entries.tiers.empty()) {
        if (context.treatment_rooms) {
            auto it = std::find_if(entries.tiers.begin(), entries.tiers.end(),
                [&](const EntryTier& t) { return t.matches(*context.treatment_rooms); });
            if (it != entries.tiers.end()) {
                out.min_entries = it->min_entries;
                out.max_entries = it->max_entries;
            } else {
                std::string note = "room type '" + rule.id + "': no entry tier matches " +
                                   std::to_string(*context.treatment_rooms) +
                                   " treatment rooms, using constant bounds";
                log_msg(LogLevel::Info, "%s", note.c_str());
                notes.push_back(std::move(note));
            }
        } else {
            std::string note = "room type '" + rule.id +
                               "': entry tiers need the treatment-room count, using constant bounds";
            log_msg(LogLevel::Info, "%s", note.c_str());
            notes.push_back(std::move(note));
        }
    }

    if (entries.unresolved) {
        std::string note = "room type '" + rule.id + "': entry count is TBD";
        log_msg(LogLevel::Info, "%s", note.c_str());
        notes.push_back(std::move(note));
    }

    bool ada_raised = false;
    if (rule.ada.required_entries && *rule.ada.required_entries > out.min_entries) {
        out.min_entries = *rule.ada.required_entries;
        ada_raised = true;
    }
    if (out.max_entries && *out.max_entries < out.min_entries) {
        // Both bounds stay; the solve reports the pair as conflicting.
        std::string note = "room type '" + rule.id + "': " +
                           (ada_raised ? "ADA requires " : "requires ") +
                           std::to_string(out.min_entries) + " entries but at most " +
                           std::to_string(*out.max_entries) + " are allowed";
        log_msg(LogLevel::Warn, "%s", note.c_str());
        notes.push_back(std::move(note));
    }

    return out;
}

std::optional<OrientationRule> resolve_orientation(const RoomTypeRule& rule,
                                                   const LayoutContext& context) {
    if (context.layout_mode) {
        auto it = rule.orientation.by_layout.find(*context.layout_mode);
        if (it != rule.orientation.by_layout.end()) return it->second;
    }
    return rule.orientation.fallback;
}

bool is_edge_reference(const std::string& reference) noexcept {
    return reference == "north" || reference == "south" ||
           reference == "east" || reference == "west";
}

} // namespace blockplan
