#pragma once

#include "blockplan/layout_types.hpp"

#include <cstdint>
#include <string>

namespace blockplan {

/// Engine options
struct LayoutOptions {
    unsigned      timeout_ms;           // Wall-clock limit for one solve
    int           door_slots;           // Door slots per instance
    std::int64_t  penalty_scale;        // Lower bound on the penalty multiplier
    std::int64_t  tie_break_scale;      // Footprint multiplier
    std::int64_t  default_separation;   // Separation distance when a rule gives none
    std::int64_t  min_shared_wall;      // Minimum shared boundary for adjacency
    std::int64_t  hidden_clearance;     // Gap at which a room counts as out of sight
    int           ideal_size_weight;    // Weight of |size - ideal| (0 disables)
    bool          break_symmetry;       // Order same-type instances by x
    bool          track_conflicts;      // Track hard constraints for unsat cores
    bool          debug_mode;           // Verbose logging

    LayoutOptions()
        : timeout_ms(30000)
        , door_slots(4)
        , penalty_scale(1000)
        , tie_break_scale(1)
        , default_separation(12)
        , min_shared_wall(12)
        , hidden_clearance(24)
        , ideal_size_weight(1)
        , break_symmetry(true)
        , track_conflicts(true)
        , debug_mode(false) {}

    /// Throws ConfigurationError on out-of-range values
    void validate() const;
};

/// Owns the engine options and persists them as a JSON document
class Config {
public:
    static constexpr int kVersion = 1;

    Config() = default;

    /// Load options from a JSON file. A missing file keeps the defaults and
    /// returns false; a malformed file throws ConfigurationError.
    bool load(const std::string& path);

    /// Write options to a JSON file; returns false when the file cannot be written
    bool save(const std::string& path);

    /// Reset to defaults
    void reset();

    [[nodiscard]] const LayoutOptions& options() const noexcept {
        return options_;
    }

    [[nodiscard]] LayoutOptions& mutable_options() noexcept {
        dirty_ = true;
        return options_;
    }

    [[nodiscard]] bool is_dirty() const noexcept {
        return dirty_;
    }

    void mark_clean() noexcept {
        dirty_ = false;
    }

    // Convenience accessors
    [[nodiscard]] unsigned timeout_ms() const noexcept { return options_.timeout_ms; }
    [[nodiscard]] int door_slots() const noexcept { return options_.door_slots; }
    [[nodiscard]] std::int64_t penalty_scale() const noexcept { return options_.penalty_scale; }
    [[nodiscard]] std::int64_t tie_break_scale() const noexcept { return options_.tie_break_scale; }
    [[nodiscard]] std::int64_t default_separation() const noexcept { return options_.default_separation; }
    [[nodiscard]] std::int64_t min_shared_wall() const noexcept { return options_.min_shared_wall; }
    [[nodiscard]] bool debug_mode() const noexcept { return options_.debug_mode; }

private:
    LayoutOptions options_;
    bool dirty_ = false;
};

} // namespace blockplan
