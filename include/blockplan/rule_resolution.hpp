#pragma once

#include "blockplan/layout_types.hpp"
#include "blockplan/rule_registry.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace blockplan {

/// Size bounds after tier selection. Unset sides fall back to the
/// allocator defaults (1 and the floor size).
struct ResolvedSize {
    std::optional<std::int64_t> min_width;
    std::optional<std::int64_t> min_height;
    std::optional<std::int64_t> max_width;
    std::optional<std::int64_t> max_height;
    std::optional<std::int64_t> ideal_width;
    std::optional<std::int64_t> ideal_height;
};

/// Entry-count bounds after tier selection and ADA adjustment
struct ResolvedEntries {
    int min_entries = 0;
    std::optional<int> max_entries;
};

/// Select size bounds for a room type.
///
/// Minimum: explicit minimum; else the smallest matching tier for the
/// treatment-room count; else the smallest of all tiers and variants.
/// Maximum: explicit maximum; else the largest of the same candidates.
/// Length maps to height. Unresolvable sizes append a note.
[[nodiscard]] ResolvedSize resolve_size(const RoomTypeRule& rule,
                                        const LayoutContext& context,
                                        std::vector<std::string>& notes);

/// Select entry-count bounds; tiers need the treatment-room count,
/// otherwise only constant bounds apply. ADA required entries raise the minimum.
[[nodiscard]] ResolvedEntries resolve_entries(const RoomTypeRule& rule,
                                              const LayoutContext& context,
                                              std::vector<std::string>& notes);

/// Orientation for the requested layout mode, else the default (if any)
[[nodiscard]] std::optional<OrientationRule> resolve_orientation(const RoomTypeRule& rule,
                                                                 const LayoutContext& context);

/// Floor-edge reference names
[[nodiscard]] bool is_edge_reference(const std::string& reference) noexcept;

} // namespace blockplan
