#pragma once

#include "blockplan/rule_registry.hpp"

#include <string>

namespace blockplan {

/// Reads the rule set document:
///
///   { "version": 1, "roomTypes": { "<id>": { ...room type rules... } } }
///
/// Rule entries carry a "kind" (entryFrom, entryNotFrom,
/// entryNotFromRoomInterior, entryWithinDistance, directAdjacency,
/// preferredAdjacency, separation, nearSpace, notWithinDistance,
/// preferNearCenter, requireVisibility, avoidVisibility). Any numeric
/// parameter or target list may be the string "TBD"; such rules load as
/// unresolved and are skipped at compile time.
///
/// Every error throws ConfigurationError naming the offending path.
class RuleLoader {
public:
    static constexpr int kVersion = 1;

    [[nodiscard]] static RuleRegistry load_file(const std::string& path);

    /// `source` names the document in error messages
    [[nodiscard]] static RuleRegistry load_string(const std::string& text,
                                                  const std::string& source = "<rules>");

    /// Parse a single rule entry (JSON object text)
    [[nodiscard]] static SpatialRule parse_rule(const std::string& text);
};

} // namespace blockplan
