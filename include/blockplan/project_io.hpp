#pragma once

#include "blockplan/layout_types.hpp"

#include <string>

namespace blockplan {

/// Project requests in, layout results out.
///
/// Request document:
///   { "floor": {"width": W, "height": H},
///     "rooms": {"<roomType>": count, ...},
///     "context": {"treatmentRooms": n, "layout": "narrow"} }
///
/// Result document:
///   { "status", "objective", "penalty", "footprint", "solveTimeMs",
///     "floor", "rooms": [...], "conflicts": [...], "notes": [...], "error" }
class ProjectIO {
public:
    /// Throws ConfigurationError when the file is missing or malformed
    [[nodiscard]] static ProjectRequest load_file(const std::string& path);
    [[nodiscard]] static ProjectRequest load_string(const std::string& text,
                                                    const std::string& source = "<project>");

    /// Result as indented JSON text
    [[nodiscard]] static std::string to_json(const LayoutResult& result);

    /// Returns false when the file cannot be written
    static bool save_result(const LayoutResult& result, const std::string& path);
};

} // namespace blockplan
