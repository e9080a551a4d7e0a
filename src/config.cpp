#include "blockplan/config.hpp"
#include "blockplan/log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace blockplan {

using nlohmann::json;

bool Config::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        // No saved options, use defaults
        log_msg(LogLevel::Debug, "No options file at %s, using defaults", path.c_str());
        return false;
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        throw ConfigurationError("options file " + path + ": " + e.what());
    }
    if (!doc.is_object()) {
        throw ConfigurationError("options file " + path + ": expected an object");
    }

    int version = doc.value("version", 0);
    if (version < 1 || version > kVersion) {
        throw ConfigurationError("options file " + path + ": unsupported version " +
                                 std::to_string(version));
    }

    LayoutOptions loaded;
    try {
        loaded.timeout_ms = doc.value("timeoutMs", loaded.timeout_ms);
        loaded.door_slots = doc.value("doorSlots", loaded.door_slots);
        loaded.penalty_scale = doc.value("penaltyScale", loaded.penalty_scale);
        loaded.tie_break_scale = doc.value("tieBreakScale", loaded.tie_break_scale);
        loaded.default_separation = doc.value("defaultSeparation", loaded.default_separation);
        loaded.min_shared_wall = doc.value("minSharedWall", loaded.min_shared_wall);
        loaded.hidden_clearance = doc.value("hiddenClearance", loaded.hidden_clearance);
        loaded.ideal_size_weight = doc.value("idealSizeWeight", loaded.ideal_size_weight);
        loaded.break_symmetry = doc.value("breakSymmetry", loaded.break_symmetry);
        loaded.track_conflicts = doc.value("trackConflicts", loaded.track_conflicts);
        loaded.debug_mode = doc.value("debugMode", loaded.debug_mode);
    } catch (const json::type_error& e) {
        throw ConfigurationError("options file " + path + ": " + e.what());
    }
    loaded.validate();

    options_ = loaded;
    dirty_ = false;
    return true;
}

bool Config::save(const std::string& path) {
    json doc;
    doc["version"] = kVersion;
    doc["timeoutMs"] = options_.timeout_ms;
    doc["doorSlots"] = options_.door_slots;
    doc["penaltyScale"] = options_.penalty_scale;
    doc["tieBreakScale"] = options_.tie_break_scale;
    doc["defaultSeparation"] = options_.default_separation;
    doc["minSharedWall"] = options_.min_shared_wall;
    doc["hiddenClearance"] = options_.hidden_clearance;
    doc["idealSizeWeight"] = options_.ideal_size_weight;
    doc["breakSymmetry"] = options_.break_symmetry;
    doc["trackConflicts"] = options_.track_conflicts;
    doc["debugMode"] = options_.debug_mode;

    std::ofstream out(path);
    if (!out) {
        log_msg(LogLevel::Error, "Cannot write options file %s", path.c_str());
        return false;
    }
    out << doc.dump(2) << "\n";
    if (!out) {
        return false;
    }

    dirty_ = false;
    return true;
}

void Config::reset() {
    options_ = LayoutOptions();
    dirty_ = true;
}

} // namespace blockplan
