#include "blockplan/project_io.hpp"
#include "blockplan/log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace blockplan {

using nlohmann::json;

namespace {

ProjectRequest read_project(const json& doc, const std::string& source) {
    if (!doc.is_object()) {
        throw ConfigurationError(source + ": expected an object");
    }

    ProjectRequest request;

    auto floor = doc.find("floor");
    if (floor == doc.end() || !floor->is_object()) {
        throw ConfigurationError(source + ": missing floor {width, height}");
    }
    request.floor.width = floor->at("width").get<std::int64_t>();
    request.floor.height = floor->at("height").get<std::int64_t>();

    auto rooms = doc.find("rooms");
    if (rooms != doc.end()) {
        if (!rooms->is_object()) {
            throw ConfigurationError(source + ".rooms: expected an object of counts");
        }
        for (const auto& [type, count] : rooms->items()) {
            if (!count.is_number_integer()) {
                throw ConfigurationError(source + ".rooms." + type + ": expected an integer count");
            }
            request.room_counts[type] = count.get<int>();
        }
    }

    auto context = doc.find("context");
    if (context != doc.end() && !context->is_null()) {
        if (!context->is_object()) {
            throw ConfigurationError(source + ".context: expected an object");
        }
        auto tr = context->find("treatmentRooms");
        if (tr != context->end() && !tr->is_null()) {
            request.context.treatment_rooms = tr->get<int>();
        }
        auto layout = context->find("layout");
        if (layout != context->end() && !layout->is_null()) {
            std::string name = layout->get<std::string>();
            request.context.layout_mode = parse_layout_mode(name);
            if (!request.context.layout_mode) {
                throw ConfigurationError(source + ".context.layout: unknown layout mode '" + name + "'");
            }
        }
    }

    return request;
}

json room_to_json(const PlacedRoom& room) {
    json doors = json::array();
    for (const auto& door : room.doors) {
        json d;
        d["slot"] = door.slot;
        d["x"] = door.x;
        d["y"] = door.y;
        d["connectsTo"] = door.connects_to ? json(*door.connects_to) : json(nullptr);
        doors.push_back(std::move(d));
    }

    json j;
    j["roomType"] = room.room_type;
    j["instanceIndex"] = room.instance_index;
    j["label"] = room.label();
    j["x"] = room.x;
    j["y"] = room.y;
    j["width"] = room.width;
    j["height"] = room.height;
    j["doors"] = std::move(doors);
    return j;
}

} // namespace

ProjectRequest ProjectIO::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("cannot open project file " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return load_string(buffer.str(), path);
}

ProjectRequest ProjectIO::load_string(const std::string& text, const std::string& source) {
    try {
        return read_project(json::parse(text), source);
    } catch (const json::exception& e) {
        throw ConfigurationError(source + ": " + e.what());
    }
}

std::string ProjectIO::to_json(const LayoutResult& result) {
    json doc;
    doc["status"] = layout_status_name(result.status);
    doc["solveTimeMs"] = result.solve_time.count();

    if (result.solution) {
        const LayoutSolution& s = *result.solution;
        doc["objective"] = s.objective_value;
        doc["penalty"] = s.penalty_total;
        doc["footprint"] = s.footprint;
        doc["floor"] = {{"width", s.floor.width}, {"height", s.floor.height}};

        json rooms = json::array();
        for (const auto& room : s.rooms) {
            rooms.push_back(room_to_json(room));
        }
        doc["rooms"] = std::move(rooms);
    } else {
        doc["objective"] = nullptr;
        doc["penalty"] = nullptr;
        doc["footprint"] = nullptr;
        doc["floor"] = nullptr;
        doc["rooms"] = json::array();
    }

    json conflicts = json::array();
    for (const auto& c : result.conflicts) {
        conflicts.push_back({{"family", c.family}, {"description", c.description}});
    }
    doc["conflicts"] = std::move(conflicts);
    doc["notes"] = result.notes;
    doc["error"] = result.error_message.empty() ? json(nullptr) : json(result.error_message);

    return doc.dump(2);
}

bool ProjectIO::save_result(const LayoutResult& result, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        log_msg(LogLevel::Error, "Cannot write result file %s", path.c_str());
        return false;
    }
    out << to_json(result) << "\n";
    return static_cast<bool>(out);
}

} // namespace blockplan
