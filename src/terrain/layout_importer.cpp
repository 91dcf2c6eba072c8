#include <sightline/terrain/layout_importer.hpp>
#include <sightline/terrain/shape_transform.hpp>
#include <sightline/core/log.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>
#include <unordered_set>

using json = nlohmann::json;

namespace sightline::terrain {

// Helper to safely get JSON values with defaults
static std::string json_get_string(const json& j, const std::string& key, const std::string& default_val = "") {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return default_val;
}

static double json_get_double(const json& j, const std::string& key, double default_val = 0.0) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return default_val;
}

static bool json_get_bool(const json& j, const std::string& key, bool default_val = false) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return default_val;
}

// {"x": .., "y": ..}; missing axes default to 0
static Point json_get_point(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_object()) {
        const json& p = j[key];
        return Point(json_get_double(p, "x"), json_get_double(p, "y"));
    }
    return Point(0.0);
}

static Result<Mirror, Error> parse_mirror(const json& piece_json) {
    if (!piece_json.contains("mirrored")) {
        return Mirror::None;
    }

    const json& value = piece_json["mirrored"];
    if (value.is_boolean()) {
        // true predates the axis names and means horizontal
        return value.get<bool>() ? Mirror::Horizontal : Mirror::None;
    }
    if (value.is_string()) {
        std::string axis = value.get<std::string>();
        if (axis == "horizontal") return Mirror::Horizontal;
        if (axis == "vertical") return Mirror::Vertical;
        if (axis == "none") return Mirror::None;
        return std::unexpected(Error(ErrorCode::InvalidLayout, std::format("Unknown mirror axis '{}'", axis)));
    }
    return std::unexpected(Error(ErrorCode::InvalidLayout, "'mirrored' must be a boolean or an axis name"));
}

Result<Shape, Error> LayoutImporter::parse_shape(const void* shape_json_ptr) {
    const json& shape_json = *static_cast<const json*>(shape_json_ptr);
    if (!shape_json.is_object()) {
        return std::unexpected(Error(ErrorCode::InvalidShape, "Shape must be an object"));
    }

    std::string type = json_get_string(shape_json, "type");

    if (type == "rectangle") {
        return Shape(Rectangle{json_get_double(shape_json, "width"), json_get_double(shape_json, "height")});
    }
    if (type == "polygon") {
        Polygon polygon;
        if (shape_json.contains("points") && shape_json["points"].is_array()) {
            for (const auto& p : shape_json["points"]) {
                polygon.points.emplace_back(json_get_double(p, "x"), json_get_double(p, "y"));
            }
        }
        return Shape(std::move(polygon));
    }
    if (type == "circle") {
        return Shape(Circle{json_get_double(shape_json, "radius")});
    }
    if (type == "line" || type == "wall") {
        return Shape(Wall{json_get_point(shape_json, "start"),
                          json_get_point(shape_json, "end"),
                          json_get_double(shape_json, "thickness", 1.0)});
    }

    return std::unexpected(Error(ErrorCode::UnknownShapeType,
                                 std::format("Unknown shape type '{}'", type)));
}

Result<TerrainPiece, Error> LayoutImporter::parse_piece(const void* piece_json_ptr) {
    const json& piece_json = *static_cast<const json*>(piece_json_ptr);

    TerrainPiece piece;
    piece.id = json_get_string(piece_json, "id");
    piece.name = json_get_string(piece_json, "name", piece.id);
    piece.category = json_get_string(piece_json, "category");
    piece.position = json_get_point(piece_json, "position");
    piece.rotation_degrees = json_get_double(piece_json, "rotation");
    piece.blocking = json_get_bool(piece_json, "blocking", true);
    piece.height = json_get_double(piece_json, "height");

    auto mirror = parse_mirror(piece_json);
    if (!mirror) {
        return std::unexpected(Error(mirror.error().code,
                                     std::format("Piece '{}': {}", piece.id, mirror.error().message)));
    }
    piece.mirror = *mirror;

    auto add_shape = [&](const json& shape_json) -> Result<void, Error> {
        auto shape = parse_shape(&shape_json);
        if (!shape) {
            return std::unexpected(Error(shape.error().code,
                                         std::format("Piece '{}': {}", piece.id, shape.error().message)));
        }
        piece.shapes.push_back(std::move(*shape));
        return {};
    };

    if (piece_json.contains("shapes") && piece_json["shapes"].is_array()) {
        for (const auto& shape_json : piece_json["shapes"]) {
            if (auto added = add_shape(shape_json); !added) {
                return std::unexpected(added.error());
            }
        }
    } else if (piece_json.contains("shape")) {
        if (auto added = add_shape(piece_json["shape"]); !added) {
            return std::unexpected(added.error());
        }
    }

    return piece;
}

Result<DeploymentZone, Error> LayoutImporter::parse_zone(const void* zone_json_ptr) {
    const json& zone_json = *static_cast<const json*>(zone_json_ptr);

    DeploymentZone zone;
    zone.name = json_get_string(zone_json, "name");
    zone.player = json_get_string(zone_json, "player");
    zone.position = json_get_point(zone_json, "position");

    if (!zone_json.contains("shape")) {
        return std::unexpected(Error(ErrorCode::InvalidLayout,
                                     std::format("Deployment zone '{}' has no shape", zone.name)));
    }
    auto shape = parse_shape(&zone_json["shape"]);
    if (!shape) {
        return std::unexpected(Error(shape.error().code,
                                     std::format("Deployment zone '{}': {}", zone.name, shape.error().message)));
    }
    zone.shape = std::move(*shape);

    return zone;
}

Result<TerrainLayout, Error> LayoutImporter::parse_layout(const std::string& json_text) {
    json layout_json;
    try {
        layout_json = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return std::unexpected(Error(ErrorCode::LayoutParseError,
                                     std::format("Failed to parse layout JSON: {}", e.what())));
    }

    if (!layout_json.is_object()) {
        return std::unexpected(Error(ErrorCode::LayoutParseError, "Layout JSON must be an object"));
    }

    TerrainLayout layout;
    layout.id = json_get_string(layout_json, "id");
    layout.name = json_get_string(layout_json, "name", layout.id);
    layout.board_width = json_get_double(layout_json, "boardWidth", layout.board_width);
    layout.board_height = json_get_double(layout_json, "boardHeight", layout.board_height);

    if (layout_json.contains("pieces") && layout_json["pieces"].is_array()) {
        for (const auto& piece_json : layout_json["pieces"]) {
            auto piece = parse_piece(&piece_json);
            if (!piece) {
                return std::unexpected(piece.error());
            }
            layout.pieces.push_back(std::move(*piece));
        }
    }

    if (layout_json.contains("deploymentZones") && layout_json["deploymentZones"].is_array()) {
        for (const auto& zone_json : layout_json["deploymentZones"]) {
            auto zone = parse_zone(&zone_json);
            if (!zone) {
                return std::unexpected(zone.error());
            }
            layout.deployment_zones.push_back(std::move(*zone));
        }
    }

    auto errors = validate_layout(layout);
    if (!errors.empty()) {
        LOG_ERROR(Terrain, "Layout '{}' validation failed:", layout.id);
        for (const auto& error : errors) {
            LOG_ERROR(Terrain, "  - {}", error);
        }
        // Duplicate ids keep their own code so callers can tell them apart
        ErrorCode code = errors.front().starts_with("Duplicate") ? ErrorCode::DuplicatePieceId
                                                                 : ErrorCode::InvalidLayout;
        return std::unexpected(Error(code, errors.front()));
    }

    LOG_INFO(Terrain, "Parsed layout '{}': {} pieces, {} deployment zones, board {}x{}",
             layout.id, layout.pieces.size(), layout.deployment_zones.size(),
             layout.board_width, layout.board_height);

    return layout;
}

Result<TerrainLayout, Error> LayoutImporter::load_layout(const std::string& json_path) {
    LOG_INFO(Terrain, "Loading terrain layout: {}", json_path);

    std::ifstream file(json_path);
    if (!file.is_open()) {
        return std::unexpected(Error(ErrorCode::FileNotFound,
                                     std::format("Failed to open layout file: {}", json_path)));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(Error(ErrorCode::FileReadError,
                                     std::format("Failed to read layout file: {}", json_path)));
    }

    return parse_layout(buffer.str());
}

std::vector<std::string> LayoutImporter::validate_layout(const TerrainLayout& layout) {
    std::vector<std::string> errors;

    if (!std::isfinite(layout.board_width) || !std::isfinite(layout.board_height) ||
        layout.board_width <= 0.0 || layout.board_height <= 0.0) {
        errors.push_back(std::format("Invalid board size: {}x{}", layout.board_width, layout.board_height));
    }

    std::unordered_set<std::string> seen;
    for (const TerrainPiece& piece : layout.pieces) {
        if (!piece.id.empty() && !seen.insert(piece.id).second) {
            errors.push_back(std::format("Duplicate piece id '{}'", piece.id));
            continue;
        }
        if (auto valid = validate_piece(piece); !valid) {
            errors.push_back(valid.error().message);
        }
    }

    for (const DeploymentZone& zone : layout.deployment_zones) {
        if (auto valid = validate_shape(zone.shape); !valid) {
            errors.push_back(std::format("Deployment zone '{}': {}", zone.name, valid.error().message));
        }
    }

    return errors;
}

} // namespace sightline::terrain
