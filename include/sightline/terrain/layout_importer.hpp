#pragma once

#include <sightline/core/types.hpp>
#include <sightline/terrain/terrain_types.hpp>
#include <string>
#include <vector>

namespace sightline::terrain {

// LayoutImporter - Parses terrain layout JSON into TerrainLayout
//
// Layout format (all measurements in inches):
// {
//   "id": "gw-layout-1", "name": "...", "boardWidth": 60, "boardHeight": 44,
//   "pieces": [{
//     "id": "ruin-a", "name": "...", "category": "ruins",
//     "position": {"x": 10, "y": 7}, "rotation": 90,
//     "mirrored": false | true | "horizontal" | "vertical",
//     "blocking": true, "height": 5,
//     "shapes": [{"type": "rectangle", "width": 10, "height": 6},
//                {"type": "line", "start": {...}, "end": {...}, "thickness": 1}]
//   }],
//   "deploymentZones": [{"name": "...", "player": "attacker", "shape": {...}, "position": {...}}]
// }
// A piece may carry a single "shape" object instead of "shapes".
class LayoutImporter {
public:
    // Read and parse a layout file
    static Result<TerrainLayout, Error> load_layout(const std::string& json_path);

    // Parse layout JSON text
    static Result<TerrainLayout, Error> parse_layout(const std::string& json_text);

    // Check the parsed layout (valid shapes, unique ids, positive board size)
    // Returns list of errors, empty if valid
    static std::vector<std::string> validate_layout(const TerrainLayout& layout);

private:
    // Parse helpers (void* avoids exposing nlohmann::json in this header)
    static Result<Shape, Error> parse_shape(const void* shape_json_ptr);
    static Result<TerrainPiece, Error> parse_piece(const void* piece_json_ptr);
    static Result<DeploymentZone, Error> parse_zone(const void* zone_json_ptr);
};

} // namespace sightline::terrain
