#pragma once

#include <sightline/math/math.hpp>
#include <string>
#include <variant>
#include <vector>
#include <cstdint>

namespace sightline::terrain {

// All measurements in inches from the top-left corner of the board
using Point = math::Vec2;

// Axis-aligned in local space, spanning [0, width] x [0, height] from the piece position
struct Rectangle {
    double width = 0.0;
    double height = 0.0;
};

// Vertices relative to the piece position, implicitly closed
struct Polygon {
    std::vector<Point> points;
};

// Centered on the piece position
struct Circle {
    double radius = 0.0;
};

// Zero-width segment with a blocking thickness; has no interior
struct Wall {
    Point start{0.0};
    Point end{0.0};
    double thickness = 1.0;
};

using Shape = std::variant<Rectangle, Polygon, Circle, Wall>;

enum class Mirror : uint8_t {
    None,
    Horizontal,     // Negate local x
    Vertical        // Negate local y
};

// Terrain piece placed on the board.
// shapes[0] is the footprint a model can stand on; shapes[1..] are walls that always block.
struct TerrainPiece {
    std::string id;
    std::string name;
    std::vector<Shape> shapes;
    Point position{0.0};                // Reference corner; rotation pivots around it
    double rotation_degrees = 0.0;
    Mirror mirror = Mirror::None;       // Applied before rotation
    bool blocking = true;               // Non-blocking pieces are cosmetic
    double height = 0.0;                // Carried for display, not used for occlusion
    std::string category;

    // False when the piece has no shapes or its first shape is a Wall
    bool has_footprint() const noexcept {
        return !shapes.empty() && !std::holds_alternative<Wall>(shapes.front());
    }
};

struct DeploymentZone {
    std::string name;
    std::string player;                 // "attacker" / "defender" (free-form)
    Shape shape = Rectangle{};
    Point position{0.0};
};

struct TerrainLayout {
    std::string id;
    std::string name;
    double board_width = 60.0;
    double board_height = 44.0;
    std::vector<TerrainPiece> pieces;
    std::vector<DeploymentZone> deployment_zones;
};

// "rectangle", "polygon", "circle" or "wall"
const char* shape_type_name(const Shape& shape) noexcept;

const char* mirror_name(Mirror mirror) noexcept;

} // namespace sightline::terrain
