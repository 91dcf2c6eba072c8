#pragma once

#include <sightline/math/math.hpp>
#include <cmath>
#include <cstdint>
#include <vector>

namespace sightline::vision {

// Walks a segment at fixed arc-length steps, endpoints included
// Segments shorter than one step are sampled at their two endpoints only
class RaySampler {
public:
    // Number of samples trace() will visit; throws std::invalid_argument on bad input
    // or when the count does not fit in a uint32_t
    static uint32_t sample_count(const math::Vec2& from, const math::Vec2& to, double step);

    // Trace the segment and call visitor for each sample
    // visitor(point, sample_index) -> bool (return false to stop)
    template<typename Visitor>
    static void trace(const math::Vec2& from, const math::Vec2& to, double step, Visitor&& visitor) {
        const uint32_t count = sample_count(from, to, step);
        if (count == 2) {
            if (visitor(from, 0u)) {
                visitor(to, 1u);
            }
            return;
        }

        const uint32_t segments = count - 1;
        const math::Vec2 delta = to - from;
        for (uint32_t i = 0; i <= segments; ++i) {
            // Last sample lands exactly on the target
            math::Vec2 point = i == segments
                ? to
                : from + delta * (static_cast<double>(i) / static_cast<double>(segments));
            if (!visitor(point, i)) {
                return;
            }
        }
    }

    // All sample points along the segment
    static std::vector<math::Vec2> sample_points(const math::Vec2& from, const math::Vec2& to, double step);
};

} // namespace sightline::vision
