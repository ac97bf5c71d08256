#include "planar/systems/collision/sat.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace Collision {

namespace {

struct Interval {
    double min;
    double max;
};

struct Axis {
    Vector origin;
    Vector dir;
};

Interval project(const Polygon& poly, const Axis& axis, double dirMagSquare) {
    Interval range{std::numeric_limits<double>::infinity(), -std::numeric_limits<double>::infinity()};
    for (const auto& p : poly) {
        double const f = (p - axis.origin).dot(axis.dir) / dirMagSquare;
        range.min = std::min(range.min, f);
        range.max = std::max(range.max, f);
    }
    return range;
}

} // namespace

std::optional<Vector> separatingAxisTest(const Polygon& a, const Polygon& b) {
    requireValidPolygon(a, "separatingAxisTest");
    requireValidPolygon(b, "separatingAxisTest");

    bool found = false;
    double bestDepth = std::numeric_limits<double>::infinity();
    Vector best;

    for (const Polygon* poly : {&a, &b}) {
        size_t const n = poly->size();
        for (size_t i = 0; i < n; ++i) {
            Axis const axis{(*poly)[i], (*poly)[(i + 1) % n] - (*poly)[i]};
            double const dirMagSquare = axis.dir.magSquare();
            if (dirMagSquare == 0.0) {
                continue; // repeated vertex
            }

            Interval const ra = project(a, axis, dirMagSquare);
            Interval const rb = project(b, axis, dirMagSquare);
            double const minFactor = std::max(ra.min, rb.min);
            double const maxFactor = std::min(ra.max, rb.max);
            double const overlap = maxFactor - minFactor;
            if (overlap < 0.0) {
                return std::nullopt;
            }

            // compare in world units, the factor scale differs per edge length
            double const depth = overlap * std::sqrt(dirMagSquare);
            if (!found || depth < bestDepth) {
                found = true;
                bestDepth = depth;
                best = (axis.origin + axis.dir * minFactor) - (axis.origin + axis.dir * maxFactor);
            }
        }
    }

    if (!found) {
        // every edge degenerate: the polygons collapse to a single point each
        return std::nullopt;
    }
    return best;
}

} // namespace Collision
