#include "BoxNavigation/box.hpp"
#include "BoxNavigation/geometry.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace
{
// Relative slack for boundary tests so rotated targets on an edge stay inside
constexpr double kContainsTolerance = 1e-9;
// Edges are treated as perpendicular below this cosine
constexpr double kPerpendicularTolerance = 1e-6;
// Overlaps smaller than this fraction of the smaller box are contacts, not doorways
constexpr double kMinOverlapFraction = 1e-9;

bool is_finite(const Point2D& p)
{
    return std::isfinite(p.x) && std::isfinite(p.y);
}

std::string describe(const Point2D& p)
{
    std::ostringstream out;
    out << "(" << p.x << ", " << p.y << ")";
    return out.str();
}

// Signed polygon area (positive for counter-clockwise winding)
double signed_area(const std::vector<Point2D>& polygon)
{
    double twice_area = 0.0;
    for (size_t i = 0; i < polygon.size(); ++i) {
        const Point2D& p = polygon[i];
        const Point2D& q = polygon[(i + 1) % polygon.size()];
        twice_area += cross(p, q);
    }
    return twice_area / 2.0;
}

Point2D polygon_centroid(const std::vector<Point2D>& polygon, double area)
{
    double cx = 0.0;
    double cy = 0.0;
    for (size_t i = 0; i < polygon.size(); ++i) {
        const Point2D& p = polygon[i];
        const Point2D& q = polygon[(i + 1) % polygon.size()];
        double c = cross(p, q);
        cx += (p.x + q.x) * c;
        cy += (p.y + q.y) * c;
    }
    return {cx / (6.0 * area), cy / (6.0 * area)};
}

Point2D edge_intersection(const Point2D& prev, const Point2D& cur, double side_prev, double side_cur)
{
    double t = side_prev / (side_prev - side_cur);
    return prev + (cur - prev) * t;
}
}  // namespace

Box::Box(Point2D a, Point2D b, Point2D c, Point2D target, double rotation)
    : a_(a), b_(b), c_(c), d_{0.0, 0.0}, target_(target), index_(0)
{
    if (!is_finite(a) || !is_finite(b) || !is_finite(c) || !is_finite(target) ||
        !std::isfinite(rotation)) {
        throw std::invalid_argument("Box coordinates must be finite");
    }

    // A non-zero rotation turns the whole box around the world origin
    if (rotation != 0.0) {
        a_ = rotate_point(a_, rotation);
        b_ = rotate_point(b_, rotation);
        c_ = rotate_point(c_, rotation);
        target_ = rotate_point(target_, rotation);
    }

    ab_ = b_ - a_;
    bc_ = c_ - b_;
    dot_ab_ = dot(ab_, ab_);
    dot_bc_ = dot(bc_, bc_);
    d_ = a_ + bc_;

    if (dot_ab_ <= 0.0 || dot_bc_ <= 0.0) {
        throw std::invalid_argument("Box has a zero-length edge at " + describe(b_));
    }

    double cosine = dot(ab_, bc_) / std::sqrt(dot_ab_ * dot_bc_);
    if (std::abs(cosine) > kPerpendicularTolerance) {
        throw std::invalid_argument("Box corners " + describe(a_) + ", " + describe(b_) + ", " +
                                    describe(c_) + " do not form a rectangle");
    }

    if (!contains(target_)) {
        throw std::invalid_argument("Box target " + describe(target_) + " lies outside the box");
    }
}

bool Box::contains(const Point2D& point) const
{
    // Project onto both edges: inside iff 0 <= AB.AM <= AB.AB and 0 <= BC.BM <= BC.BC
    double along_ab = dot(ab_, point - a_);
    double along_bc = dot(bc_, point - b_);

    return along_ab >= -kContainsTolerance * dot_ab_ &&
           along_ab <= dot_ab_ * (1.0 + kContainsTolerance) &&
           along_bc >= -kContainsTolerance * dot_bc_ &&
           along_bc <= dot_bc_ * (1.0 + kContainsTolerance);
}

double Box::exit_distance(const Point2D& origin, double heading) const
{
    Point2D direction{std::cos(heading), std::sin(heading)};

    // Position and rate of change in edge-normalized coordinates, both in [0, 1] inside the box
    const double coords[2] = {dot(ab_, origin - a_) / dot_ab_, dot(bc_, origin - b_) / dot_bc_};
    const double rates[2] = {dot(ab_, direction) / dot_ab_, dot(bc_, direction) / dot_bc_};

    // Half the containment slack, so the exit point still passes contains()
    const double slack = kContainsTolerance / 2.0;

    double distance = std::numeric_limits<double>::infinity();
    for (int i = 0; i < 2; ++i) {
        if (rates[i] > 0.0) {
            distance = std::min(distance, (1.0 + slack - coords[i]) / rates[i]);
        } else if (rates[i] < 0.0) {
            distance = std::min(distance, (coords[i] + slack) / -rates[i]);
        }
    }
    return std::max(distance, 0.0);
}

std::optional<OverlapRegion> Box::overlap_region(const Box& other) const
{
    // Sutherland-Hodgman: clip this rectangle against each edge of the other one
    std::vector<Point2D> clipped = {a_, b_, c_, d_};
    std::array<Point2D, 4> window = other.corners();
    double winding = cross(other.ab_, other.bc_) > 0.0 ? 1.0 : -1.0;

    for (size_t i = 0; i < window.size() && !clipped.empty(); ++i) {
        const Point2D& edge_start = window[i];
        Point2D edge = window[(i + 1) % window.size()] - edge_start;

        std::vector<Point2D> input;
        input.swap(clipped);

        for (size_t j = 0; j < input.size(); ++j) {
            const Point2D& cur = input[j];
            const Point2D& prev = input[(j + input.size() - 1) % input.size()];
            double side_cur = winding * cross(edge, cur - edge_start);
            double side_prev = winding * cross(edge, prev - edge_start);

            if (side_cur >= 0.0) {
                if (side_prev < 0.0) {
                    clipped.push_back(edge_intersection(prev, cur, side_prev, side_cur));
                }
                clipped.push_back(cur);
            } else if (side_prev >= 0.0) {
                clipped.push_back(edge_intersection(prev, cur, side_prev, side_cur));
            }
        }
    }

    if (clipped.size() < 3) {
        return std::nullopt;
    }

    double area = signed_area(clipped);
    if (std::abs(area) <= kMinOverlapFraction * std::min(this->area(), other.area())) {
        return std::nullopt;
    }

    OverlapRegion region;
    region.centroid = polygon_centroid(clipped, area);
    region.area = std::abs(area);
    region.vertices = std::move(clipped);
    return region;
}

Point2D Box::center() const
{
    return {(a_.x + c_.x) / 2.0, (a_.y + c_.y) / 2.0};
}

double Box::width() const
{
    return std::sqrt(dot_bc_);
}

double Box::height() const
{
    return std::sqrt(dot_ab_);
}

double Box::orientation() const
{
    return std::atan2(ab_.y, ab_.x);
}

Box aligned_box(double left, double right, double lower, double upper,
                Point2D target, double rotation)
{
    return Box({left, lower}, {left, upper}, {right, upper}, target, rotation);
}
