#ifndef BOX_HPP_
#define BOX_HPP_

#include <array>
#include <optional>
#include <vector>
#include "BoxNavigation/types.hpp"

/**
 * Convex region shared by two boxes.
 * The centroid is the doorway point an agent aims at to pass between them.
 */
struct OverlapRegion
{
    std::vector<Point2D> vertices;  // Convex polygon, same winding as the clipping box
    double area;                    // Polygon area (always > 0)
    Point2D centroid;               // Area centroid
};

/**
 * Arbitrarily oriented rectangle describing one walkable segment of a corridor.
 *
 * The box is described by three consecutive corners A, B and C; the fourth
 * corner is D = A + (C - B). A target point inside the box tells the agent
 * where to head once it reaches this box. Boxes are immutable once built.
 */
class Box
{
public:
    /**
     * Build a box from three consecutive corners and a target.
     *
     * @param a First corner (lower left for an axis-aligned box)
     * @param b Second corner, adjacent to a
     * @param c Third corner, adjacent to b
     * @param target Point the agent should aim for while inside this box
     * @param rotation Rotation in radians applied to corners and target about the origin
     * @throws std::invalid_argument if the corners do not form a proper rectangle
     *         or the target lies outside the box
     */
    Box(Point2D a, Point2D b, Point2D c, Point2D target, double rotation = 0.0);

    /**
     * Point-in-rectangle test, boundary included.
     */
    bool contains(const Point2D& point) const;

    /**
     * Compute the region shared with another box.
     *
     * @return The overlap polygon, or std::nullopt when the boxes are disjoint
     *         or only touch along an edge or corner (zero area)
     */
    std::optional<OverlapRegion> overlap_region(const Box& other) const;

    /**
     * Distance an agent can travel from a point inside the box along a heading
     * before leaving it.
     *
     * @param origin Start point, expected inside the box
     * @param heading Direction of travel in radians
     * @return Distance to the boundary, 0 if the origin is already on or past it
     *         heading outward
     */
    double exit_distance(const Point2D& origin, double heading) const;

    std::array<Point2D, 4> corners() const { return {a_, b_, c_, d_}; }
    Point2D center() const;
    Point2D target() const { return target_; }
    double width() const;
    double height() const;
    double area() const { return width() * height(); }
    // Heading of the A->B edge in radians
    double orientation() const;

    // Position in the owning corridor, 0 until a corridor adopts the box
    size_t index() const { return index_; }

private:
    friend class Corridor;

    Point2D a_, b_, c_, d_;
    Point2D target_;
    Point2D ab_, bc_;
    double dot_ab_;
    double dot_bc_;
    size_t index_;
};

/**
 * Create a box aligned with the x and y axes.
 */
Box aligned_box(double left, double right, double lower, double upper,
                Point2D target, double rotation = 0.0);

#endif // BOX_HPP_
