#ifndef CORRIDOR_HPP_
#define CORRIDOR_HPP_

#include <stdexcept>
#include <string>
#include <vector>
#include "BoxNavigation/box.hpp"
#include "BoxNavigation/types.hpp"
#include "geometry_msgs/msg/pose2_d.hpp"

/**
 * Raised when a corridor cannot be built: no boxes, or two consecutive
 * boxes without a shared doorway.
 */
class CorridorInvalid : public std::runtime_error
{
public:
    explicit CorridorInvalid(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Distance and signed heading change from a pose to a target point.
 */
struct TargetBearing
{
    double distance;     // Euclidean distance to the target
    double angle_delta;  // Heading change required to face the target, in [-pi, pi]
};

/**
 * Ordered, overlap-validated sequence of boxes.
 *
 * Insertion order is traversal order. Every pair of consecutive boxes must
 * share a region of non-zero area (the doorway). The corridor is validated
 * once at construction and is read-only afterwards, so a single instance can
 * be shared by any number of navigators.
 */
class Corridor
{
public:
    /**
     * Build and validate a corridor.
     *
     * @param boxes Boxes in traversal order
     * @throws CorridorInvalid if boxes is empty or two consecutive boxes do not overlap
     */
    explicit Corridor(std::vector<Box> boxes);

    /**
     * Build a corridor from a flat list of 8 values per box:
     * ax, ay, bx, by, cx, cy, tx, ty.
     *
     * @param values Flat corner/target list
     * @param rotation Rotation in radians applied to every box about the origin
     * @throws std::invalid_argument if the list length is not a multiple of 8 or a box is malformed
     * @throws CorridorInvalid if the resulting corridor is invalid
     */
    static Corridor from_flat_layout(const std::vector<double>& values, double rotation = 0.0);

    size_t size() const { return boxes_.size(); }
    const Box& box(size_t index) const { return boxes_.at(index); }
    const std::vector<Box>& boxes() const { return boxes_; }
    size_t last_index() const { return boxes_.size() - 1; }

    // Overlap between box index and box index + 1
    const OverlapRegion& doorway(size_t index) const { return doorways_.at(index); }

    /**
     * Point an agent in the given box should head for: the doorway centroid
     * towards the next box, or the final target when in the last box.
     */
    Point2D target_for(size_t box_index) const;

    Point2D final_target() const { return boxes_.back().target(); }

    // Is the point inside any box of the corridor
    bool contains(const Point2D& point) const;

    // Is the point inside any box at or after first_index
    bool contains_from(const Point2D& point, size_t first_index) const;

    /**
     * Distance the agent can travel along a heading without leaving the boxes
     * at or after first_index that contain its start point.
     *
     * @return Largest exit distance over those boxes, 0 if none contains the point
     */
    double free_distance(const Point2D& point, double heading, size_t first_index) const;

    // Indices of every box containing the point, ascending
    std::vector<size_t> boxes_containing(const Point2D& point) const;

    /**
     * Distance to a target and the signed heading change needed to face it.
     * Positive angle_delta means a left (counter-clockwise) turn.
     */
    static TargetBearing bearing_to(const geometry_msgs::msg::Pose2D& pose, const Point2D& target);

private:
    std::vector<Box> boxes_;
    std::vector<OverlapRegion> doorways_;
};

/**
 * Three-box route through the reference building (units: centimetres).
 */
std::vector<double> default_corridor_layout();

#endif // CORRIDOR_HPP_
