#include "BoxNavigation/corridor.hpp"
#include "BoxNavigation/geometry.hpp"
#include <algorithm>
#include <cmath>
#include "rclcpp/rclcpp.hpp"

namespace
{
constexpr size_t kValuesPerBox = 8;
}

Corridor::Corridor(std::vector<Box> boxes)
    : boxes_(std::move(boxes))
{
    if (boxes_.empty()) {
        throw CorridorInvalid("Corridor needs at least one box");
    }

    for (size_t i = 0; i < boxes_.size(); ++i) {
        boxes_[i].index_ = i;
    }

    // Every consecutive pair must share a doorway
    doorways_.reserve(boxes_.size() - 1);
    for (size_t i = 0; i + 1 < boxes_.size(); ++i) {
        std::optional<OverlapRegion> overlap = boxes_[i].overlap_region(boxes_[i + 1]);
        if (!overlap) {
            throw CorridorInvalid("Boxes " + std::to_string(i) + " and " +
                                  std::to_string(i + 1) + " do not overlap");
        }
        doorways_.push_back(*overlap);
    }

    RCLCPP_INFO(rclcpp::get_logger("box_corridor"),
        "Corridor initialized: %zu boxes, final target=(%.2f, %.2f)",
        boxes_.size(), final_target().x, final_target().y);
}

Corridor Corridor::from_flat_layout(const std::vector<double>& values, double rotation)
{
    if (values.empty() || values.size() % kValuesPerBox != 0) {
        throw std::invalid_argument(
            "Corridor layout needs 8 values per box (ax, ay, bx, by, cx, cy, tx, ty), got " +
            std::to_string(values.size()));
    }

    std::vector<Box> boxes;
    boxes.reserve(values.size() / kValuesPerBox);
    for (size_t i = 0; i < values.size(); i += kValuesPerBox) {
        boxes.emplace_back(
            Point2D{values[i], values[i + 1]},
            Point2D{values[i + 2], values[i + 3]},
            Point2D{values[i + 4], values[i + 5]},
            Point2D{values[i + 6], values[i + 7]},
            rotation);
    }
    return Corridor(std::move(boxes));
}

Point2D Corridor::target_for(size_t box_index) const
{
    if (box_index >= last_index()) {
        return final_target();
    }
    return doorways_[box_index].centroid;
}

bool Corridor::contains(const Point2D& point) const
{
    return contains_from(point, 0);
}

bool Corridor::contains_from(const Point2D& point, size_t first_index) const
{
    for (size_t i = first_index; i < boxes_.size(); ++i) {
        if (boxes_[i].contains(point)) {
            return true;
        }
    }
    return false;
}

double Corridor::free_distance(const Point2D& point, double heading, size_t first_index) const
{
    double distance = 0.0;
    for (size_t i = first_index; i < boxes_.size(); ++i) {
        if (boxes_[i].contains(point)) {
            distance = std::max(distance, boxes_[i].exit_distance(point, heading));
        }
    }
    return distance;
}

std::vector<size_t> Corridor::boxes_containing(const Point2D& point) const
{
    std::vector<size_t> indices;
    for (const auto& box : boxes_) {
        if (box.contains(point)) {
            indices.push_back(box.index());
        }
    }
    return indices;
}

TargetBearing Corridor::bearing_to(const geometry_msgs::msg::Pose2D& pose, const Point2D& target)
{
    TargetBearing bearing;
    bearing.distance = dist({pose.x, pose.y}, target);
    double heading_to_target = std::atan2(target.y - pose.y, target.x - pose.x);
    bearing.angle_delta = normalize_angle(heading_to_target - pose.theta);
    return bearing;
}

std::vector<double> default_corridor_layout()
{
    return {
        -185.0, 1250.0,    420.0, 1250.0,   420.0, -350.0,     10.0, 650.0,
        -1110.0, 775.0,    420.0, 775.0,    420.0, 450.0,    -835.0, 650.0,
        -910.0, 100.0,    -910.0, 775.0,   -750.0, 775.0,    -820.0, 200.0,
    };
}
