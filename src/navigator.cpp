#include "BoxNavigation/navigator.hpp"
#include "BoxNavigation/geometry.hpp"
#include "BoxNavigation/perfect_navigator.hpp"
#include "BoxNavigation/wandering_navigator.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include "rclcpp/rclcpp.hpp"

namespace
{
// Forward room below this fraction of a step counts as facing a wall
constexpr double kBlockedFraction = 1e-6;
}

const char* to_string(NavigatorStatus status)
{
    switch (status) {
        case NavigatorStatus::Running: return "Running";
        case NavigatorStatus::Reached: return "Reached";
        case NavigatorStatus::OutOfBounds: return "OutOfBounds";
        case NavigatorStatus::ActionLimitExceeded: return "ActionLimitExceeded";
    }
    return "Unknown";
}

const char* to_string(Action action)
{
    switch (action) {
        case Action::NONE: return "NONE";
        case Action::FORWARD: return "FORWARD";
        case Action::ROTATE_LEFT: return "ROTATE_LEFT";
        case Action::ROTATE_RIGHT: return "ROTATE_RIGHT";
    }
    return "UNKNOWN";
}

void NavigatorParams::validate() const
{
    if (!(step_distance > 0.0) || !std::isfinite(step_distance)) {
        throw std::invalid_argument("step_distance must be positive");
    }
    if (!(rotation_limit > 0.0) || rotation_limit > M_PI) {
        throw std::invalid_argument("rotation_limit must be in (0, pi]");
    }
    if (!(max_random_deviation >= 0.0) || !std::isfinite(max_random_deviation)) {
        throw std::invalid_argument("max_random_deviation must be non-negative");
    }
    if (!(random_action_probability >= 0.0 && random_action_probability <= 1.0)) {
        throw std::invalid_argument("random_action_probability must be in [0, 1]");
    }
    if (!(target_tolerance > 0.0) || !std::isfinite(target_tolerance)) {
        throw std::invalid_argument("target_tolerance must be positive");
    }
    if (max_actions <= 0) {
        throw std::invalid_argument("max_actions must be positive");
    }
}

NavigatorCore::NavigatorCore(std::shared_ptr<const Corridor> corridor, const NavigatorParams& params)
    : corridor_(std::move(corridor)),
      params_(params)
{
    if (!corridor_) {
        throw std::invalid_argument("Navigator requires a corridor");
    }
    params_.validate();
}

Action NavigatorCore::correct_action(double angle_delta, bool forward_blocked) const
{
    // Already facing the target closely enough: drive
    if (!forward_blocked && std::abs(angle_delta) <= params_.rotation_limit) {
        return Action::FORWARD;
    }
    // Positive delta is a counter-clockwise (left) turn
    return angle_delta > 0.0 ? Action::ROTATE_LEFT : Action::ROTATE_RIGHT;
}

NavigatorStatus NavigatorCore::evaluate(const Pose2D& pose) const
{
    Point2D position{pose.x, pose.y};

    if (!corridor_->contains_from(position, state_.box_index)) {
        return NavigatorStatus::OutOfBounds;
    }

    if (state_.box_index == corridor_->last_index() &&
        dist(position, corridor_->final_target()) <= params_.target_tolerance) {
        return NavigatorStatus::Reached;
    }

    return NavigatorStatus::Running;
}

StepResult NavigatorCore::step(const Pose2D& current_pose, const ActionPolicy& policy)
{
    Twist command;

    if (is_terminal(state_.status)) {
        RCLCPP_WARN(rclcpp::get_logger("box_navigator"),
            "Navigator already finished (%s), step ignored", to_string(state_.status));
        return StepResult{state_.pose, Action::NONE, Action::NONE, command,
                          state_.box_index, state_.status};
    }

    if (!std::isfinite(current_pose.x) || !std::isfinite(current_pose.y) ||
        !std::isfinite(current_pose.theta)) {
        throw std::invalid_argument("Navigator pose must be finite");
    }

    TargetBearing bearing = Corridor::bearing_to(
        current_pose, corridor_->target_for(state_.box_index));
    Point2D position{current_pose.x, current_pose.y};
    double free_distance = corridor_->free_distance(position, current_pose.theta, state_.box_index);
    bool forward_blocked = free_distance <= kBlockedFraction * params_.step_distance;
    Action correct = this->correct_action(bearing.angle_delta, forward_blocked);

    // The incoming pose may already be terminal
    NavigatorStatus status = this->evaluate(current_pose);
    if (status == NavigatorStatus::Running && state_.actions_taken >= params_.max_actions) {
        status = NavigatorStatus::ActionLimitExceeded;
    }
    if (is_terminal(status)) {
        return this->finish(current_pose, Action::NONE, correct, command, status);
    }

    Action action = policy(bearing.angle_delta, forward_blocked);
    Pose2D next = current_pose;

    // Rotation and translation are exclusive within one action
    switch (action) {
        case Action::FORWARD: {
            // Stop at the target or at the corridor boundary, whichever comes first
            double distance = std::min({params_.step_distance, bearing.distance, free_distance});
            next.x += distance * std::cos(current_pose.theta);
            next.y += distance * std::sin(current_pose.theta);
            command.linear.x = distance;
            break;
        }
        case Action::ROTATE_LEFT:
            next.theta = normalize_angle(current_pose.theta + params_.rotation_limit);
            command.angular.z = params_.rotation_limit;
            break;
        case Action::ROTATE_RIGHT:
            next.theta = normalize_angle(current_pose.theta - params_.rotation_limit);
            command.angular.z = -params_.rotation_limit;
            break;
        case Action::NONE:
            break;
    }
    ++state_.actions_taken;

    // Advance at most one box per step, even if the agent is already further along
    if (state_.box_index < corridor_->last_index() &&
        corridor_->box(state_.box_index + 1).contains({next.x, next.y})) {
        ++state_.box_index;
        RCLCPP_DEBUG(rclcpp::get_logger("box_navigator"),
            "Entered box %zu after %d actions", state_.box_index, state_.actions_taken);
    }

    return this->finish(next, action, correct, command, this->evaluate(next));
}

StepResult NavigatorCore::finish(const Pose2D& pose, Action action, Action correct,
                                 const Twist& command, NavigatorStatus status)
{
    state_.pose = pose;
    state_.status = status;

    if (status == NavigatorStatus::Reached) {
        RCLCPP_INFO(rclcpp::get_logger("box_navigator"),
            "Final target reached in %d actions at (%.2f, %.2f)",
            state_.actions_taken, pose.x, pose.y);
    } else if (is_terminal(status)) {
        RCLCPP_WARN(rclcpp::get_logger("box_navigator"),
            "Navigation stopped: %s after %d actions at (%.2f, %.2f), box %zu",
            to_string(status), state_.actions_taken, pose.x, pose.y, state_.box_index);
    }

    return StepResult{pose, action, correct, command, state_.box_index, status};
}

std::unique_ptr<Navigator> make_navigator(
    const std::string& kind,
    std::shared_ptr<const Corridor> corridor,
    const NavigatorParams& params)
{
    if (kind == "perfect") {
        return std::make_unique<PerfectNavigator>(std::move(corridor), params);
    }
    if (kind == "wandering") {
        return std::make_unique<WanderingNavigator>(std::move(corridor), params);
    }
    throw std::invalid_argument(
        "Invalid navigator type: " + kind + ". Possible options: perfect|wandering");
}
