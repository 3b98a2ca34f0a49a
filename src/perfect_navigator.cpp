#include "BoxNavigation/perfect_navigator.hpp"
#include "BoxNavigation/geometry.hpp"
#include "rclcpp/rclcpp.hpp"

PerfectNavigator::PerfectNavigator(std::shared_ptr<const Corridor> corridor,
                                   const NavigatorParams& params)
    : core_(std::move(corridor), params)
{
    RCLCPP_INFO(rclcpp::get_logger("box_navigator"),
        "Perfect navigator initialized: step=%.2f, rotation=%.1fdeg, max_actions=%d",
        params.step_distance, rad_to_deg(params.rotation_limit), params.max_actions);
}

StepResult PerfectNavigator::step(const Pose2D& current_pose)
{
    return core_.step(current_pose, [this](double angle_delta, bool forward_blocked) {
        return core_.correct_action(angle_delta, forward_blocked);
    });
}
