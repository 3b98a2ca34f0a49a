#include "BoxNavigation/wandering_navigator.hpp"
#include "BoxNavigation/geometry.hpp"
#include "rclcpp/rclcpp.hpp"

namespace
{
// Actions a random decision can pick from
const Action kRandomActions[] = {Action::FORWARD, Action::ROTATE_LEFT, Action::ROTATE_RIGHT};
}

WanderingNavigator::WanderingNavigator(std::shared_ptr<const Corridor> corridor,
                                       const NavigatorParams& params)
    : core_(std::move(corridor), params),
      random_generator_(params.seed),
      deviation_distribution_(-params.max_random_deviation, params.max_random_deviation),
      chance_distribution_(0.0, 1.0),
      action_distribution_(0, 2)
{
    RCLCPP_INFO(rclcpp::get_logger("box_navigator"),
        "Wandering navigator initialized: step=%.2f, rotation=%.1fdeg, deviation=%.1fdeg, "
        "random_action=%.2f, seed=%u",
        params.step_distance, rad_to_deg(params.rotation_limit),
        rad_to_deg(params.max_random_deviation), params.random_action_probability, params.seed);
}

StepResult WanderingNavigator::step(const Pose2D& current_pose)
{
    return core_.step(current_pose, [this](double angle_delta, bool forward_blocked) {
        return this->choose_action(angle_delta, forward_blocked);
    });
}

Action WanderingNavigator::choose_action(double angle_delta, bool forward_blocked)
{
    const NavigatorParams& params = core_.params();

    // Take a random action some percent of the time
    if (params.random_action_probability > 0.0 &&
        chance_distribution_(random_generator_) < params.random_action_probability) {
        return kRandomActions[action_distribution_(random_generator_)];
    }

    // Zero deviation draws nothing, which keeps this identical to the perfect navigator
    double noise = 0.0;
    if (params.max_random_deviation > 0.0) {
        noise = deviation_distribution_(random_generator_);
    }
    return core_.correct_action(angle_delta + noise, forward_blocked);
}
