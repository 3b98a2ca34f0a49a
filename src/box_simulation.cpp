#include "BoxNavigation/box_simulation.hpp"
#include <stdexcept>
#include "rclcpp/rclcpp.hpp"

BoxSimulation::BoxSimulation(std::shared_ptr<Navigator> navigator,
                             const Pose2D& initial_pose,
                             std::shared_ptr<EngineBridge> bridge)
    : navigator_(std::move(navigator)),
      bridge_(std::move(bridge)),
      pose_(initial_pose),
      steps_(0),
      mirrored_initial_pose_(false),
      cancelled_(false),
      aborted_(false)
{
    if (!navigator_) {
        throw std::invalid_argument("Simulation requires a navigator");
    }

    trajectory_.push_back({pose_.x, pose_.y, pose_.theta, 0, Action::NONE,
                           navigator_->state().box_index});

    RCLCPP_INFO(rclcpp::get_logger("box_simulation"),
        "Simulation ready: %s navigator, %zu boxes, start=(%.2f, %.2f, %.2frad)%s",
        navigator_->name().c_str(), navigator_->corridor().size(),
        pose_.x, pose_.y, pose_.theta, bridge_ ? ", mirrored to engine" : "");
}

bool BoxSimulation::finished() const
{
    return cancelled_ || aborted_ || is_terminal(this->status());
}

NavigatorStatus BoxSimulation::step()
{
    if (this->finished()) {
        return this->status();
    }

    // Sync the remote engine with the starting pose before the first action
    if (!mirrored_initial_pose_) {
        mirrored_initial_pose_ = true;
        if (!this->mirror(pose_, 0)) {
            return this->status();
        }
    }

    StepResult step_result = navigator_->step(pose_);

    // A step that ends without motion is not an accepted step
    if (step_result.action != Action::NONE) {
        this->record(step_result);
        if (!this->mirror(pose_, steps_)) {
            return step_result.status;
        }
    }

    return step_result.status;
}

SimulationResult BoxSimulation::run(const StepCallback& on_step)
{
    while (!this->finished()) {
        size_t recorded = trajectory_.size();
        this->step();

        if (on_step && trajectory_.size() > recorded) {
            on_step(trajectory_.back());
        }
    }

    this->report();
    return this->result();
}

SimulationResult BoxSimulation::result() const
{
    SimulationResult result;
    result.trajectory = trajectory_;
    result.status = this->status();
    result.actions_taken = navigator_->state().actions_taken;
    result.captures = captures_;
    result.aborted = aborted_;
    return result;
}

void BoxSimulation::record(const StepResult& step_result)
{
    pose_ = step_result.pose;
    ++steps_;
    trajectory_.push_back({pose_.x, pose_.y, pose_.theta, steps_,
                           step_result.action, step_result.box_index});
}

bool BoxSimulation::mirror(const Pose2D& pose, int step)
{
    if (!bridge_) {
        return true;
    }

    if (!bridge_->send_pose(pose, step)) {
        RCLCPP_ERROR(rclcpp::get_logger("box_simulation"),
            "Engine bridge unreachable at step %d, aborting run", step);
        aborted_ = true;
        return false;
    }

    // Captures carry the step they were rendered for, which may lag behind this one
    while (std::optional<EngineCapture> capture = bridge_->try_receive_capture()) {
        captures_[capture->step] = capture->reference;
    }
    return true;
}

void BoxSimulation::report() const
{
    int num_actions = navigator_->state().actions_taken;

    if (this->status() == NavigatorStatus::Reached) {
        RCLCPP_INFO(rclcpp::get_logger("box_simulation"),
            "Simulation complete. Agent reached final target in %d actions.", num_actions);
    } else if (aborted_) {
        RCLCPP_ERROR(rclcpp::get_logger("box_simulation"),
            "Simulation aborted after %d actions.", num_actions);
    } else if (cancelled_ && !is_terminal(this->status())) {
        RCLCPP_INFO(rclcpp::get_logger("box_simulation"),
            "Simulation cancelled after %d actions.", num_actions);
    } else {
        RCLCPP_WARN(rclcpp::get_logger("box_simulation"),
            "Simulation complete. Agent was unable to reach final target within %d actions (%s).",
            num_actions, to_string(this->status()));
    }
}
