#ifndef NAVIGATOR_HPP_
#define NAVIGATOR_HPP_

#include <cmath>
#include <functional>
#include <memory>
#include <string>
#include "BoxNavigation/corridor.hpp"
#include "BoxNavigation/types.hpp"
#include "geometry_msgs/msg/pose2_d.hpp"
#include "geometry_msgs/msg/twist.hpp"

using geometry_msgs::msg::Pose2D;
using geometry_msgs::msg::Twist;

/**
 * Outcome of a navigator. Every value except Running is terminal.
 */
enum class NavigatorStatus {
    Running,
    Reached,              // In the last box, within tolerance of its target
    OutOfBounds,          // Outside every remaining box
    ActionLimitExceeded   // Action budget spent before reaching the target
};

const char* to_string(NavigatorStatus status);

inline bool is_terminal(NavigatorStatus status)
{
    return status != NavigatorStatus::Running;
}

/**
 * Navigator configuration shared by every navigator kind.
 */
struct NavigatorParams
{
    double step_distance;              // Forward translation per action
    double rotation_limit;             // Rotation per action (radians)
    double max_random_deviation;       // Heading noise bound, wandering only (radians)
    double random_action_probability;  // Chance of a uniformly random action, wandering only
    double target_tolerance;           // Distance at which the final target counts as reached
    int max_actions;                   // Action budget
    unsigned int seed;                 // Random seed, wandering only

    NavigatorParams()
        : step_distance(0.1),
          rotation_limit(10.0 * M_PI / 180.0),
          max_random_deviation(0.0),
          random_action_probability(0.0),
          target_tolerance(0.1),
          max_actions(500),
          seed(0)
    {}

    /**
     * @throws std::invalid_argument on a non-positive step distance, rotation
     *         limit, tolerance or action budget, a negative deviation, or a
     *         probability outside [0, 1]
     */
    void validate() const;
};

/**
 * Mutable navigation state, exclusively owned by one navigator.
 */
struct NavigatorState
{
    Pose2D pose;
    size_t box_index = 0;
    int actions_taken = 0;
    NavigatorStatus status = NavigatorStatus::Running;
};

/**
 * Result of a single navigator step.
 */
struct StepResult
{
    Pose2D pose;                  // Pose after the step
    Action action;                // Action actually taken (NONE if the agent did not move)
    Action correct_action;        // Action the perfect policy takes from the incoming pose
    Twist command;                // linear.x = distance translated, angular.z = rotation applied
    size_t box_index;             // Box the agent is considered in after the step
    NavigatorStatus status;
};

/**
 * Decides the next motion action of an agent walking a corridor.
 */
class Navigator
{
public:
    virtual ~Navigator() = default;

    /**
     * Advance the agent by one action.
     * Once the status is terminal, further calls are no-ops that return the
     * terminal status and the unchanged pose.
     *
     * @param current_pose Agent pose before the step
     * @return Pose after the step, actions and status
     */
    virtual StepResult step(const Pose2D& current_pose) = 0;

    virtual const NavigatorState& state() const = 0;
    virtual const Corridor& corridor() const = 0;
    virtual std::string name() const = 0;
};

/**
 * Shared corridor-following machinery used by every navigator kind.
 *
 * Holds the navigator state and executes one step given a policy that picks
 * the action from the ideal heading change and whether driving forward is
 * blocked by the corridor boundary. The policy is only consulted when an
 * action is actually taken. Forward moves are clipped so the agent never
 * leaves the boxes it is standing in.
 */
class NavigatorCore
{
public:
    using ActionPolicy = std::function<Action(double angle_delta, bool forward_blocked)>;

    NavigatorCore(std::shared_ptr<const Corridor> corridor, const NavigatorParams& params);

    StepResult step(const Pose2D& current_pose, const ActionPolicy& policy);

    /**
     * Action the perfect policy takes for a heading change.
     * When the heading points out of the corridor the agent turns toward the
     * target instead of driving.
     */
    Action correct_action(double angle_delta, bool forward_blocked = false) const;

    const NavigatorState& state() const { return state_; }
    const Corridor& corridor() const { return *corridor_; }
    const NavigatorParams& params() const { return params_; }

private:
    // Terminal status for a pose, or Running
    NavigatorStatus evaluate(const Pose2D& pose) const;
    StepResult finish(const Pose2D& pose, Action action, Action correct, const Twist& command,
                      NavigatorStatus status);

    std::shared_ptr<const Corridor> corridor_;
    NavigatorParams params_;
    NavigatorState state_;
};

/**
 * Create a navigator by kind name: "perfect" or "wandering".
 *
 * @throws std::invalid_argument for an unknown kind or invalid parameters
 */
std::unique_ptr<Navigator> make_navigator(
    const std::string& kind,
    std::shared_ptr<const Corridor> corridor,
    const NavigatorParams& params = NavigatorParams());

#endif // NAVIGATOR_HPP_
