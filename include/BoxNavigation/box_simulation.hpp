#ifndef BOX_SIMULATION_HPP_
#define BOX_SIMULATION_HPP_

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "BoxNavigation/engine_bridge.hpp"
#include "BoxNavigation/navigator.hpp"
#include "BoxNavigation/types.hpp"

/**
 * Outcome of a simulation run.
 */
struct SimulationResult
{
    std::vector<TrajectoryPoint> trajectory;  // Initial pose, then one point per accepted step
    NavigatorStatus status;                   // Final navigator status (Running if stopped early)
    int actions_taken;                        // Actions taken by the navigator
    std::map<int, std::string> captures;      // Captured image references keyed by the step they show
    bool aborted;                             // Engine bridge failure ended the run
};

/**
 * Simulation stepping loop.
 *
 * Drives a navigator one action at a time, records the trajectory and stops
 * on a terminal navigator status, on cancellation, or when the optional
 * engine bridge can no longer be reached. Single-threaded: step() and run()
 * must not be called concurrently.
 */
class BoxSimulation
{
public:
    using StepCallback = std::function<void(const TrajectoryPoint&)>;

    /**
     * @param navigator Navigator to drive (exclusively used by this simulation)
     * @param initial_pose Starting pose of the agent
     * @param bridge Optional remote engine mirror
     */
    BoxSimulation(std::shared_ptr<Navigator> navigator,
                  const Pose2D& initial_pose,
                  std::shared_ptr<EngineBridge> bridge = nullptr);

    /**
     * Execute a single navigator step and record the new pose.
     *
     * @return Navigator status after the step
     */
    NavigatorStatus step();

    /**
     * Step until the run finishes.
     *
     * Runs in a tight loop on the calling thread without spinning any
     * executor, so it suits bridges that deliver captures synchronously.
     * With a callback-driven bridge such as TopicEngineBridge, drive step()
     * from a timer on the bridge's node instead, or no capture ever arrives.
     *
     * @param on_step Called with every newly recorded trajectory point
     * @return Final result of the run
     */
    SimulationResult run(const StepCallback& on_step = nullptr);

    // Stop issuing steps; takes effect between two steps
    void cancel() { cancelled_ = true; }

    bool finished() const;
    NavigatorStatus status() const { return navigator_->state().status; }
    const Pose2D& pose() const { return pose_; }
    const std::vector<TrajectoryPoint>& trajectory() const { return trajectory_; }
    const Navigator& navigator() const { return *navigator_; }

    SimulationResult result() const;

private:
    void record(const StepResult& step_result);
    bool mirror(const Pose2D& pose, int step);
    void report() const;

    std::shared_ptr<Navigator> navigator_;
    std::shared_ptr<EngineBridge> bridge_;
    Pose2D pose_;
    std::vector<TrajectoryPoint> trajectory_;
    std::map<int, std::string> captures_;
    int steps_;
    bool mirrored_initial_pose_;
    bool cancelled_;
    bool aborted_;
};

#endif // BOX_SIMULATION_HPP_
