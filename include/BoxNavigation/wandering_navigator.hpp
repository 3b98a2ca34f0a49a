#ifndef WANDERING_NAVIGATOR_HPP_
#define WANDERING_NAVIGATOR_HPP_

#include <memory>
#include <random>
#include <string>
#include "BoxNavigation/navigator.hpp"

/**
 * Navigator that wanders in a directed fashion toward the end goal.
 *
 * Uses the same doorway and target logic as the perfect navigator, but adds
 * uniform noise in [-max_random_deviation, max_random_deviation] to the
 * heading change before deciding between turning and driving. With
 * probability random_action_probability the decision is replaced by a
 * uniformly chosen action. The random engine is owned by the instance and
 * seeded from the parameters, so runs with the same seed are identical.
 */
class WanderingNavigator : public Navigator
{
public:
    WanderingNavigator(std::shared_ptr<const Corridor> corridor,
                       const NavigatorParams& params = NavigatorParams());

    StepResult step(const Pose2D& current_pose) override;

    const NavigatorState& state() const override { return core_.state(); }
    const Corridor& corridor() const override { return core_.corridor(); }
    std::string name() const override { return "wandering"; }

private:
    Action choose_action(double angle_delta, bool forward_blocked);

    NavigatorCore core_;
    std::default_random_engine random_generator_;
    std::uniform_real_distribution<double> deviation_distribution_;
    std::uniform_real_distribution<double> chance_distribution_;
    std::uniform_int_distribution<int> action_distribution_;
};

#endif // WANDERING_NAVIGATOR_HPP_
