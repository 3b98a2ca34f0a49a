#ifndef PERFECT_NAVIGATOR_HPP_
#define PERFECT_NAVIGATOR_HPP_

#include <memory>
#include <string>
#include "BoxNavigation/navigator.hpp"

/**
 * Deterministic navigator that always takes the correct action.
 *
 * While not in the final box it heads for the doorway into the next box,
 * then for the final target. It turns by the rotation limit whenever the
 * target lies further off its heading than that limit, and drives forward
 * otherwise.
 */
class PerfectNavigator : public Navigator
{
public:
    PerfectNavigator(std::shared_ptr<const Corridor> corridor,
                     const NavigatorParams& params = NavigatorParams());

    StepResult step(const Pose2D& current_pose) override;

    const NavigatorState& state() const override { return core_.state(); }
    const Corridor& corridor() const override { return core_.corridor(); }
    std::string name() const override { return "perfect"; }

private:
    NavigatorCore core_;
};

#endif // PERFECT_NAVIGATOR_HPP_
