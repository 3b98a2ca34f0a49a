#ifndef BOX_NAV_TYPES_HPP_
#define BOX_NAV_TYPES_HPP_

#include <cstddef>

/**
 * Basic 2D point structure for representing positions in space.
 * Used throughout the navigation system for box corners, targets and doorways.
 */
struct Point2D {
    double x;  // X coordinate (left/right)
    double y;  // Y coordinate (up/down)
};

/**
 * Discrete motion primitives available to a navigator.
 * NONE is reported when a step ends without moving the agent.
 */
enum class Action {
    NONE,
    FORWARD,
    ROTATE_LEFT,
    ROTATE_RIGHT
};

/**
 * Recorded trajectory point.
 * One point per accepted simulation step, step 0 being the initial pose.
 */
struct TrajectoryPoint {
    double x;            // X coordinate
    double y;            // Y coordinate
    double theta;        // Heading in radians
    int step;            // Step index from simulation start
    Action action;       // Action that produced this pose
    size_t box_index;    // Corridor box the agent is considered in
};

const char* to_string(Action action);

#endif // BOX_NAV_TYPES_HPP_
