#ifndef ENGINE_BRIDGE_HPP_
#define ENGINE_BRIDGE_HPP_

#include <optional>
#include <string>
#include "geometry_msgs/msg/pose2_d.hpp"

/**
 * Image the engine rendered for one mirrored pose.
 */
struct EngineCapture
{
    int step;               // Simulation step of the pose the image was rendered for
    std::string reference;  // Transport-specific reference to the image
};

/**
 * Mirror of the agent inside an external renderer.
 *
 * The simulation pushes every accepted pose outward and polls for image
 * captures the renderer may have produced. Implementations own their
 * transport, timeout and retry policy; the simulation only sees the outcome.
 */
class EngineBridge
{
public:
    virtual ~EngineBridge() = default;

    /**
     * Mirror a pose into the remote engine.
     *
     * @param pose Agent pose
     * @param step Simulation step the pose belongs to
     * @return False if the engine could not be reached within the retry budget
     */
    virtual bool send_pose(const geometry_msgs::msg::Pose2D& pose, int step) = 0;

    /**
     * Next captured image, if one has arrived.
     */
    virtual std::optional<EngineCapture> try_receive_capture() = 0;
};

#endif // ENGINE_BRIDGE_HPP_
