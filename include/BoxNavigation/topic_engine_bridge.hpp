#ifndef TOPIC_ENGINE_BRIDGE_HPP_
#define TOPIC_ENGINE_BRIDGE_HPP_

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include "BoxNavigation/engine_bridge.hpp"
#include "rclcpp/rclcpp.hpp"
#include "geometry_msgs/msg/pose_stamped.hpp"
#include "sensor_msgs/msg/image.hpp"

/**
 * Engine bridge over ROS 2 topics.
 *
 * Poses go out as PoseStamped once the remote engine has subscribed; each
 * Image the engine publishes back is queued as a capture reference of the
 * form "<frame_id>/<sec>.<nanosec>". An engine that stamps the image with the
 * pose stamp gets it attributed to that pose's step; any other image goes to
 * the most recently sent step. The queue keeps at most max_pending_captures
 * entries, oldest dropped first.
 *
 * Callbacks run on the owning node's executor, so captures only arrive while
 * that executor spins, and the bridge must be used from its thread.
 */
class TopicEngineBridge : public EngineBridge
{
public:
    struct BridgeParams
    {
        std::string pose_topic;     // Outgoing agent pose
        std::string capture_topic;  // Incoming rendered images
        std::string frame_id;       // Frame of the published poses
        double timeout;             // Wait per attempt for the engine to subscribe (seconds)
        int max_retries;            // Attempts before the engine is declared unreachable
        size_t max_pending_captures;  // Captures kept while nobody polls

        BridgeParams()
            : pose_topic("/engine/agent_pose"),
              capture_topic("/engine/capture"),
              frame_id("map"),
              timeout(1.0),
              max_retries(3),
              max_pending_captures(10)
        {}
    };

    TopicEngineBridge(rclcpp::Node& node, const BridgeParams& params = BridgeParams());

    bool send_pose(const geometry_msgs::msg::Pose2D& pose, int step) override;
    std::optional<EngineCapture> try_receive_capture() override;

private:
    void capture_callback(const sensor_msgs::msg::Image::SharedPtr msg);

    rclcpp::Node& node_;
    BridgeParams params_;
    rclcpp::Publisher<geometry_msgs::msg::PoseStamped>::SharedPtr pose_pub_;
    rclcpp::Subscription<sensor_msgs::msg::Image>::SharedPtr capture_sub_;
    // Stamps of recently published poses (nanoseconds) mapped to their step
    static constexpr size_t kSentStampHistory = 64;

    std::deque<EngineCapture> pending_captures_;
    std::map<int64_t, int> sent_steps_;
    int last_sent_step_ = 0;
};

#endif // TOPIC_ENGINE_BRIDGE_HPP_
