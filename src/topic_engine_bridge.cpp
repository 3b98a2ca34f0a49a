#include "BoxNavigation/topic_engine_bridge.hpp"
#include <chrono>
#include <cmath>
#include <stdexcept>

using std::placeholders::_1;

TopicEngineBridge::TopicEngineBridge(rclcpp::Node& node, const BridgeParams& params)
    : node_(node),
      params_(params)
{
    if (params_.timeout <= 0.0 || params_.max_retries <= 0) {
        throw std::invalid_argument("Engine bridge needs a positive timeout and retry count");
    }
    if (params_.max_pending_captures == 0) {
        throw std::invalid_argument("Engine bridge needs room for at least one pending capture");
    }

    pose_pub_ = node_.create_publisher<geometry_msgs::msg::PoseStamped>(params_.pose_topic, 10);
    capture_sub_ = node_.create_subscription<sensor_msgs::msg::Image>(
        params_.capture_topic, 10, std::bind(&TopicEngineBridge::capture_callback, this, _1));

    RCLCPP_INFO(node_.get_logger(), "Engine bridge: poses -> %s, captures <- %s",
        params_.pose_topic.c_str(), params_.capture_topic.c_str());
}

bool TopicEngineBridge::send_pose(const geometry_msgs::msg::Pose2D& pose, int step)
{
    // Wait for the engine side to subscribe before publishing
    for (int attempt = 1; attempt <= params_.max_retries; ++attempt) {
        if (pose_pub_->get_subscription_count() > 0) {
            geometry_msgs::msg::PoseStamped msg;
            msg.header.frame_id = params_.frame_id;
            msg.header.stamp = node_.now();
            msg.pose.position.x = pose.x;
            msg.pose.position.y = pose.y;
            msg.pose.position.z = 0.0;
            msg.pose.orientation.w = std::cos(pose.theta / 2.0);
            msg.pose.orientation.z = std::sin(pose.theta / 2.0);
            pose_pub_->publish(msg);

            // Remember which step this stamp belongs to so echoed captures can be matched
            sent_steps_[rclcpp::Time(msg.header.stamp).nanoseconds()] = step;
            if (sent_steps_.size() > kSentStampHistory) {
                sent_steps_.erase(sent_steps_.begin());
            }
            last_sent_step_ = step;
            return true;
        }

        RCLCPP_WARN(node_.get_logger(), "Step %d: waiting for engine on %s (attempt %d/%d)",
            step, params_.pose_topic.c_str(), attempt, params_.max_retries);
        rclcpp::sleep_for(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::duration<double>(params_.timeout)));
    }

    RCLCPP_ERROR(node_.get_logger(),
        "Received timeout from engine bridge. Check if the engine is running.");
    return false;
}

std::optional<EngineCapture> TopicEngineBridge::try_receive_capture()
{
    if (pending_captures_.empty()) {
        return std::nullopt;
    }
    EngineCapture capture = pending_captures_.front();
    pending_captures_.pop_front();
    return capture;
}

// Queue a reference to every image the engine renders
void TopicEngineBridge::capture_callback(const sensor_msgs::msg::Image::SharedPtr msg)
{
    EngineCapture capture;
    capture.reference = msg->header.frame_id + "/" +
                        std::to_string(msg->header.stamp.sec) + "." +
                        std::to_string(msg->header.stamp.nanosec);

    auto sent = sent_steps_.find(rclcpp::Time(msg->header.stamp).nanoseconds());
    capture.step = sent != sent_steps_.end() ? sent->second : last_sent_step_;

    RCLCPP_DEBUG(node_.get_logger(), "Capture received for step %d: %ux%u %s",
        capture.step, msg->width, msg->height, msg->encoding.c_str());

    pending_captures_.push_back(capture);
    if (pending_captures_.size() > params_.max_pending_captures) {
        pending_captures_.pop_front();
        RCLCPP_WARN_THROTTLE(node_.get_logger(), *node_.get_clock(), 5000,
            "Capture queue full (%zu), dropping oldest capture", params_.max_pending_captures);
    }
}
