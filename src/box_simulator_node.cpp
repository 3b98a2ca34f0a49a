/**
 * Box Corridor Simulator Node
 *
 * Runs a navigator through a corridor of overlapping boxes:
 * 1. Builds the corridor from the box layout parameter
 * 2. Creates the perfect or wandering navigator
 * 3. Advances one simulation step per timer tick
 * 4. Publishes pose, trajectory and corridor markers, optionally mirroring
 *    the agent into a remote engine
 */

#include "rclcpp/rclcpp.hpp"
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <cmath>

#include "geometry_msgs/msg/pose_stamped.hpp"
#include "nav_msgs/msg/path.hpp"
#include "visualization_msgs/msg/marker.hpp"
#include "visualization_msgs/msg/marker_array.hpp"

#include "BoxNavigation/types.hpp"
#include "BoxNavigation/geometry.hpp"
#include "BoxNavigation/corridor.hpp"
#include "BoxNavigation/navigator.hpp"
#include "BoxNavigation/box_simulation.hpp"
#include "BoxNavigation/topic_engine_bridge.hpp"

using namespace std::chrono_literals;

class BoxSimulatorNode : public rclcpp::Node
{
public:
    BoxSimulatorNode() : Node("box_simulator")
    {
        // Declare ROS parameters (defaults match the reference route, in centimetres)
        this->declare_parameter<std::string>("navigator", "perfect");
        this->declare_parameter<std::vector<double>>("boxes", default_corridor_layout());
        this->declare_parameter<double>("corridor_rotation_deg", 0.0);
        this->declare_parameter<double>("initial_x", 0.0);
        this->declare_parameter<double>("initial_y", 0.0);
        this->declare_parameter<double>("initial_heading_deg", 90.0);
        this->declare_parameter<double>("step_distance", 50.0);
        this->declare_parameter<double>("rotation_limit_deg", 5.0);
        this->declare_parameter<double>("max_random_deviation_deg", 15.0);
        this->declare_parameter<double>("random_action_probability", 0.0);
        this->declare_parameter<double>("target_tolerance", 50.0);
        this->declare_parameter<int>("max_actions", 200);
        this->declare_parameter<int>("seed", 0);
        this->declare_parameter<double>("step_frequency", 10.0);
        this->declare_parameter<std::string>("frame_id", "map");
        this->declare_parameter<bool>("mirror_to_engine", false);
        this->declare_parameter<std::string>("engine_pose_topic", "/engine/agent_pose");
        this->declare_parameter<std::string>("engine_capture_topic", "/engine/capture");
        this->declare_parameter<double>("engine_timeout", 1.0);
        this->declare_parameter<int>("engine_max_retries", 3);
        this->declare_parameter<int>("engine_max_pending_captures", 10);

        std::string navigator_kind = this->get_parameter("navigator").as_string();
        std::vector<double> layout = this->get_parameter("boxes").as_double_array();
        double corridor_rotation = deg_to_rad(this->get_parameter("corridor_rotation_deg").as_double());
        double step_frequency = this->get_parameter("step_frequency").as_double();
        frame_id_ = this->get_parameter("frame_id").as_string();

        NavigatorParams params;
        params.step_distance = this->get_parameter("step_distance").as_double();
        params.rotation_limit = deg_to_rad(this->get_parameter("rotation_limit_deg").as_double());
        params.max_random_deviation =
            deg_to_rad(this->get_parameter("max_random_deviation_deg").as_double());
        params.random_action_probability = this->get_parameter("random_action_probability").as_double();
        params.target_tolerance = this->get_parameter("target_tolerance").as_double();
        params.max_actions = static_cast<int>(this->get_parameter("max_actions").as_int());
        params.seed = static_cast<unsigned int>(this->get_parameter("seed").as_int());

        Pose2D initial_pose;
        initial_pose.x = this->get_parameter("initial_x").as_double();
        initial_pose.y = this->get_parameter("initial_y").as_double();
        initial_pose.theta = deg_to_rad(this->get_parameter("initial_heading_deg").as_double());

        RCLCPP_INFO(this->get_logger(), "===========================================");
        RCLCPP_INFO(this->get_logger(), "  Box Corridor Simulator");
        RCLCPP_INFO(this->get_logger(), "===========================================");
        RCLCPP_INFO(this->get_logger(), "Navigator: %s", navigator_kind.c_str());
        RCLCPP_INFO(this->get_logger(), "Max actions: %d", params.max_actions);

        if (step_frequency <= 0.0) {
            RCLCPP_ERROR(this->get_logger(), "step_frequency must be positive!");
            rclcpp::shutdown();
            return;
        }

        // Corridor and navigator fail fast on bad geometry or configuration
        std::shared_ptr<Navigator> navigator;
        try {
            corridor_ = std::make_shared<const Corridor>(
                Corridor::from_flat_layout(layout, corridor_rotation));
            navigator = make_navigator(navigator_kind, corridor_, params);
        } catch (const CorridorInvalid& e) {
            RCLCPP_ERROR(this->get_logger(), "Invalid corridor: %s", e.what());
            rclcpp::shutdown();
            return;
        } catch (const std::invalid_argument& e) {
            RCLCPP_ERROR(this->get_logger(), "Invalid configuration: %s", e.what());
            rclcpp::shutdown();
            return;
        }

        std::shared_ptr<EngineBridge> bridge;
        if (this->get_parameter("mirror_to_engine").as_bool()) {
            TopicEngineBridge::BridgeParams bridge_params;
            bridge_params.pose_topic = this->get_parameter("engine_pose_topic").as_string();
            bridge_params.capture_topic = this->get_parameter("engine_capture_topic").as_string();
            bridge_params.frame_id = frame_id_;
            bridge_params.timeout = this->get_parameter("engine_timeout").as_double();
            bridge_params.max_retries = static_cast<int>(this->get_parameter("engine_max_retries").as_int());
            int64_t max_pending = this->get_parameter("engine_max_pending_captures").as_int();
            bridge_params.max_pending_captures = max_pending > 0 ? static_cast<size_t>(max_pending) : 0;
            try {
                bridge = std::make_shared<TopicEngineBridge>(*this, bridge_params);
            } catch (const std::invalid_argument& e) {
                RCLCPP_ERROR(this->get_logger(), "Invalid engine bridge: %s", e.what());
                rclcpp::shutdown();
                return;
            }
        }

        simulation_ = std::make_unique<BoxSimulation>(navigator, initial_pose, bridge);

        // Setup ROS publishers
        pose_pub_ = this->create_publisher<geometry_msgs::msg::PoseStamped>("/box_sim/pose", 10);
        path_pub_ = this->create_publisher<nav_msgs::msg::Path>("/box_sim/trajectory", 10);
        corridor_marker_pub_ = this->create_publisher<visualization_msgs::msg::MarkerArray>(
            "/box_sim/corridor", 10);

        path_.header.frame_id = frame_id_;
        this->append_to_path(simulation_->trajectory().front());

        auto step_period = std::chrono::duration<double>(1.0 / step_frequency);
        timer_ = this->create_wall_timer(
            step_period, std::bind(&BoxSimulatorNode::simulation_loop, this));

        corridor_marker_timer_ = this->create_wall_timer(
            1s, std::bind(&BoxSimulatorNode::publish_corridor_markers, this));

        RCLCPP_INFO(this->get_logger(), "Ready! Stepping at %.1f Hz", step_frequency);
    }

private:
    // Advance one action per tick
    void simulation_loop()
    {
        if (!simulation_) return;

        size_t recorded = simulation_->trajectory().size();
        NavigatorStatus status = simulation_->step();

        if (simulation_->trajectory().size() > recorded) {
            this->append_to_path(simulation_->trajectory().back());
            pose_pub_->publish(path_.poses.back());
            path_pub_->publish(path_);
        }

        if (simulation_->finished()) {
            SimulationResult result = simulation_->result();
            if (status == NavigatorStatus::Reached) {
                RCLCPP_INFO(this->get_logger(), "Goal reached in %d actions!", result.actions_taken);
            } else {
                RCLCPP_WARN(this->get_logger(), "Stopped: %s after %d actions%s",
                    to_string(status), result.actions_taken, result.aborted ? " (engine lost)" : "");
            }
            if (!result.captures.empty()) {
                RCLCPP_INFO(this->get_logger(), "Captured %zu images", result.captures.size());
            }
            timer_->cancel();
        }
    }

    void append_to_path(const TrajectoryPoint& point)
    {
        geometry_msgs::msg::PoseStamped pose;
        pose.header.frame_id = frame_id_;
        pose.header.stamp = this->now();
        pose.pose.position.x = point.x;
        pose.pose.position.y = point.y;
        pose.pose.position.z = 0.0;
        pose.pose.orientation.w = std::cos(point.theta / 2.0);
        pose.pose.orientation.z = std::sin(point.theta / 2.0);

        path_.header.stamp = pose.header.stamp;
        path_.poses.push_back(pose);
    }

    // Publish boxes, doorways and targets for RViz visualization
    void publish_corridor_markers()
    {
        if (!corridor_) return;

        visualization_msgs::msg::MarkerArray marker_array;
        int id = 0;

        for (const auto& box : corridor_->boxes()) {
            visualization_msgs::msg::Marker marker;
            marker.header.frame_id = frame_id_;
            marker.header.stamp = this->now();
            marker.ns = "corridor_boxes";
            marker.id = id++;
            marker.type = visualization_msgs::msg::Marker::CUBE;
            marker.action = visualization_msgs::msg::Marker::ADD;
            marker.lifetime = rclcpp::Duration(0, 0);

            Point2D center = box.center();
            marker.pose.position.x = center.x;
            marker.pose.position.y = center.y;
            marker.pose.position.z = 0.0;

            // Marker x axis runs along the B->C edge
            double yaw = box.orientation() - M_PI / 2.0;
            marker.pose.orientation.w = std::cos(yaw / 2.0);
            marker.pose.orientation.z = std::sin(yaw / 2.0);

            marker.scale.x = box.width();
            marker.scale.y = box.height();
            marker.scale.z = 1.0;
            marker.color.r = 0.2;
            marker.color.g = 0.4;
            marker.color.b = 1.0;
            marker.color.a = 0.3;
            marker_array.markers.push_back(marker);
        }

        visualization_msgs::msg::Marker targets;
        targets.header.frame_id = frame_id_;
        targets.header.stamp = this->now();
        targets.ns = "corridor_targets";
        targets.id = id++;
        targets.type = visualization_msgs::msg::Marker::SPHERE_LIST;
        targets.action = visualization_msgs::msg::Marker::ADD;
        double marker_size = std::max(corridor_->box(0).width(), corridor_->box(0).height()) * 0.05;
        targets.scale.x = marker_size;
        targets.scale.y = marker_size;
        targets.scale.z = marker_size;
        targets.color.r = 0.0;
        targets.color.g = 1.0;
        targets.color.b = 0.0;
        targets.color.a = 0.9;

        for (size_t i = 0; i < corridor_->size(); ++i) {
            Point2D target = corridor_->target_for(i);
            geometry_msgs::msg::Point p;
            p.x = target.x;
            p.y = target.y;
            p.z = 0.0;
            targets.points.push_back(p);
        }
        marker_array.markers.push_back(targets);

        corridor_marker_pub_->publish(marker_array);
    }

    // Member variables
    std::shared_ptr<const Corridor> corridor_;
    std::unique_ptr<BoxSimulation> simulation_;
    nav_msgs::msg::Path path_;
    std::string frame_id_;

    rclcpp::Publisher<geometry_msgs::msg::PoseStamped>::SharedPtr pose_pub_;
    rclcpp::Publisher<nav_msgs::msg::Path>::SharedPtr path_pub_;
    rclcpp::Publisher<visualization_msgs::msg::MarkerArray>::SharedPtr corridor_marker_pub_;
    rclcpp::TimerBase::SharedPtr timer_;
    rclcpp::TimerBase::SharedPtr corridor_marker_timer_;
};

int main(int argc, char **argv)
{
    rclcpp::init(argc, argv);
    auto node = std::make_shared<BoxSimulatorNode>();
    if (rclcpp::ok()) {
        rclcpp::spin(node);
    }
    rclcpp::shutdown();
    return 0;
}
