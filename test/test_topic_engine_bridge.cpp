#include "BoxNavigation/topic_engine_bridge.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "rclcpp/rclcpp.hpp"

using namespace std::chrono_literals;

class TopicEngineBridgeTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() { rclcpp::init(0, nullptr); }
  static void TearDownTestSuite() { rclcpp::shutdown(); }

  void SetUp() override { node_ = std::make_shared<rclcpp::Node>("engine_bridge_test"); }

  TopicEngineBridge::BridgeParams fast_params(const std::string& prefix) {
    TopicEngineBridge::BridgeParams params;
    params.pose_topic = prefix + "/agent_pose";
    params.capture_topic = prefix + "/capture";
    params.timeout = 0.05;
    params.max_retries = 40;
    return params;
  }

  std::shared_ptr<rclcpp::Node> node_;
};

TEST_F(TopicEngineBridgeTest, RejectsInvalidRetryPolicy) {
  TopicEngineBridge::BridgeParams params;
  params.timeout = 0.0;
  EXPECT_THROW(TopicEngineBridge(*node_, params), std::invalid_argument);

  params.timeout = 1.0;
  params.max_retries = 0;
  EXPECT_THROW(TopicEngineBridge(*node_, params), std::invalid_argument);

  params.max_retries = 3;
  params.max_pending_captures = 0;
  EXPECT_THROW(TopicEngineBridge(*node_, params), std::invalid_argument);
}

TEST_F(TopicEngineBridgeTest, UnreachableEngineFailsAfterRetries) {
  TopicEngineBridge::BridgeParams params = fast_params("/unreachable_engine");
  params.timeout = 0.01;
  params.max_retries = 2;
  TopicEngineBridge bridge(*node_, params);

  geometry_msgs::msg::Pose2D pose;
  EXPECT_FALSE(bridge.send_pose(pose, 0));
  EXPECT_FALSE(bridge.try_receive_capture().has_value());
}

TEST_F(TopicEngineBridgeTest, PublishesPoseToSubscribedEngine) {
  TopicEngineBridge bridge(*node_, fast_params("/pose_engine"));

  std::optional<geometry_msgs::msg::PoseStamped> received;
  auto engine = node_->create_subscription<geometry_msgs::msg::PoseStamped>(
      "/pose_engine/agent_pose", 10,
      [&received](const geometry_msgs::msg::PoseStamped::SharedPtr msg) { received = *msg; });

  geometry_msgs::msg::Pose2D pose;
  pose.x = 1.5;
  pose.y = -2.0;
  pose.theta = M_PI / 2.0;
  ASSERT_TRUE(bridge.send_pose(pose, 4));

  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (!received && std::chrono::steady_clock::now() < deadline) {
    rclcpp::spin_some(node_);
    rclcpp::sleep_for(10ms);
  }

  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(received->header.frame_id, "map");
  EXPECT_DOUBLE_EQ(received->pose.position.x, 1.5);
  EXPECT_DOUBLE_EQ(received->pose.position.y, -2.0);
  EXPECT_NEAR(received->pose.orientation.z, std::sin(M_PI / 4.0), 1e-12);
  EXPECT_NEAR(received->pose.orientation.w, std::cos(M_PI / 4.0), 1e-12);
}

TEST_F(TopicEngineBridgeTest, QueuesCapturedImages) {
  TopicEngineBridge bridge(*node_, fast_params("/capture_engine"));
  auto engine = node_->create_publisher<sensor_msgs::msg::Image>("/capture_engine/capture", 10);

  sensor_msgs::msg::Image image;
  image.header.frame_id = "camera";
  image.header.stamp.sec = 12;
  image.header.stamp.nanosec = 500;
  image.width = 4;
  image.height = 2;
  image.encoding = "rgb8";

  // Keep publishing until discovery has matched both ends
  std::optional<EngineCapture> capture;
  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (!capture && std::chrono::steady_clock::now() < deadline) {
    engine->publish(image);
    rclcpp::spin_some(node_);
    capture = bridge.try_receive_capture();
    rclcpp::sleep_for(10ms);
  }

  // No pose was ever sent, so the image goes to the first step
  ASSERT_TRUE(capture.has_value());
  EXPECT_EQ(capture->reference, "camera/12.500");
  EXPECT_EQ(capture->step, 0);
}

TEST_F(TopicEngineBridgeTest, CaptureEchoingPoseStampKeepsItsStep) {
  TopicEngineBridge bridge(*node_, fast_params("/echo_engine"));

  std::optional<geometry_msgs::msg::PoseStamped> received;
  auto engine_sub = node_->create_subscription<geometry_msgs::msg::PoseStamped>(
      "/echo_engine/agent_pose", 10,
      [&received](const geometry_msgs::msg::PoseStamped::SharedPtr msg) { received = *msg; });
  auto engine_pub = node_->create_publisher<sensor_msgs::msg::Image>("/echo_engine/capture", 10);

  geometry_msgs::msg::Pose2D pose;
  ASSERT_TRUE(bridge.send_pose(pose, 4));
  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (!received && std::chrono::steady_clock::now() < deadline) {
    rclcpp::spin_some(node_);
    rclcpp::sleep_for(10ms);
  }
  ASSERT_TRUE(received.has_value());

  // The next pose goes out before the render for step 4 comes back
  rclcpp::sleep_for(2ms);
  ASSERT_TRUE(bridge.send_pose(pose, 5));

  sensor_msgs::msg::Image image;
  image.header = received->header;
  image.header.frame_id = "camera";

  std::optional<EngineCapture> capture;
  deadline = std::chrono::steady_clock::now() + 2s;
  while (!capture && std::chrono::steady_clock::now() < deadline) {
    engine_pub->publish(image);
    rclcpp::spin_some(node_);
    capture = bridge.try_receive_capture();
    rclcpp::sleep_for(10ms);
  }

  ASSERT_TRUE(capture.has_value());
  EXPECT_EQ(capture->step, 4);
}

TEST_F(TopicEngineBridgeTest, PendingCapturesAreBounded) {
  TopicEngineBridge::BridgeParams params = fast_params("/flooding_engine");
  params.max_pending_captures = 2;
  TopicEngineBridge bridge(*node_, params);
  auto engine = node_->create_publisher<sensor_msgs::msg::Image>("/flooding_engine/capture", 10);

  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (engine->get_subscription_count() == 0 && std::chrono::steady_clock::now() < deadline) {
    rclcpp::sleep_for(10ms);
  }
  ASSERT_GT(engine->get_subscription_count(), 0u);

  sensor_msgs::msg::Image image;
  image.header.frame_id = "camera";
  for (int32_t sec = 1; sec <= 5; ++sec) {
    image.header.stamp.sec = sec;
    engine->publish(image);
  }

  // Nobody polls while the images arrive
  deadline = std::chrono::steady_clock::now() + 500ms;
  while (std::chrono::steady_clock::now() < deadline) {
    rclcpp::spin_some(node_);
    rclcpp::sleep_for(10ms);
  }

  std::vector<std::string> queued;
  while (std::optional<EngineCapture> capture = bridge.try_receive_capture()) {
    queued.push_back(capture->reference);
  }
  ASSERT_FALSE(queued.empty());
  EXPECT_LE(queued.size(), 2u);
  EXPECT_EQ(queued.back(), "camera/5.0");
}
