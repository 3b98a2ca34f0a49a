#include "BoxNavigation/corridor.hpp"
#include "BoxNavigation/geometry.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

// Box0 = unit square, Box1 = unit square shifted by (0.5, 0) with its target on a corner
Corridor make_two_box_corridor() {
  return Corridor({aligned_box(0.0, 1.0, 0.0, 1.0, {0.5, 0.5}),
                   aligned_box(0.5, 1.5, 0.0, 1.0, {1.5, 0.0})});
}

Pose2D make_pose(double x, double y, double theta) {
  Pose2D pose;
  pose.x = x;
  pose.y = y;
  pose.theta = theta;
  return pose;
}

}  // namespace

TEST(CorridorTest, EmptyCorridorIsInvalid) {
  EXPECT_THROW(Corridor(std::vector<Box>{}), CorridorInvalid);
}

TEST(CorridorTest, NonOverlappingNeighboursAreInvalid) {
  // Gap between the first pair
  EXPECT_THROW(Corridor({aligned_box(0.0, 1.0, 0.0, 1.0, {0.5, 0.5}),
                         aligned_box(2.0, 3.0, 0.0, 1.0, {2.5, 0.5})}),
               CorridorInvalid);

  // Gap between the last pair only
  EXPECT_THROW(Corridor({aligned_box(0.0, 1.0, 0.0, 1.0, {0.5, 0.5}),
                         aligned_box(0.5, 1.5, 0.0, 1.0, {1.0, 0.5}),
                         aligned_box(0.0, 1.0, 5.0, 6.0, {0.5, 5.5})}),
               CorridorInvalid);
}

TEST(CorridorTest, EdgeContactIsNotADoorway) {
  EXPECT_THROW(Corridor({aligned_box(0.0, 1.0, 0.0, 1.0, {0.5, 0.5}),
                         aligned_box(1.0, 2.0, 0.0, 1.0, {1.5, 0.5})}),
               CorridorInvalid);
}

TEST(CorridorTest, SingleBoxTargetsItsOwnTarget) {
  Corridor corridor({aligned_box(0.0, 2.0, 0.0, 2.0, {1.5, 1.0})});

  EXPECT_EQ(corridor.size(), 1u);
  EXPECT_EQ(corridor.last_index(), 0u);
  EXPECT_DOUBLE_EQ(corridor.target_for(0).x, 1.5);
  EXPECT_DOUBLE_EQ(corridor.target_for(0).y, 1.0);
}

TEST(CorridorTest, DoorwayAndTargets) {
  Corridor corridor = make_two_box_corridor();

  EXPECT_EQ(corridor.box(0).index(), 0u);
  EXPECT_EQ(corridor.box(1).index(), 1u);

  EXPECT_NEAR(corridor.doorway(0).centroid.x, 0.75, 1e-12);
  EXPECT_NEAR(corridor.doorway(0).centroid.y, 0.5, 1e-12);
  EXPECT_NEAR(corridor.doorway(0).area, 0.5, 1e-12);

  // Doorway for the first box, final target for the last
  EXPECT_NEAR(corridor.target_for(0).x, 0.75, 1e-12);
  EXPECT_DOUBLE_EQ(corridor.target_for(1).x, 1.5);
  EXPECT_DOUBLE_EQ(corridor.target_for(1).y, 0.0);
  EXPECT_DOUBLE_EQ(corridor.final_target().x, 1.5);

  EXPECT_THROW(corridor.doorway(1), std::out_of_range);
}

TEST(CorridorTest, OccupancyQueries) {
  Corridor corridor = make_two_box_corridor();

  EXPECT_EQ(corridor.boxes_containing({0.75, 0.5}), (std::vector<size_t>{0, 1}));
  EXPECT_EQ(corridor.boxes_containing({0.25, 0.5}), (std::vector<size_t>{0}));
  EXPECT_EQ(corridor.boxes_containing({1.25, 0.5}), (std::vector<size_t>{1}));
  EXPECT_TRUE(corridor.boxes_containing({5.0, 5.0}).empty());

  EXPECT_TRUE(corridor.contains({0.25, 0.5}));
  EXPECT_FALSE(corridor.contains({-0.25, 0.5}));

  // Box 0 is behind an agent that already moved on to box 1
  EXPECT_FALSE(corridor.contains_from({0.25, 0.5}, 1));
  EXPECT_TRUE(corridor.contains_from({1.25, 0.5}, 1));
}

TEST(CorridorTest, BearingToTarget) {
  TargetBearing bearing = Corridor::bearing_to(make_pose(0.0, 0.0, 0.0), {1.0, 1.0});
  EXPECT_NEAR(bearing.distance, std::sqrt(2.0), 1e-12);
  EXPECT_NEAR(bearing.angle_delta, M_PI / 4.0, 1e-12);

  // Target to the right of the heading
  bearing = Corridor::bearing_to(make_pose(1.0, 1.0, M_PI / 2.0), {2.0, 1.0});
  EXPECT_NEAR(bearing.distance, 1.0, 1e-12);
  EXPECT_NEAR(bearing.angle_delta, -M_PI / 2.0, 1e-12);

  // Crossing the +/-pi seam takes the short way round
  double heading = deg_to_rad(170.0);
  Point2D target{std::cos(deg_to_rad(-170.0)), std::sin(deg_to_rad(-170.0))};
  bearing = Corridor::bearing_to(make_pose(0.0, 0.0, heading), target);
  EXPECT_NEAR(bearing.angle_delta, deg_to_rad(20.0), 1e-9);
}

TEST(CorridorLayoutTest, DefaultLayoutIsValid) {
  Corridor corridor = Corridor::from_flat_layout(default_corridor_layout());

  EXPECT_EQ(corridor.size(), 3u);
  EXPECT_DOUBLE_EQ(corridor.final_target().x, -820.0);
  EXPECT_DOUBLE_EQ(corridor.final_target().y, 200.0);
  EXPECT_TRUE(corridor.contains({0.0, 0.0}));
}

TEST(CorridorLayoutTest, RotationAppliesToEveryBox) {
  const double rotation = M_PI / 2.0;
  Corridor corridor = Corridor::from_flat_layout(default_corridor_layout(), rotation);

  // (-820, 200) turned a quarter counter-clockwise
  EXPECT_NEAR(corridor.final_target().x, -200.0, 1e-9);
  EXPECT_NEAR(corridor.final_target().y, -820.0, 1e-9);
}

TEST(CorridorLayoutTest, MalformedLayoutsThrow) {
  // Not a multiple of eight values
  EXPECT_THROW(Corridor::from_flat_layout({0.0, 0.0, 0.0, 1.0, 1.0, 1.0, 0.5}),
               std::invalid_argument);
  EXPECT_THROW(Corridor::from_flat_layout({}), std::invalid_argument);

  // Well-sized but not a rectangle
  EXPECT_THROW(Corridor::from_flat_layout({5.0, 0.0, 0.0, 2.0, 1.0, 5.0, 1.0, 2.0}),
               std::invalid_argument);

  // Well-formed boxes that do not overlap
  EXPECT_THROW(Corridor::from_flat_layout({0.0, 0.0, 0.0, 1.0, 1.0, 1.0, 0.5, 0.5,
                                           5.0, 0.0, 5.0, 1.0, 6.0, 1.0, 5.5, 0.5}),
               CorridorInvalid);
}
