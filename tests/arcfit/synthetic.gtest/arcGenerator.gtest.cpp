#include "arcfit/synthetic/arcGenerator.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <numbers>

namespace arcfit::synthetic {
namespace gtest {

TEST(ArcGenerator, Exact_Circle_Without_Jitter) {
	cv::RNG rng(1);
	ArcShape shape{};
	shape.center    = {2.0, -3.0};
	shape.radius    = 10.0;
	shape.numPoints = 50;

	const core::PointSequence points = generateCircle(shape, rng);
	ASSERT_EQ(points.size(), 50u);
	for (const auto& p: points) {
		EXPECT_NEAR(cv::norm(p - shape.center), 10.0, 1e-9);
	}

	// Counter-clockwise from angle 0.
	EXPECT_NEAR(points[0].x, 12.0, 1e-12);
	EXPECT_NEAR(points[0].y, -3.0, 1e-12);
	EXPECT_GT(points[1].y, points[0].y);
}

TEST(ArcGenerator, Point_Count_Is_Exact) {
	cv::RNG rng(7);
	for (const int n: {1, 3, 7, 49, 50, 51, 100, 360}) {
		ArcShape shape{};
		shape.numPoints = n;
		EXPECT_EQ(generateCircle(shape, rng).size(), static_cast<std::size_t>(n));
	}
}

TEST(ArcGenerator, No_Points_For_Non_Positive_Count) {
	cv::RNG rng(7);
	ArcShape shape{};
	shape.numPoints = 0;
	EXPECT_TRUE(generateCircle(shape, rng).empty());
	shape.numPoints = -5;
	EXPECT_TRUE(generateCircle(shape, rng).empty());
}

TEST(ArcGenerator, Jitter_Is_Bounded) {
	cv::RNG rng(42);
	ArcShape shape{};
	shape.radius      = 10.0;
	shape.numPoints   = 50;
	shape.jitterRatio = 0.2;

	const double jitter = 0.2 * 2.0 * std::numbers::pi * 10.0 / 50.0;
	const core::PointSequence points = generateCircle(shape, rng);
	ASSERT_EQ(points.size(), 50u);

	bool anyPerturbed = false;
	for (std::size_t i = 0; i < points.size(); ++i) {
		const double angle = 2.0 * std::numbers::pi * static_cast<double>(i) / 50.0;
		const double dx    = points[i].x - 10.0 * std::cos(angle);
		const double dy    = points[i].y - 10.0 * std::sin(angle);
		EXPECT_LE(std::abs(dx), jitter + 1e-9);
		EXPECT_LE(std::abs(dy), jitter + 1e-9);
		anyPerturbed = anyPerturbed || std::abs(dx) > 1e-9 || std::abs(dy) > 1e-9;
	}
	EXPECT_TRUE(anyPerturbed);
}

TEST(ArcGenerator, Same_Seed_Same_Points) {
	ArcShape shape{};
	shape.jitterRatio = 0.5;

	cv::RNG first(99);
	cv::RNG second(99);
	EXPECT_EQ(generateCircle(shape, first), generateCircle(shape, second));
}

TEST(ArcGenerator, Truncate_To_Arc) {
	cv::RNG rng(3);
	const core::PointSequence circle = generateCircle(ArcShape{}, rng);
	ASSERT_EQ(circle.size(), 50u);

	const core::PointSequence arc = truncateToArc(circle, 0.3);
	ASSERT_EQ(arc.size(), 15u);
	EXPECT_EQ(arc.front(), circle.front());
	EXPECT_EQ(arc.back(), circle[14]);

	EXPECT_EQ(truncateToArc(circle, 1.0).size(), 50u);
	EXPECT_EQ(truncateToArc(circle, 0.01).size(), 0u); // floor(0.5)
	EXPECT_TRUE(truncateToArc(circle, 0.0).empty());
	EXPECT_TRUE(truncateToArc({}, 0.5).empty());
}

TEST(ArcGenerator, Random_Center_In_Range) {
	cv::RNG rng(11);
	for (int i = 0; i < 200; ++i) {
		const cv::Point2d c = randomCenter(10.0, rng);
		EXPECT_GE(c.x, -10.0);
		EXPECT_LT(c.x, 10.0);
		EXPECT_GE(c.y, -10.0);
		EXPECT_LT(c.y, 10.0);
	}
}

} // namespace gtest
} // namespace arcfit::synthetic
