#include "arcfit/core/gridSearch.hpp"
#include "arcfit/core/scorer.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <numbers>

namespace arcfit::core {
namespace gtest {

static PointSequence makeCircle(const cv::Point2d& center, double radius, int numPoints) {
	PointSequence points;
	for (int i = 0; i < numPoints; ++i) {
		const double angle = 2.0 * std::numbers::pi * i / numPoints;
		points.emplace_back(center.x + radius * std::cos(angle), center.y + radius * std::sin(angle));
	}
	return points;
}

TEST(GridSearch, Enumerates_Four_By_Four_Grid_Without_Far_Boundary) {
	const PointSequence points = makeCircle({0.0, 0.0}, 10.0, 50);
	const cv::Point2d hint(1.0, -2.0);
	const double range = 4.0;

	SearchTrace trace;
	const FitResult result = fitAt(hint, range, points, Tactic::Radius, &trace);
	ASSERT_EQ(result.status, FitStatus::Ok);
	ASSERT_EQ(trace.levels().size(), 1u);

	const SearchLevel& level = trace.levels().front();
	EXPECT_EQ(level.centerHint, hint);
	EXPECT_DOUBLE_EQ(level.scanRange, range);
	ASSERT_EQ(level.candidates.size(), 16u);

	// x outer, y inner, both increasing in steps of range / 2.
	for (std::size_t i = 0; i < 4u; ++i) {
		for (std::size_t j = 0; j < 4u; ++j) {
			const cv::Point2d& c = level.candidates[i * 4u + j].center;
			EXPECT_DOUBLE_EQ(c.x, hint.x - range + static_cast<double>(i) * range / 2.0);
			EXPECT_DOUBLE_EQ(c.y, hint.y - range + static_cast<double>(j) * range / 2.0);
			EXPECT_LT(c.x, hint.x + range);
			EXPECT_LT(c.y, hint.y + range);
		}
	}

	EXPECT_EQ(level.best.center, result.center);
	EXPECT_DOUBLE_EQ(level.best.score, result.score);
}

TEST(GridSearch, Finds_Center_On_Grid) {
	const PointSequence points = makeCircle({0.0, 0.0}, 10.0, 50);

	for (const Tactic tactic: {Tactic::Angle, Tactic::Radius}) {
		const FitResult result = fitAt({0.0, 0.0}, 4.0, points, tactic);
		ASSERT_EQ(result.status, FitStatus::Ok);
		EXPECT_NEAR(result.center.x, 0.0, 1e-12) << toString(tactic);
		EXPECT_NEAR(result.center.y, 0.0, 1e-12) << toString(tactic);
	}
}

TEST(GridSearch, Never_Worse_Than_Hint) {
	const PointSequence points = makeCircle({0.7, 0.3}, 5.0, 30);
	const cv::Point2d hint(2.0, -1.0);

	for (const Tactic tactic: {Tactic::Angle, Tactic::Radius}) {
		const FitResult result = fitAt(hint, 3.0, points, tactic);
		ASSERT_EQ(result.status, FitStatus::Ok);
		EXPECT_LE(result.score, score(tactic, hint, points).score + 1e-12) << toString(tactic);
	}
}

TEST(GridSearch, Identical_Inputs_Give_Identical_Results) {
	const PointSequence points = makeCircle({-4.0, 6.0}, 7.0, 25);

	for (const Tactic tactic: {Tactic::Angle, Tactic::Radius}) {
		const FitResult first  = fitAt({-3.0, 5.0}, 2.5, points, tactic);
		const FitResult second = fitAt({-3.0, 5.0}, 2.5, points, tactic);
		EXPECT_EQ(first.status, second.status);
		EXPECT_EQ(first.center, second.center);
		EXPECT_EQ(first.score, second.score);
	}
}

TEST(GridSearch, Ties_Keep_First_Candidate) {
	// A single point has no segments: every candidate scores 0.
	const PointSequence points{{3.0, 3.0}};
	const cv::Point2d hint(3.0, 3.0);

	const FitResult result = fitAt(hint, 2.0, points, Tactic::Radius);
	ASSERT_EQ(result.status, FitStatus::Ok);
	EXPECT_DOUBLE_EQ(result.score, 0.0);
	EXPECT_DOUBLE_EQ(result.center.x, 1.0);
	EXPECT_DOUBLE_EQ(result.center.y, 1.0);
}

TEST(GridSearch, Rejects_Invalid_Scan_Range) {
	const PointSequence points = makeCircle({0.0, 0.0}, 1.0, 8);
	const cv::Point2d hint(0.5, 0.5);

	for (const double range: {0.0, -1.0, std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity()}) {
		SearchTrace trace;
		const FitResult result = fitAt(hint, range, points, Tactic::Angle, &trace);
		EXPECT_EQ(result.status, FitStatus::InvalidScanRange);
		EXPECT_EQ(result.center, hint);
		EXPECT_TRUE(trace.levels().empty());
	}
}

TEST(GridSearch, Reports_Invalid_Points) {
	EXPECT_EQ(fitAt({0.0, 0.0}, 1.0, {}, Tactic::Radius).status, FitStatus::InsufficientPoints);
	EXPECT_EQ(fitAt({0.0, 0.0}, 1.0, {{1.0, 0.0}}, Tactic::Angle).status, FitStatus::InsufficientPoints);
	EXPECT_EQ(fitAt({0.0, 0.0}, 1.0, {{1.0, 0.0}, {1.0, 0.0}}, Tactic::Angle).status, FitStatus::DegenerateSegment);
}

TEST(GridSearch, Recorded_Scores_Match_Checked_Scorer) {
	const PointSequence circle = makeCircle({1.0, -2.0}, 6.0, 30);
	const PointSequence arc(circle.begin(), circle.begin() + 12);

	for (const Tactic tactic: {Tactic::Radius, Tactic::Angle}) {
		SearchTrace trace;
		const FitResult best = fitAt({0.0, 0.0}, 3.0, arc, tactic, &trace);
		ASSERT_EQ(best.status, FitStatus::Ok);
		ASSERT_EQ(trace.levels().size(), 1u);
		ASSERT_EQ(trace.levels().front().candidates.size(), 16u);

		for (const CandidateScore& candidate: trace.levels().front().candidates) {
			const ScoreResult checked = score(tactic, candidate.center, arc);
			ASSERT_EQ(checked.status, FitStatus::Ok);
			EXPECT_DOUBLE_EQ(candidate.score, checked.score) << toString(tactic);
		}
	}
}

} // namespace gtest
} // namespace arcfit::core
