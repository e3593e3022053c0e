#include "arcfit/core/scorer.hpp"

#include "arcfit/core/segment.hpp"
#include "arcfit/core/statistics.hpp"

#include <cmath>

#include <opencv2/core.hpp>

namespace arcfit::core {

FitStatus validatePoints(const PointSequence& points, const Tactic tactic) {
	if (points.size() < minimumPoints(tactic)) {
		return FitStatus::InsufficientPoints;
	}

	// Only the angle residual needs a segment direction.
	if (tactic == Tactic::Angle) {
		for (std::size_t i = 1; i < points.size(); ++i) {
			if (points[i - 1] == points[i]) {
				return FitStatus::DegenerateSegment;
			}
		}
	}
	return FitStatus::Ok;
}

ScoreResult score(const Tactic tactic, const cv::Point2d& candidate, const PointSequence& points, const std::optional<double> avgRadius) {
	const FitStatus status = validatePoints(points, tactic);
	if (status != FitStatus::Ok) {
		return {status, 0.0};
	}
	return {FitStatus::Ok, residual(tactic, candidate, points, avgRadius)};
}

double residual(const Tactic tactic, const cv::Point2d& candidate, const PointSequence& points, const std::optional<double> avgRadius) {
	if (points.size() < 2u) {
		return 0.0;
	}

	double radius = 0.0;
	if (tactic == Tactic::Radius) {
		radius = avgRadius ? *avgRadius : *averageRadius(candidate, points); // points is non-empty here
	}

	double residualSum = 0.0;
	for (std::size_t i = 1; i < points.size(); ++i) {
		const cv::Point2d& p0 = points[i - 1];
		const cv::Point2d& p1 = points[i];

		switch (tactic) {
		case Tactic::Angle: {
			// Normal of a chord passes through the circle center.
			const auto segment = normal(p0, p1);
			if (!segment) {
				continue; // excluded by validatePoints
			}
			residualSum += lineAngleDifference(directionAngle(segment->midpoint, candidate), segment->angle);
			break;
		}
		case Tactic::Radius: {
			const cv::Point2d mid = 0.5 * (p0 + p1);
			residualSum += std::abs(cv::norm(mid - candidate) - radius);
			break;
		}
		}
	}

	return residualSum / static_cast<double>(points.size() - 1u);
}

} // namespace arcfit::core
