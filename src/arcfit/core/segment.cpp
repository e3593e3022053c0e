#include "arcfit/core/segment.hpp"

#include <cmath>
#include <numbers>

namespace arcfit::core {

std::optional<SegmentNormal> normal(const cv::Point2d& p0, const cv::Point2d& p1) {
	const cv::Point2d v = p1 - p0; //!< Direction
	if (v.x == 0.0 && v.y == 0.0) {
		return std::nullopt;
	}

	const cv::Point2d perpendicular(-v.y, v.x);
	return SegmentNormal{0.5 * (p0 + p1), std::atan2(perpendicular.y, perpendicular.x)};
}

double directionAngle(const cv::Point2d& from, const cv::Point2d& to) {
	return std::atan2(to.y - from.y, to.x - from.x); // atan2(0, 0) is defined as 0
}

double lineAngleDifference(const double a, const double b) {
	double d = std::fmod(std::abs(a - b), std::numbers::pi); // [0, pi)
	if (d > 0.5 * std::numbers::pi) {
		d = std::numbers::pi - d; // line through both directions
	}
	return d;
}

} // namespace arcfit::core
