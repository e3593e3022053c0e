#pragma once

#include <opencv2/core/types.hpp>

#include <cstddef>
#include <vector>

namespace arcfit::core {

using PointSequence = std::vector<cv::Point2d>; //!< Ordered points along an arc. Consecutive points form segments.

//! Residual used to judge how well a candidate center fits the points.
enum class Tactic {
	Angle, //!< Compare each segment normal with the direction from the segment midpoint to the candidate.
	Radius //!< Compare each segment midpoint distance to the candidate with the average point distance.
};

//! Outcome of a fitting step.
enum class FitStatus {
	Ok,
	InsufficientPoints, //!< Fewer points than the tactic requires (ANGLE: 2, RADIUS: 1).
	DegenerateSegment,  //!< Two consecutive points coincide. The segment has no direction.
	InvalidScanRange,   //!< Scan range is not a positive finite number.
	NotConverged        //!< Level limit reached before the stop rule held. The center is the last estimate.
};

//! Best center found by a search and its residual score.
struct FitResult {
	FitStatus status{FitStatus::Ok};
	cv::Point2d center{};
	double score{0.0}; //!< Residual score >= 0. Lower is better, 0 is a perfect fit.
};

const char* toString(Tactic tactic);
const char* toString(FitStatus status);

//! Minimum number of points the tactic can score.
std::size_t minimumPoints(Tactic tactic);

} // namespace arcfit::core
