#pragma once

#include <opencv2/core/types.hpp>

#include <optional>

namespace arcfit::core {

//! Local geometry of the segment joining two consecutive points.
struct SegmentNormal {
	cv::Point2d midpoint; //!< Coordinate-wise mean of both end points.
	double angle;         //!< Angle of the perpendicular (-v.y, v.x) in (-pi, pi]. Always direction angle + pi/2 (mod 2pi).
};

/*! Midpoint and normal angle of the segment p0 -> p1.
 *  The perpendicular points to the left of the walking direction, i.e. towards the center for counter-clockwise arcs.
 *
 * \param [in] p0 Segment start.
 * \param [in] p1 Segment end.
 * \return     Null if p0 == p1 (degenerate segment, direction undefined).
 */
std::optional<SegmentNormal> normal(const cv::Point2d& p0, const cv::Point2d& p1);

//! Angle of the direction from -> to in (-pi, pi]. Zero if both points coincide.
double directionAngle(const cv::Point2d& from, const cv::Point2d& to);

//! Absolute difference between two undirected line angles, in [0, pi/2].
double lineAngleDifference(double a, double b);

} // namespace arcfit::core
