#pragma once

#include "arcfit/core/types.hpp"

#include <opencv2/core.hpp>

namespace arcfit::synthetic {

//! Circle to sample points from.
struct ArcShape {
	cv::Point2d center{0.0, 0.0};
	double radius{10.0};
	int numPoints{50};       //!< Samples on the full circle, evenly spaced by angle.
	double jitterRatio{0.0}; //!< Perturbation relative to the distance between neighbouring samples.
};

/*! Sample a perturbed circle counter-clockwise, starting at angle 0.
 *  Point i lies at angle 2*pi*i/numPoints. Each coordinate is offset by a uniform value in [-J, J) with
 *  J = jitterRatio * circumference / numPoints.
 *
 * \param [in]     shape Circle and sampling parameters.
 * \param [in,out] rng   Random source for the jitter. Not used if jitterRatio is 0.
 * \return         Exactly numPoints points, empty if numPoints <= 0.
 */
core::PointSequence generateCircle(const ArcShape& shape, cv::RNG& rng);

//! Keep the leading floor(arcRatio * size) points, i.e. an arc covering arcRatio of the circle.
core::PointSequence truncateToArc(const core::PointSequence& points, double arcRatio);

//! Random circle center uniformly drawn from [-extent, extent) on both axes.
cv::Point2d randomCenter(double extent, cv::RNG& rng);

} // namespace arcfit::synthetic
