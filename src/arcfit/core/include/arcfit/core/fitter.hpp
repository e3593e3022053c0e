#pragma once

#include "arcfit/core/searchTrace.hpp"
#include "arcfit/core/types.hpp"

#include <optional>

namespace arcfit::core {

//! Termination parameters of the multi-resolution search.
struct FitConfig {
	double minScanRange{0.01};     //!< Stop only once the scan range dropped to this size.
	double minImprovement{0.0001}; //!< Stop only once the score improved by at most this much between two levels.
	double fallbackScanRange{1.0}; //!< Initial scan range if all points coincide (zero extent).
	unsigned extraIterations{32u}; //!< Levels allowed beyond those needed to shrink the range to minScanRange.
};

//! Result of the full fit.
struct FitOutcome {
	FitResult result{};           //!< Final center estimate and its score.
	unsigned iterations{0u};      //!< Number of resolution levels searched.
	double initialScanRange{0.0}; //!< Scan range of the first level.
};

/*! Number of levels fit() may search before it gives up with FitStatus::NotConverged.
 *  That is the halvings needed to bring initialScanRange down to minScanRange (at least two levels) plus extraIterations.
 */
unsigned iterationLimit(double initialScanRange, const FitConfig& config = {});

/*! Estimate the center of the circle through the points by coarse-to-fine grid search.
 *  Starts at the centroid with the bounding box extent as scan range. Each level re-centers on the best grid candidate and halves the range.
 *  Stops once two scores exist, the last improvement is <= minImprovement and the range is <= minScanRange.
 *
 * \param [in] points Ordered points along the arc (read-only).
 * \param [in] tactic Residual used for scoring.
 * \param [in] config Termination parameters.
 * \param [in] trace  Optional recorder for every evaluated candidate.
 * \return     NotConverged with the last estimate if iterationLimit() levels did not satisfy the stop rule.
 * \note       Local search. It may settle in a local minimum of the residual.
 */
FitOutcome fit(const PointSequence& points, Tactic tactic, const FitConfig& config = {}, SearchTrace* trace = nullptr);

//! Center estimate only. Null on invalid input.
std::optional<cv::Point2d> fitCenter(const PointSequence& points, Tactic tactic);

} // namespace arcfit::core
