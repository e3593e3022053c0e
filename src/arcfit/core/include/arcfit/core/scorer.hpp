#pragma once

#include "arcfit/core/types.hpp"

#include <optional>

namespace arcfit::core {

//! Residual score of one candidate center.
struct ScoreResult {
	FitStatus status{FitStatus::Ok};
	double score{0.0}; //!< Mean residual over all segments (>= 0).
};

/*! Check that the points can be scored with the given tactic.
 *  ANGLE needs at least two points and no coincident consecutive points. RADIUS needs at least one point.
 */
FitStatus validatePoints(const PointSequence& points, Tactic tactic);

/*! Score how well a circle centered at candidate fits the points. Lower is better.
 *
 * \param [in] tactic    Residual used for scoring.
 * \param [in] candidate Candidate circle center.
 * \param [in] points    Ordered points. Consecutive pairs form n-1 segments.
 * \param [in] avgRadius Mean distance from candidate to all points. Computed when not given. Only used by Tactic::Radius.
 * \note       With RADIUS and a single point there are no segments and the score is 0.
 */
ScoreResult score(Tactic tactic, const cv::Point2d& candidate, const PointSequence& points, std::optional<double> avgRadius = std::nullopt);

//! Same residual as score() without the input check. Points must have passed validatePoints for the tactic.
//! Used by the grid search, which validates once per level instead of once per candidate.
double residual(Tactic tactic, const cv::Point2d& candidate, const PointSequence& points, std::optional<double> avgRadius = std::nullopt);

} // namespace arcfit::core
