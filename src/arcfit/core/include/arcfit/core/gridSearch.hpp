#pragma once

#include "arcfit/core/searchTrace.hpp"
#include "arcfit/core/types.hpp"

namespace arcfit::core {

/*! Exhaustive search for the best circle center within scanRange of centerHint (one resolution level).
 *  Candidates form a 4x4 grid with step scanRange/2, starting at centerHint - scanRange and excluding the far boundary centerHint + scanRange.
 *  The grid contains centerHint itself, so the returned score never exceeds the score of the hint.
 *  Candidates are visited with increasing x, then increasing y. Ties keep the candidate visited first.
 *
 * \param [in] centerHint Center of the scanned square.
 * \param [in] scanRange  Half-width of the scanned square. Must be positive and finite.
 * \param [in] points     Ordered points along the arc.
 * \param [in] tactic     Residual used for scoring.
 * \param [in] trace      Optional recorder for every evaluated candidate.
 * \return     Best candidate and its score, or a failure status (center = centerHint) if the input is invalid.
 */
FitResult fitAt(const cv::Point2d& centerHint, double scanRange, const PointSequence& points, Tactic tactic, SearchTrace* trace = nullptr);

} // namespace arcfit::core
