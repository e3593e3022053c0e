#include "arcfit/core/gridSearch.hpp"

#include "arcfit/core/scorer.hpp"
#include "arcfit/core/statistics.hpp"

#include <array>
#include <cmath>
#include <limits>
#include <numeric>

namespace arcfit::core {

namespace {

//! Samples per axis: hint - range, hint - range/2, hint, hint + range/2.
static constexpr std::size_t GRID_SAMPLES = 4u;

using CandidateGrid = std::array<cv::Point2d, GRID_SAMPLES * GRID_SAMPLES>;

//! Enumerate candidates in search order (x outer, y inner).
//! Integer indices keep floating point accumulation from adding a fifth sample, and index 2 is exactly the hint.
static CandidateGrid buildCandidateGrid(const cv::Point2d& centerHint, const double scanRange) {
	const double step = scanRange / 2.0;

	CandidateGrid grid{};
	for (std::size_t i = 0u; i < GRID_SAMPLES; ++i) {
		for (std::size_t j = 0u; j < GRID_SAMPLES; ++j) {
			const double dx = (static_cast<double>(i) - 2.0) * step; //!< -range .. range/2
			const double dy = (static_cast<double>(j) - 2.0) * step;

			grid[i * GRID_SAMPLES + j] = cv::Point2d(centerHint.x + dx, centerHint.y + dy);
		}
	}
	return grid;
}

} // namespace

FitResult fitAt(const cv::Point2d& centerHint, const double scanRange, const PointSequence& points, const Tactic tactic, SearchTrace* trace) {
	if (!std::isfinite(scanRange) || scanRange <= 0.0) {
		return {FitStatus::InvalidScanRange, centerHint, 0.0};
	}

	const FitStatus status = validatePoints(points, tactic);
	if (status != FitStatus::Ok) {
		return {status, centerHint, 0.0};
	}

	if (trace) {
		trace->beginLevel(centerHint, scanRange);
	}

	const CandidateGrid grid = buildCandidateGrid(centerHint, scanRange);
	const FitResult initial{FitStatus::Ok, centerHint, std::numeric_limits<double>::infinity()};

	// Reduce to the first candidate with the minimal score.
	// Points were validated above. Candidates are scored without repeating the check.
	const FitResult best = std::accumulate(grid.begin(), grid.end(), initial, [&](const FitResult& current, const cv::Point2d& candidate) -> FitResult {
		// The radius residual compares against the mean distance of this candidate.
		const std::optional<double> avgRadius = (tactic == Tactic::Radius) ? averageRadius(candidate, points) : std::nullopt;
		const double value                    = residual(tactic, candidate, points, avgRadius);

		if (trace) {
			trace->add(candidate, value);
		}
		return value < current.score ? FitResult{FitStatus::Ok, candidate, value} : current;
	});

	if (trace) {
		trace->endLevel(best);
	}
	return best;
}

} // namespace arcfit::core
