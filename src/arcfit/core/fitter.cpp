#include "arcfit/core/fitter.hpp"

#include "arcfit/core/gridSearch.hpp"
#include "arcfit/core/scorer.hpp"
#include "arcfit/core/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <format>
#include <iostream>
#include <string>
#include <string_view>

namespace arcfit::core {

namespace {

//! Halvings from the largest double down to the smallest subnormal.
static constexpr double MAX_HALVINGS = 2100.0;

//! Enable per-level search diagnostics via environment variable.
static bool fitDebugEnabled() {
	const char* env = std::getenv("ARCFIT_FIT_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

static void printLevel(const cv::Point2d& centerHint, const std::optional<double> score, const double scanRange) {
	const std::string scoreText = score ? std::format("{:.6f}", *score) : std::string("none");
	std::cout << std::format("[fit-debug] center=({:.6f}, {:.6f}) score={} range={:.6f}\n", centerHint.x, centerHint.y, scoreText, scanRange);
}

} // namespace

unsigned iterationLimit(const double initialScanRange, const FitConfig& config) {
	const double halvings = std::ceil(std::log2(initialScanRange / config.minScanRange));
	const unsigned levels = halvings > 0.0 ? static_cast<unsigned>(std::min(halvings, MAX_HALVINGS)) : 0u; // NaN maps to 0
	return std::max(levels, 2u) + config.extraIterations;
}

FitOutcome fit(const PointSequence& points, const Tactic tactic, const FitConfig& config, SearchTrace* trace) {
	const FitStatus status = validatePoints(points, tactic);
	if (status != FitStatus::Ok) {
		std::cerr << std::format("Circle fit failed: {} ({} points, tactic {})\n", toString(status), points.size(), toString(tactic));
		return {FitResult{status, {}, 0.0}, 0u, 0.0};
	}

	// Valid input is non-empty.
	cv::Point2d centerHint = *centroid(points);
	double scanRange       = *boundingExtent(points);
	if (scanRange <= 0.0) {
		scanRange = config.fallbackScanRange;
	}

	FitOutcome outcome{};
	outcome.initialScanRange = scanRange;
	if (!std::isfinite(scanRange) || scanRange <= 0.0) {
		std::cerr << std::format("Circle fit failed: {} (initial range={})\n", toString(FitStatus::InvalidScanRange), scanRange);
		outcome.result = FitResult{FitStatus::InvalidScanRange, centerHint, 0.0};
		return outcome;
	}
	const unsigned limit = iterationLimit(scanRange, config);

	const bool debug = fitDebugEnabled();
	std::optional<double> accuracy{};     //!< Score of the latest level.
	std::optional<double> lastAccuracy{}; //!< Score of the level before.
	if (debug) {
		printLevel(centerHint, accuracy, scanRange);
	}

	// Increase the resolution until the score settles at a fine enough scale.
	while (!accuracy || !lastAccuracy || *lastAccuracy - *accuracy > config.minImprovement || scanRange > config.minScanRange) {
		if (outcome.iterations >= limit) {
			std::cerr << std::format("Circle fit failed: {} after {} levels (range={})\n", toString(FitStatus::NotConverged), outcome.iterations, scanRange);
			outcome.result = FitResult{FitStatus::NotConverged, centerHint, accuracy.value_or(0.0)};
			return outcome;
		}

		const FitResult level = fitAt(centerHint, scanRange, points, tactic, trace);
		if (level.status != FitStatus::Ok) {
			std::cerr << std::format("Circle fit failed: {} at level {} (range={})\n", toString(level.status), outcome.iterations, scanRange);
			outcome.result = level;
			return outcome;
		}

		lastAccuracy = accuracy;
		accuracy     = level.score;
		centerHint   = level.center;
		scanRange /= 2.0;
		++outcome.iterations;

		if (debug) {
			printLevel(centerHint, accuracy, scanRange);
		}
	}

	outcome.result = FitResult{FitStatus::Ok, centerHint, accuracy.value_or(0.0)};
	return outcome;
}

std::optional<cv::Point2d> fitCenter(const PointSequence& points, const Tactic tactic) {
	const FitOutcome outcome = fit(points, tactic);
	if (outcome.result.status != FitStatus::Ok) {
		return std::nullopt;
	}
	return outcome.result.center;
}

} // namespace arcfit::core
