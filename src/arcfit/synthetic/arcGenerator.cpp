#include "arcfit/synthetic/arcGenerator.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace arcfit::synthetic {

core::PointSequence generateCircle(const ArcShape& shape, cv::RNG& rng) {
	if (shape.numPoints <= 0) {
		return {};
	}

	const double n          = static_cast<double>(shape.numPoints);
	const double angleStep  = 2.0 * std::numbers::pi / n;
	const double jitterSize = shape.jitterRatio * (2.0 * std::numbers::pi * shape.radius) / n; //!< Half-width of the jitter interval.

	auto jitter = [&]() -> double {
		if (jitterSize <= 0.0) {
			return 0.0;
		}
		return rng.uniform(-jitterSize, jitterSize);
	};

	core::PointSequence points;
	points.reserve(static_cast<std::size_t>(shape.numPoints));
	for (int i = 0; i < shape.numPoints; ++i) {
		const double angle = angleStep * static_cast<double>(i);
		const double x     = shape.center.x + shape.radius * std::cos(angle) + jitter();
		const double y     = shape.center.y + shape.radius * std::sin(angle) + jitter();
		points.emplace_back(x, y);
	}
	return points;
}

core::PointSequence truncateToArc(const core::PointSequence& points, const double arcRatio) {
	if (!(arcRatio > 0.0)) {
		return {};
	}

	const double count = std::floor(std::min(arcRatio, 1.0) * static_cast<double>(points.size()));
	return {points.begin(), points.begin() + static_cast<std::ptrdiff_t>(count)};
}

cv::Point2d randomCenter(const double extent, cv::RNG& rng) {
	const double x = rng.uniform(-extent, extent);
	const double y = rng.uniform(-extent, extent);
	return {x, y};
}

} // namespace arcfit::synthetic
