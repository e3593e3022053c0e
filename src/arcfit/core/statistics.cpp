#include "arcfit/core/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>

#include <opencv2/core.hpp>

namespace arcfit::core {

std::optional<double> mean(const std::vector<double>& values) {
	if (values.empty()) {
		return std::nullopt;
	}
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

std::optional<double> averageRadius(const cv::Point2d& center, const PointSequence& points) {
	std::vector<double> distances;
	distances.reserve(points.size());
	std::transform(points.begin(), points.end(), std::back_inserter(distances), [&center](const cv::Point2d& p) { return cv::norm(p - center); });
	return mean(distances);
}

std::optional<cv::Point2d> centroid(const PointSequence& points) {
	if (points.empty()) {
		return std::nullopt;
	}

	const cv::Point2d sum = std::accumulate(points.begin(), points.end(), cv::Point2d(0.0, 0.0));
	return sum * (1.0 / static_cast<double>(points.size()));
}

std::optional<double> boundingExtent(const PointSequence& points) {
	if (points.empty()) {
		return std::nullopt;
	}

	const auto [minX, maxX] = std::minmax_element(points.begin(), points.end(), [](const cv::Point2d& a, const cv::Point2d& b) { return a.x < b.x; });
	const auto [minY, maxY] = std::minmax_element(points.begin(), points.end(), [](const cv::Point2d& a, const cv::Point2d& b) { return a.y < b.y; });
	return std::max(maxX->x - minX->x, maxY->y - minY->y);
}

} // namespace arcfit::core
