#pragma once

#include "arcfit/core/types.hpp"

#include <optional>
#include <vector>

namespace arcfit::core {

//! Arithmetic mean. Null if values is empty.
std::optional<double> mean(const std::vector<double>& values);

//! Mean Euclidean distance from center to every point.
//! \return Null if points is empty.
std::optional<double> averageRadius(const cv::Point2d& center, const PointSequence& points);

//! Arithmetic mean of all point coordinates.
//! \return Null if points is empty.
std::optional<cv::Point2d> centroid(const PointSequence& points);

//! Larger side of the axis-aligned bounding box of the points.
//! \return Null if points is empty.
std::optional<double> boundingExtent(const PointSequence& points);

} // namespace arcfit::core
