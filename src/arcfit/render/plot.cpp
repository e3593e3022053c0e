#include "arcfit/render/plot.hpp"

#include "arcfit/core/segment.hpp"
#include "arcfit/core/statistics.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <iterator>
#include <string>

#include <opencv2/imgproc.hpp>

namespace arcfit::render {

namespace {

static const cv::Scalar BACKGROUND(255, 255, 255);
static const cv::Scalar POINTS_COLOR(0, 0, 0);
static const cv::Scalar NORMAL_COLOR(180, 120, 40);
static const cv::Scalar REFERENCE_COLOR(0, 0, 0);
static const cv::Scalar FITTED_COLOR(0, 0, 220);
static const cv::Scalar HEADER_BG(0, 0, 0);
static const cv::Scalar HEADER_FG(255, 255, 255);

//! Pixel coordinates are clamped to this magnitude. Far outside any image, well inside int.
static constexpr double PIXEL_LIMIT = 16777216.0;

//! Lines are clipped to the image grown by this border.
static constexpr double CLIP_BORDER_PX = 8.0;

static cv::Point roundPixel(const cv::Point2d& p) {
	const double x = std::clamp(p.x, -PIXEL_LIMIT, PIXEL_LIMIT);
	const double y = std::clamp(p.y, -PIXEL_LIMIT, PIXEL_LIMIT);
	return {static_cast<int>(std::lround(x)), static_cast<int>(std::lround(y))};
}

//! Liang-Barsky clipping in double precision. False if no part of a-b lies inside box.
static bool clipSegment(const cv::Rect2d& box, cv::Point2d& a, cv::Point2d& b) {
	if (!std::isfinite(a.x) || !std::isfinite(a.y) || !std::isfinite(b.x) || !std::isfinite(b.y)) {
		return false;
	}

	const cv::Point2d d = b - a;
	const std::array<double, 4> p{-d.x, d.x, -d.y, d.y};
	const std::array<double, 4> q{a.x - box.x, box.x + box.width - a.x, a.y - box.y, box.y + box.height - a.y};

	double t0 = 0.0;
	double t1 = 1.0;
	for (std::size_t i = 0; i < p.size(); ++i) {
		if (p[i] == 0.0) {
			if (q[i] < 0.0) {
				return false; // parallel and outside
			}
			continue;
		}
		const double t = q[i] / p[i];
		if (p[i] < 0.0) {
			if (t > t1) {
				return false;
			}
			t0 = std::max(t0, t);
		} else {
			if (t < t0) {
				return false;
			}
			t1 = std::min(t1, t);
		}
	}

	const cv::Point2d start = a + d * t0;
	b                       = a + d * t1;
	a                       = start;
	return true;
}

//! Smallest rectangle containing both.
static cv::Rect2d unite(const cv::Rect2d& a, const cv::Rect2d& b) {
	const double x0 = std::min(a.x, b.x);
	const double y0 = std::min(a.y, b.y);
	const double x1 = std::max(a.x + a.width, b.x + b.width);
	const double y1 = std::max(a.y + a.height, b.y + b.height);
	return {x0, y0, x1 - x0, y1 - y0};
}

static cv::Rect2d circleBounds(const cv::Point2d& center, const double radius) {
	return {center.x - radius, center.y - radius, 2.0 * radius, 2.0 * radius};
}

//! Line made of short dashes (matplotlib ':' style).
static void drawDottedLine(cv::Mat& image, const cv::Point& from, const cv::Point& to, const cv::Scalar& color) {
	static constexpr double DASH_PX = 3.0;

	const cv::Point2d delta(to - from);
	const double length = std::hypot(delta.x, delta.y);
	if (length < 1.0) {
		return;
	}

	const cv::Point2d dir = delta * (1.0 / length);
	for (double s = 0.0; s < length; s += 2.0 * DASH_PX) {
		const double e = std::min(s + DASH_PX, length);
		const cv::Point a(cv::Point2d(from) + dir * s);
		const cv::Point b(cv::Point2d(from) + dir * e);
		cv::line(image, a, b, color, 1, cv::LINE_AA);
	}
}

static void drawDot(cv::Mat& image, const cv::Point& at, const cv::Scalar& color, const int radius) {
	cv::circle(image, at, radius, color, cv::FILLED, cv::LINE_AA);
}

//! Label bar on top of a tile.
static void labelTile(cv::Mat& tile, const std::string& text) {
	static constexpr int BAR_H = 28;
	static constexpr int PAD   = 6;

	cv::rectangle(tile, cv::Rect(0, 0, tile.cols, std::min(BAR_H, tile.rows)), HEADER_BG, cv::FILLED);
	cv::putText(tile, text, cv::Point(PAD, 20), cv::FONT_HERSHEY_SIMPLEX, 0.5, HEADER_FG, 1, cv::LINE_AA);
}

//! Green (best) to red (worst) relative to the score range of one level.
static cv::Scalar scoreColor(const double score, const double minScore, const double maxScore) {
	const double span = maxScore - minScore;
	const double t    = span > 1e-12 ? std::clamp((score - minScore) / span, 0.0, 1.0) : 0.0;
	return {0.0, 200.0 * (1.0 - t), 255.0 * t};
}

static void drawPolyline(cv::Mat& image, const PlotView& view, const core::PointSequence& points, const cv::Scalar& color, const int thickness) {
	if (points.empty()) {
		return;
	}

	std::vector<cv::Point2d> pixels;
	pixels.reserve(points.size());
	std::transform(points.begin(), points.end(), std::back_inserter(pixels), [&view](const cv::Point2d& p) { return view.project(p); });

	// Segments are clipped before rounding. Far points of a zoomed view do not fit into int.
	const cv::Rect2d box(-CLIP_BORDER_PX, -CLIP_BORDER_PX, image.cols + 2.0 * CLIP_BORDER_PX, image.rows + 2.0 * CLIP_BORDER_PX);
	for (std::size_t i = 1; i < pixels.size(); ++i) {
		cv::Point2d a = pixels[i - 1];
		cv::Point2d b = pixels[i];
		if (clipSegment(box, a, b)) {
			cv::line(image, roundPixel(a), roundPixel(b), color, thickness, cv::LINE_AA);
		}
	}
	if (pixels.size() == 1u && box.contains(pixels.front())) {
		drawDot(image, roundPixel(pixels.front()), color, thickness + 1);
	}
}

} // namespace

PlotView::PlotView(const cv::Rect2d& world, const cv::Size imageSize, const double margin) {
	const double extent = std::max({world.width, world.height, 1e-9}) * (1.0 + 2.0 * margin);
	const int minSide   = std::max(1, std::min(imageSize.width, imageSize.height));

	m_worldCenter = cv::Point2d(world.x + 0.5 * world.width, world.y + 0.5 * world.height);
	m_imageCenter = cv::Point2d(0.5 * imageSize.width, 0.5 * imageSize.height);
	m_scale       = static_cast<double>(minSide) / extent;
}

cv::Point2d PlotView::project(const cv::Point2d& p) const {
	return {m_imageCenter.x + (p.x - m_worldCenter.x) * m_scale, m_imageCenter.y - (p.y - m_worldCenter.y) * m_scale}; // y up
}

cv::Point PlotView::toPixel(const cv::Point2d& p) const {
	return roundPixel(project(p));
}

double PlotView::toPixelLength(const double worldLength) const {
	return worldLength * m_scale;
}

cv::Rect2d boundsOf(const core::PointSequence& points) {
	if (points.empty()) {
		return {};
	}

	const auto [minX, maxX] = std::minmax_element(points.begin(), points.end(), [](const cv::Point2d& a, const cv::Point2d& b) { return a.x < b.x; });
	const auto [minY, maxY] = std::minmax_element(points.begin(), points.end(), [](const cv::Point2d& a, const cv::Point2d& b) { return a.y < b.y; });
	return {minX->x, minY->y, maxX->x - minX->x, maxY->y - minY->y};
}

cv::Mat renderFit(const FitScene& scene, const PlotConfig& config) {
	cv::Mat image(config.size, CV_8UC3, BACKGROUND);

	// Fitted circle radius is the mean distance of the points to the estimate.
	std::optional<double> fittedRadius{};
	if (scene.fittedCenter) {
		fittedRadius = core::averageRadius(*scene.fittedCenter, scene.points);
	}

	// Everything drawn must be visible.
	cv::Rect2d world = boundsOf(scene.points);
	if (scene.referenceCenter) {
		world = unite(world, circleBounds(*scene.referenceCenter, scene.referenceRadius));
	}
	if (scene.fittedCenter) {
		world = unite(world, circleBounds(*scene.fittedCenter, fittedRadius.value_or(0.0)));
	}
	const PlotView view(world, config.size, config.margin);

	if (config.drawNormals) {
		for (std::size_t i = 1; i < scene.points.size(); ++i) {
			const auto segment = core::normal(scene.points[i - 1], scene.points[i]);
			if (!segment) {
				continue; // coincident points have no normal
			}
			const double length = cv::norm(scene.points[i] - scene.points[i - 1]);
			const cv::Point2d tip(segment->midpoint.x + length * std::cos(segment->angle), segment->midpoint.y + length * std::sin(segment->angle));
			drawDottedLine(image, view.toPixel(segment->midpoint), view.toPixel(tip), NORMAL_COLOR);
		}
	}

	drawPolyline(image, view, scene.points, POINTS_COLOR, 2);

	if (scene.referenceCenter) {
		const int r = static_cast<int>(std::lround(std::min(view.toPixelLength(scene.referenceRadius), PIXEL_LIMIT)));
		cv::circle(image, view.toPixel(*scene.referenceCenter), r, REFERENCE_COLOR, 1, cv::LINE_AA);
		drawDot(image, view.toPixel(*scene.referenceCenter), REFERENCE_COLOR, 5);
	}

	if (scene.fittedCenter && fittedRadius) {
		const int r = static_cast<int>(std::lround(std::min(view.toPixelLength(*fittedRadius), PIXEL_LIMIT)));
		cv::circle(image, view.toPixel(*scene.fittedCenter), r, FITTED_COLOR, 1, cv::LINE_AA);
		drawDot(image, view.toPixel(*scene.fittedCenter), FITTED_COLOR, 3);
	}

	// Legend (upper right).
	const int legendX = std::max(0, config.size.width - 170);
	int legendY       = 24;
	if (scene.referenceCenter) {
		drawDot(image, cv::Point(legendX, legendY - 5), REFERENCE_COLOR, 5);
		cv::putText(image, "Generated", cv::Point(legendX + 14, legendY), cv::FONT_HERSHEY_SIMPLEX, 0.55, REFERENCE_COLOR, 1, cv::LINE_AA);
		legendY += 24;
	}
	if (scene.fittedCenter) {
		drawDot(image, cv::Point(legendX, legendY - 5), FITTED_COLOR, 3);
		cv::putText(image, "Fitted", cv::Point(legendX + 14, legendY), cv::FONT_HERSHEY_SIMPLEX, 0.55, FITTED_COLOR, 1, cv::LINE_AA);
	}

	return image;
}

cv::Mat buildSearchMosaic(const core::SearchTrace& trace, const core::PointSequence& points, const PlotConfig& config) {
	static constexpr int TILE_LABEL_H = 28;
	static const cv::Scalar BG(20, 20, 20);
	static const cv::Scalar TILE_BG(245, 245, 245);
	static const cv::Scalar SQUARE_COLOR(120, 120, 120);
	static const cv::Scalar POINTS_ON_TILE(60, 60, 60);

	const auto& levels = trace.levels();
	if (levels.empty()) {
		return {};
	}

	const int count = static_cast<int>(levels.size());
	const int cols  = std::max(1, static_cast<int>(std::ceil(std::sqrt(static_cast<double>(count)))));
	const int rows  = (count + cols - 1) / cols;
	const int tileW = std::max(1, std::min(config.tileSize, config.maxMosaicWidth / cols));
	const int tileH = tileW + TILE_LABEL_H;

	cv::Mat mosaic(rows * tileH, cols * tileW, CV_8UC3, BG);

	for (int index = 0; index < count; ++index) {
		const core::SearchLevel& level = levels[static_cast<std::size_t>(index)];
		const int c                    = index % cols;
		const int r                    = index / cols;

		cv::Mat cell = mosaic(cv::Rect(c * tileW, r * tileH, tileW, tileH));
		cv::Mat plot = cell(cv::Rect(0, TILE_LABEL_H, tileW, tileW));
		plot.setTo(TILE_BG);

		// Show the scanned square with some context around it.
		const double range = level.scanRange;
		const cv::Rect2d world(level.centerHint.x - 1.5 * range, level.centerHint.y - 1.5 * range, 3.0 * range, 3.0 * range);
		const PlotView view(world, plot.size());

		drawPolyline(plot, view, points, POINTS_ON_TILE, 1);
		cv::rectangle(plot, view.toPixel(cv::Point2d(world.x + 0.5 * range, world.y + 2.5 * range)),
		              view.toPixel(cv::Point2d(world.x + 2.5 * range, world.y + 0.5 * range)), SQUARE_COLOR, 1, cv::LINE_AA);

		double minScore = 0.0;
		double maxScore = 0.0;
		if (!level.candidates.empty()) {
			const auto [lo, hi] = std::minmax_element(level.candidates.begin(), level.candidates.end(),
			                                          [](const core::CandidateScore& a, const core::CandidateScore& b) { return a.score < b.score; });
			minScore = lo->score;
			maxScore = hi->score;
		}
		for (const auto& candidate: level.candidates) {
			drawDot(plot, view.toPixel(candidate.center), scoreColor(candidate.score, minScore, maxScore), 4);
		}
		cv::circle(plot, view.toPixel(level.best.center), 8, FITTED_COLOR, 2, cv::LINE_AA);

		labelTile(cell, std::format("#{} r={:.4g} s={:.4g}", index + 1, range, level.best.score));
	}

	return mosaic;
}

} // namespace arcfit::render
