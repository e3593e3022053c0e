#pragma once

#include "arcfit/core/searchTrace.hpp"
#include "arcfit/core/types.hpp"

#include <opencv2/core/mat.hpp>

#include <optional>
#include <vector>

namespace arcfit::render {

//! Drawing parameters.
struct PlotConfig {
	cv::Size size{800, 800};  //!< Output image size of renderFit.
	double margin{0.1};       //!< Free border relative to the plotted extent.
	bool drawNormals{true};   //!< Draw the dotted segment normals used by the angle residual.
	int tileSize{360};        //!< Tile width/height of the search mosaic.
	int maxMosaicWidth{2000}; //!< Mosaic is limited to this width. Tiles shrink to fit.
};

//! Maps world coordinates (y up) onto an image (y down), preserving the aspect ratio.
class PlotView {
public:
	//! \param [in] world     Region that must be visible. Expanded by margin on every side.
	//! \param [in] imageSize Target image size.
	PlotView(const cv::Rect2d& world, cv::Size imageSize, double margin = 0.0);

	//! Unrounded pixel position. Not bounded.
	cv::Point2d project(const cv::Point2d& p) const;
	//! Rounded pixel position. Coordinates far outside the image are clamped per axis.
	cv::Point toPixel(const cv::Point2d& p) const;
	double toPixelLength(double worldLength) const;

private:
	cv::Point2d m_worldCenter{};
	cv::Point2d m_imageCenter{};
	double m_scale{1.0}; //!< Pixels per world unit.
};

//! Everything shown in the result plot.
struct FitScene {
	core::PointSequence points{};                 //!< Input arc.
	std::optional<cv::Point2d> referenceCenter{}; //!< Center of the generated circle, if known.
	double referenceRadius{0.0};
	std::optional<cv::Point2d> fittedCenter{};    //!< Estimated center. Its radius is the average distance to the points.
};

//! Bounding rectangle of the points. Empty rectangle at the origin for no points.
cv::Rect2d boundsOf(const core::PointSequence& points);

//! Draw input points, segment normals, the reference circle and the fitted circle (CV_8UC3).
cv::Mat renderFit(const FitScene& scene, const PlotConfig& config = {});

//! One labelled tile per search level showing the scanned square, candidate scores and the winner.
//! \return Empty matrix if the trace holds no level.
cv::Mat buildSearchMosaic(const core::SearchTrace& trace, const core::PointSequence& points, const PlotConfig& config = {});

} // namespace arcfit::render
