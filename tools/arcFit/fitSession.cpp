#include "fitSession.hpp"

#include "arcfit/render/plot.hpp"

#include <opencv2/imgproc.hpp>

#include <string>
#include <utility>

namespace arcfit {

static cv::Mat buildInfoTile(const std::string& title, const std::string& message) {
	cv::Mat tile(540, 960, CV_8UC3, cv::Scalar(20, 20, 20));
	cv::putText(tile, title, cv::Point(40, 120), cv::FONT_HERSHEY_SIMPLEX, 1.1, cv::Scalar(250, 250, 250), 2, cv::LINE_AA);
	cv::putText(tile, message, cv::Point(40, 200), cv::FONT_HERSHEY_SIMPLEX, 0.85, cv::Scalar(200, 200, 200), 2, cv::LINE_AA);
	return tile;
}

FitSession::FitSession(core::PointSequence points, const cv::Point2d& referenceCenter, const double referenceRadius)
    : m_points(std::move(points)), m_referenceCenter(referenceCenter), m_referenceRadius(referenceRadius) {
}

const core::FitOutcome& FitSession::fit(const core::Tactic tactic) {
	m_trace.clear();
	m_outcome    = core::fit(m_points, tactic, core::FitConfig{}, &m_trace);
	m_hasOutcome = true;
	return m_outcome;
}

cv::Mat FitSession::render(const ViewStep step) const {
	const bool fitted = m_hasOutcome && m_outcome.result.status == core::FitStatus::Ok;

	switch (step) {
	case ViewStep::Result: {
		render::FitScene scene{};
		scene.points          = m_points;
		scene.referenceCenter = m_referenceCenter;
		scene.referenceRadius = m_referenceRadius;
		if (fitted) {
			scene.fittedCenter = m_outcome.result.center;
		}
		return render::renderFit(scene);
	}

	case ViewStep::SearchLevels: {
		if (!fitted) {
			return buildInfoTile("Search Levels", "No successful fit to show.");
		}
		const cv::Mat mosaic = render::buildSearchMosaic(m_trace, m_points);
		if (mosaic.empty()) {
			return buildInfoTile("Search Levels", "The search recorded no levels.");
		}
		return mosaic;
	}
	}

	return {};
}

} // namespace arcfit
