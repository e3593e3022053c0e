#pragma once

#include "viewStep.hpp"

#include "arcfit/core/fitter.hpp"
#include "arcfit/core/searchTrace.hpp"

#include <opencv2/core/mat.hpp>

namespace arcfit {

//! Holds one generated arc and re-runs the fit whenever the tactic changes.
class FitSession {
public:
	FitSession(core::PointSequence points, const cv::Point2d& referenceCenter, double referenceRadius);

	//! Fit the arc with the given tactic. Replaces the previous result and search trace.
	const core::FitOutcome& fit(core::Tactic tactic);

	cv::Mat render(ViewStep step) const;

	const core::PointSequence& points() const {
		return m_points;
	}

private:
	core::PointSequence m_points;
	cv::Point2d m_referenceCenter;
	double m_referenceRadius;

	core::FitOutcome m_outcome{};
	bool m_hasOutcome{false};
	core::SearchTrace m_trace{};
};

} // namespace arcfit
