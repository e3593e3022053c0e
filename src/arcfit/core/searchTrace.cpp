#include "arcfit/core/searchTrace.hpp"

#include <utility>

namespace arcfit::core {

void SearchTrace::beginLevel(const cv::Point2d& centerHint, const double scanRange) {
	if (m_hasActiveLevel) {
		endLevel(FitResult{});
	}
	m_hasActiveLevel          = true;
	m_currentLevel.centerHint = centerHint;
	m_currentLevel.scanRange  = scanRange;
}

void SearchTrace::add(const cv::Point2d& candidate, const double score) {
	if (!m_hasActiveLevel) {
		return; // Candidates outside of a level are dropped.
	}
	m_currentLevel.candidates.push_back(CandidateScore{candidate, score});
}

void SearchTrace::endLevel(const FitResult& best) {
	if (!m_hasActiveLevel) {
		return;
	}

	m_currentLevel.best = best;
	m_levels.emplace_back(std::move(m_currentLevel));
	m_currentLevel   = SearchLevel{};
	m_hasActiveLevel = false;
}

void SearchTrace::clear() {
	m_levels.clear();
	m_currentLevel   = SearchLevel{};
	m_hasActiveLevel = false;
}

} // namespace arcfit::core
