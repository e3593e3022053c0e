#pragma once

#include "arcfit/core/types.hpp"

#include <vector>

namespace arcfit::core {

//! Score of a single evaluated candidate center.
struct CandidateScore {
	cv::Point2d center;
	double score;
};

//! One resolution level of the grid search.
struct SearchLevel {
	cv::Point2d centerHint{};                 //!< Center of the scanned square.
	double scanRange{0.0};                    //!< Half-width of the scanned square.
	std::vector<CandidateScore> candidates{}; //!< Candidates in enumeration order.
	FitResult best{};                         //!< Winner of this level.
};

//! Can be passed to the search functions to record every evaluated candidate for inspection.
class SearchTrace {
public:
	void beginLevel(const cv::Point2d& centerHint, double scanRange); //!< New resolution level starts. Ends an active level.
	void add(const cv::Point2d& candidate, double score);             //!< Record a candidate of the active level.
	void endLevel(const FitResult& best);                              //!< Close the active level with its winner.
	void clear();

	const std::vector<SearchLevel>& levels() const {
		return m_levels;
	}

private:
	SearchLevel m_currentLevel{};        //!< Currently active level.
	bool m_hasActiveLevel{false};        //!< A level is active.
	std::vector<SearchLevel> m_levels{}; //!< All completed levels.
};

} // namespace arcfit::core
