#pragma once

namespace arcfit {

//! What the viewer shows.
enum class ViewStep {
	Result,      //!< Input arc with generated and fitted circle.
	SearchLevels //!< One tile per resolution level of the grid search.
};

} // namespace arcfit
