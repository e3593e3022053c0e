#pragma once

#include "arcfit/core/types.hpp"

#include <string>
#include <vector>

namespace arcfit::cli {

//! Parameters of one fitting run. Defaults apply to omitted positional arguments.
struct Options {
	int numPoints{50};                         //!< Points on the generated full circle.
	double arcRatio{0.3};                      //!< Fraction of the circle handed to the fit, in (0, 1].
	double jitterRatio{0.05};                  //!< Perturbation relative to the point spacing, in (0, 1].
	core::Tactic tactic{core::Tactic::Radius}; //!< Residual used for the fit.
};

enum class ParseStatus { Ok, InvalidPointCount, InvalidArcRatio, InvalidJitterRatio, InvalidTactic, TooManyArguments };

struct ParseResult {
	ParseStatus status{ParseStatus::Ok};
	Options options{};
	std::string message{}; //!< Human readable reason on failure.
};

//! Process exit codes. Every failure maps to its own code.
enum class ExitCode : int { Success = 0, InvalidArguments = 2, InsufficientPoints = 3, DegenerateSegment = 4, InvalidScanRange = 5, OutputFailed = 6, NotConverged = 7 };

/*! Validate the positional parameters [NUMBER_OF_POINTS] [ARC_RATIO] [JITTER_RATIO] [RADIUS/ANGLE].
 * \param [in] args Arguments without the program name. Surrounding whitespace is ignored.
 */
ParseResult parseArguments(const std::vector<std::string>& args);

//! Parse a tactic name, case-insensitive. False for unknown names.
bool parseTactic(const std::string& text, core::Tactic& outTactic);

std::string usage(const std::string& programName);

int toExitCode(core::FitStatus status);

} // namespace arcfit::cli
