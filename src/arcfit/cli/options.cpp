#include "arcfit/cli/options.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <string_view>
#include <system_error>
#include <utility>

namespace arcfit::cli {

namespace {

static constexpr std::size_t MAX_ARGUMENTS = 4u;

static std::string_view trim(std::string_view text) {
	const auto isSpace = [](const char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
	while (!text.empty() && isSpace(text.front())) {
		text.remove_prefix(1);
	}
	while (!text.empty() && isSpace(text.back())) {
		text.remove_suffix(1);
	}
	return text;
}

//! Whole-string number conversion. Rejects trailing characters.
template <typename T>
static bool parseNumber(const std::string_view text, T& out) {
	if (text.empty()) {
		return false;
	}
	const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), out);
	return error == std::errc{} && end == text.data() + text.size();
}

static bool isRatio(const double value) {
	return value > 0.0 && value <= 1.0;
}

static ParseResult fail(const ParseStatus status, std::string message) {
	return {status, Options{}, std::move(message)};
}

} // namespace

bool parseTactic(const std::string& text, core::Tactic& outTactic) {
	std::string upper(trim(text));
	std::transform(upper.begin(), upper.end(), upper.begin(), [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });

	if (upper == "ANGLE") {
		outTactic = core::Tactic::Angle;
		return true;
	}
	if (upper == "RADIUS") {
		outTactic = core::Tactic::Radius;
		return true;
	}
	return false;
}

ParseResult parseArguments(const std::vector<std::string>& args) {
	if (args.size() > MAX_ARGUMENTS) {
		return fail(ParseStatus::TooManyArguments, "Too many arguments.");
	}

	Options options{};

	if (args.size() > 0u) {
		const std::string_view text = trim(args[0]);
		if (!parseNumber(text, options.numPoints) || options.numPoints < 1) {
			return fail(ParseStatus::InvalidPointCount, std::format("Invalid parameter: {}\nShould be a positive integer.", text));
		}
	}

	if (args.size() > 1u) {
		const std::string_view text = trim(args[1]);
		if (!parseNumber(text, options.arcRatio) || !isRatio(options.arcRatio)) {
			return fail(ParseStatus::InvalidArcRatio, std::format("Invalid parameter: {}\nShould be a number between 0 and 1.", text));
		}
	}

	if (args.size() > 2u) {
		const std::string_view text = trim(args[2]);
		if (!parseNumber(text, options.jitterRatio) || !isRatio(options.jitterRatio)) {
			return fail(ParseStatus::InvalidJitterRatio, std::format("Invalid parameter: {}\nShould be a number between 0 and 1.", text));
		}
	}

	if (args.size() > 3u) {
		if (!parseTactic(args[3], options.tactic)) {
			return fail(ParseStatus::InvalidTactic, std::format("Invalid parameter: {}\nShould be one of [ANGLE, RADIUS].", trim(args[3])));
		}
	}

	return {ParseStatus::Ok, options, {}};
}

std::string usage(const std::string& programName) {
	return std::format("\nUsage:\n {} [NUMBER_OF_POINTS_IN_CIRCLE] [RATIO_OF_POINTS_DISPLAYED] [RATIO_OF_JITTER] [RADIUS/ANGLE]\n", programName);
}

int toExitCode(const core::FitStatus status) {
	switch (status) {
	case core::FitStatus::Ok:
		return static_cast<int>(ExitCode::Success);
	case core::FitStatus::InsufficientPoints:
		return static_cast<int>(ExitCode::InsufficientPoints);
	case core::FitStatus::DegenerateSegment:
		return static_cast<int>(ExitCode::DegenerateSegment);
	case core::FitStatus::InvalidScanRange:
		return static_cast<int>(ExitCode::InvalidScanRange);
	case core::FitStatus::NotConverged:
		return static_cast<int>(ExitCode::NotConverged);
	}
	return static_cast<int>(ExitCode::InvalidArguments);
}

} // namespace arcfit::cli
