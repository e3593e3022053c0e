#include "arcfit/cli/options.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

namespace arcfit::cli {
namespace gtest {

TEST(Options, Defaults_Without_Arguments) {
	const ParseResult result = parseArguments({});
	ASSERT_EQ(result.status, ParseStatus::Ok);
	EXPECT_EQ(result.options.numPoints, 50);
	EXPECT_DOUBLE_EQ(result.options.arcRatio, 0.3);
	EXPECT_DOUBLE_EQ(result.options.jitterRatio, 0.05);
	EXPECT_EQ(result.options.tactic, core::Tactic::Radius);
}

TEST(Options, All_Positional_Arguments) {
	const ParseResult result = parseArguments({"90", "0.5", "1", "angle"});
	ASSERT_EQ(result.status, ParseStatus::Ok);
	EXPECT_EQ(result.options.numPoints, 90);
	EXPECT_DOUBLE_EQ(result.options.arcRatio, 0.5);
	EXPECT_DOUBLE_EQ(result.options.jitterRatio, 1.0);
	EXPECT_EQ(result.options.tactic, core::Tactic::Angle);
	EXPECT_TRUE(result.message.empty());
}

TEST(Options, Partial_Arguments_Keep_Defaults) {
	const ParseResult result = parseArguments({" 12 ", "1.0"});
	ASSERT_EQ(result.status, ParseStatus::Ok);
	EXPECT_EQ(result.options.numPoints, 12);
	EXPECT_DOUBLE_EQ(result.options.arcRatio, 1.0);
	EXPECT_DOUBLE_EQ(result.options.jitterRatio, 0.05);
	EXPECT_EQ(result.options.tactic, core::Tactic::Radius);
}

TEST(Options, Tactic_Is_Case_Insensitive) {
	core::Tactic tactic{};
	EXPECT_TRUE(parseTactic("ANGLE", tactic));
	EXPECT_EQ(tactic, core::Tactic::Angle);
	EXPECT_TRUE(parseTactic(" Radius\t", tactic));
	EXPECT_EQ(tactic, core::Tactic::Radius);
	EXPECT_TRUE(parseTactic("aNgLe", tactic));
	EXPECT_EQ(tactic, core::Tactic::Angle);

	EXPECT_FALSE(parseTactic("", tactic));
	EXPECT_FALSE(parseTactic("circle", tactic));
	EXPECT_FALSE(parseTactic("1", tactic));
}

TEST(Options, Invalid_Point_Count) {
	for (const std::string arg: {"0", "-4", "abc", "5.5", "", "12x"}) {
		const ParseResult result = parseArguments({arg});
		EXPECT_EQ(result.status, ParseStatus::InvalidPointCount) << arg;
		EXPECT_NE(result.message.find("positive integer"), std::string::npos);
	}
}

TEST(Options, Invalid_Ratios) {
	for (const std::string arg: {"0", "-0.1", "1.01", "x", "nan", "inf"}) {
		EXPECT_EQ(parseArguments({"50", arg}).status, ParseStatus::InvalidArcRatio) << arg;
		EXPECT_EQ(parseArguments({"50", "0.3", arg}).status, ParseStatus::InvalidJitterRatio) << arg;
	}
}

TEST(Options, Invalid_Tactic) {
	const ParseResult result = parseArguments({"50", "0.3", "0.05", "diameter"});
	EXPECT_EQ(result.status, ParseStatus::InvalidTactic);
	EXPECT_NE(result.message.find("diameter"), std::string::npos);
}

TEST(Options, Too_Many_Arguments) {
	const ParseResult result = parseArguments({"50", "0.3", "0.05", "RADIUS", "extra"});
	EXPECT_EQ(result.status, ParseStatus::TooManyArguments);
	EXPECT_EQ(result.message, "Too many arguments.");
}

TEST(Options, Usage_Names_Program) {
	const std::string text = usage("arcFit");
	EXPECT_NE(text.find("arcFit"), std::string::npos);
	EXPECT_NE(text.find("[RADIUS/ANGLE]"), std::string::npos);
}

TEST(Options, Exit_Codes_Are_Distinct) {
	EXPECT_EQ(toExitCode(core::FitStatus::Ok), 0);

	const std::set<int> codes{
	        static_cast<int>(ExitCode::InvalidArguments),
	        toExitCode(core::FitStatus::InsufficientPoints),
	        toExitCode(core::FitStatus::DegenerateSegment),
	        toExitCode(core::FitStatus::InvalidScanRange),
	        toExitCode(core::FitStatus::NotConverged),
	        static_cast<int>(ExitCode::OutputFailed),
	};
	EXPECT_EQ(codes.size(), 6u);
	EXPECT_EQ(codes.count(0), 0u);
}

TEST(Options, Not_Converged_Exit_Code) {
	EXPECT_EQ(toExitCode(core::FitStatus::NotConverged), static_cast<int>(ExitCode::NotConverged));
	EXPECT_EQ(toExitCode(core::FitStatus::NotConverged), 7);
}

} // namespace gtest
} // namespace arcfit::cli
