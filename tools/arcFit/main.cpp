#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <QApplication>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "arcfit/cli/options.hpp"
#include "arcfit/core/statistics.hpp"
#include "arcfit/synthetic/arcGenerator.hpp"
#include "fitSession.hpp"
#include "mainWindow.hpp"

namespace arcfit {

//! Radius of the generated circle. Its center is drawn from [-radius, radius).
static constexpr double GENERATED_RADIUS = 10.0;

//! Fixed generator seed from ARCFIT_SEED, otherwise a time based one.
static std::uint64_t chooseSeed() {
	const char* env = std::getenv("ARCFIT_SEED");
	if (env != nullptr) {
		char* end                     = nullptr;
		const unsigned long long seed = std::strtoull(env, &end, 10);
		if (end != env && *end == '\0') {
			return static_cast<std::uint64_t>(seed);
		}
		std::cerr << "Ignoring invalid ARCFIT_SEED: " << env << '\n';
	}
	return static_cast<std::uint64_t>(cv::getTickCount());
}

static std::string formatPoint(const cv::Point2d& p) {
	return std::format("({:.6f}, {:.6f})", p.x, p.y);
}

static std::string statusText(const core::FitOutcome& outcome, const core::PointSequence& points) {
	if (outcome.result.status != core::FitStatus::Ok) {
		return std::format("Fit failed: {}", core::toString(outcome.result.status));
	}
	const double radius = core::averageRadius(outcome.result.center, points).value_or(0.0);
	return std::format("center {}  radius {:.4f}  score {:.3g}  levels {}", formatPoint(outcome.result.center), radius, outcome.result.score,
	                   outcome.iterations);
}

} // namespace arcfit

int main(int argc, char** argv) {
	using namespace arcfit;

	const std::string programName = argc > 0 ? argv[0] : "arcFit";
	const std::vector<std::string> args(argv + std::min(argc, 1), argv + argc);

	const cli::ParseResult parsed = cli::parseArguments(args);
	if (parsed.status != cli::ParseStatus::Ok) {
		std::cerr << parsed.message << '\n' << cli::usage(programName);
		return static_cast<int>(cli::ExitCode::InvalidArguments);
	}
	const cli::Options& options = parsed.options;

	cv::RNG rng(chooseSeed());

	synthetic::ArcShape shape{};
	shape.center      = synthetic::randomCenter(GENERATED_RADIUS, rng);
	shape.radius      = GENERATED_RADIUS;
	shape.numPoints   = options.numPoints;
	shape.jitterRatio = options.jitterRatio;

	core::PointSequence points = synthetic::truncateToArc(synthetic::generateCircle(shape, rng), options.arcRatio);

	std::cout << "Using " << core::toString(options.tactic) << " to determine best fit.\n";
	std::cout << "Number of points in generated circle: " << options.numPoints << '\n';
	std::cout << "Ratio of circle to use: " << options.arcRatio << "  ie: " << points.size() << " points\n";
	std::cout << "Ratio of distance between points to perturb coordinates by: " << options.jitterRatio << '\n';
	std::cout << "Radius of generated circle: " << shape.radius << '\n';
	std::cout << "Center of generated circle: " << formatPoint(shape.center) << "\n\n";

	FitSession session(std::move(points), shape.center, shape.radius);
	const core::FitOutcome& outcome = session.fit(options.tactic);
	if (outcome.result.status != core::FitStatus::Ok) {
		std::cerr << "[Error] Could not fit a circle: " << core::toString(outcome.result.status) << '\n';
		return cli::toExitCode(outcome.result.status);
	}

	const double fittedRadius = core::averageRadius(outcome.result.center, session.points()).value_or(0.0);
	std::cout << "Calculated center: " << formatPoint(outcome.result.center) << '\n';
	std::cout << "Calculated radius: " << std::format("{:.6f}", fittedRadius) << '\n';
	std::cout << "Residual score: " << outcome.result.score << " after " << outcome.iterations << " levels\n";

	// Headless mode: write the plot and quit.
	const char* outputPath = std::getenv("ARCFIT_OUTPUT");
	if (outputPath != nullptr && std::string_view(outputPath).size() > 0u) {
		if (!cv::imwrite(outputPath, session.render(ViewStep::Result))) {
			std::cerr << "[Error] Could not write plot to " << outputPath << '\n';
			return static_cast<int>(cli::ExitCode::OutputFailed);
		}
		std::cout << "Plot written to " << outputPath << '\n';
		return static_cast<int>(cli::ExitCode::Success);
	}

	QApplication application(argc, argv);

	MainWindow window;
	window.resize(1000, 900);
	window.selectTactic(options.tactic);
	window.setStatusText(QString::fromStdString(statusText(outcome, session.points())));
	window.setImage(session.render(window.selectedViewStep()));

	window.setViewStepChangedCallback([&](const ViewStep step) { window.setImage(session.render(step)); });
	window.setTacticChangedCallback([&](const core::Tactic tactic) {
		const core::FitOutcome& refit = session.fit(tactic);
		window.setStatusText(QString::fromStdString(statusText(refit, session.points())));
		window.setImage(session.render(window.selectedViewStep()));
	});

	window.show();
	return application.exec();
}
