#include "arcfit/core/types.hpp"

namespace arcfit::core {

const char* toString(const Tactic tactic) {
	switch (tactic) {
	case Tactic::Angle:
		return "ANGLE";
	case Tactic::Radius:
		return "RADIUS";
	}
	return "UNKNOWN";
}

const char* toString(const FitStatus status) {
	switch (status) {
	case FitStatus::Ok:
		return "Ok";
	case FitStatus::InsufficientPoints:
		return "InsufficientPoints";
	case FitStatus::DegenerateSegment:
		return "DegenerateSegment";
	case FitStatus::InvalidScanRange:
		return "InvalidScanRange";
	case FitStatus::NotConverged:
		return "NotConverged";
	}
	return "Unknown";
}

std::size_t minimumPoints(const Tactic tactic) {
	return tactic == Tactic::Angle ? 2u : 1u;
}

} // namespace arcfit::core
