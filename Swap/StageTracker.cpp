#include"Swap/StageTracker.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace Swap {

void StageTracker::start() {
	if (current != ReadyToStart)
		throw Util::BacktraceException<std::logic_error>(
			std::string("Swap::StageTracker::start: at ") +
			stage_name(current)
		);
	current = next_stage(current);
	done[SlotA] = false;
	done[SlotB] = false;
}

bool StageTracker::record_completion(Slot s) {
	if (current == ReadyToStart || current == Executed)
		throw Util::BacktraceException<std::logic_error>(
			std::string("Swap::StageTracker::record_completion: "
				    "at ") +
			stage_name(current)
		);
	done[s] = true;
	if (!done[other_slot(s)])
		return false;

	current = next_stage(current);
	done[SlotA] = false;
	done[SlotB] = false;
	return true;
}

void StageTracker::reset() {
	current = ReadyToStart;
	done[SlotA] = false;
	done[SlotB] = false;
}

StageTracker StageTracker::restore(Stage s, bool done_a, bool done_b) {
	if (done_a && done_b)
		throw std::invalid_argument(
			"Swap::StageTracker::restore: both flags set"
		);
	if ((s == ReadyToStart || s == Executed) && (done_a || done_b))
		throw std::invalid_argument(
			std::string("Swap::StageTracker::restore: "
				    "flag set at ") +
			stage_name(s)
		);
	auto rv = StageTracker();
	rv.current = s;
	rv.done[SlotA] = done_a;
	rv.done[SlotB] = done_b;
	return rv;
}

}
