#include"Swap/Stage.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace {

struct Edge {
	Swap::Stage from;
	Swap::Stage to;
};
Edge const transitions[] =
{ {Swap::ReadyToStart, Swap::Started}
, {Swap::Started, Swap::TermsSet}
, {Swap::TermsSet, Swap::TermsAccepted}
, {Swap::TermsAccepted, Swap::DepositConfirmed}
, {Swap::DepositConfirmed, Swap::Executed}
};

}

namespace Swap {

Stage next_stage(Stage s) {
	for (auto const& e : transitions)
		if (e.from == s)
			return e.to;
	throw Util::BacktraceException<std::logic_error>(
		std::string("Swap::next_stage: no edge out of ") +
		stage_name(s)
	);
}

Stage stage_from_int(int i) {
	if (i < int(ReadyToStart) || i > int(Executed))
		throw std::out_of_range(
			"Swap::stage_from_int: " + std::to_string(i)
		);
	return Stage(i);
}

char const* stage_name(Stage s) {
	switch (s) {
	case ReadyToStart: return "ready_to_start";
	case Started: return "started";
	case TermsSet: return "terms_set";
	case TermsAccepted: return "terms_accepted";
	case DepositConfirmed: return "deposit_confirmed";
	case Executed: return "executed";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& os, Stage s) {
	return os << stage_name(s);
}

}
