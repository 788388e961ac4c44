#include"Swap/Instance.hpp"
#include<stdexcept>

namespace Swap {

char const* close_reason_name(CloseReason r) {
	switch (r) {
	case NotClosed: return "open";
	case ClosedExecuted: return "executed";
	case ClosedCancelled: return "cancelled";
	case ClosedOverridden: return "overridden";
	}
	return "unknown";
}

CloseReason close_reason_from_int(int i) {
	if (i < int(NotClosed) || i > int(ClosedOverridden))
		throw std::out_of_range(
			"Swap::close_reason_from_int: " + std::to_string(i)
		);
	return CloseReason(i);
}

PartyId escrow_holder(Uuid const& id, Slot s) {
	return PartyId( "escrow:" + std::string(id)
		      + (s == SlotA ? ":a" : ":b")
		      );
}

}
