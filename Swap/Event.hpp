#ifndef SWAP_EVENT_HPP
#define SWAP_EVENT_HPP

#include"Swap/PartyId.hpp"

namespace Swap {

/* A notification a transition produces.  `party` is
 * the party the event is about, or the sentinel for
 * instance-wide events.  */
struct Event {
	enum Kind {
		SwapStarted,
		TermsSet,
		TermsAccepted,
		DepositConfirmed,
		Executed,
		Cancelled,
		Completed,
		Overridden,
		Reclaimed
	};
	Kind kind;
	PartyId party;
};

char const* event_name(Event::Kind);

}

#endif /* !defined(SWAP_EVENT_HPP) */
