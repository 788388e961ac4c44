#ifndef SWAP_INSTANCE_HPP
#define SWAP_INSTANCE_HPP

#include"Swap/Amount.hpp"
#include"Swap/Parties.hpp"
#include"Swap/StageTracker.hpp"
#include"Swap/TermsBook.hpp"
#include"Uuid.hpp"

namespace Swap {

/* Why an instance left the protocol.
 * Persisted; do not change the numbers.  */
enum CloseReason {
	NotClosed = 0,
	ClosedExecuted = 1,
	ClosedCancelled = 2,
	ClosedOverridden = 3
};

char const* close_reason_name(CloseReason);
CloseReason close_reason_from_int(int);

/** struct Swap::Instance
 *
 * @brief the complete state of one swap.
 *
 * @desc A plain value: `Swap::Coordinator` computes new
 * values from old ones and the daemon persists them by
 * `id`.
 * After reset the stage is ReadyToStart again and
 * `closed` says why; the parties and collateral are
 * kept for audit and for reclaiming escrow leftovers.
 */
struct Instance {
	Uuid id;
	Parties parties;
	Amount collateral;
	double start_time = 0;
	double accepted_time = 0;
	StageTracker tracker;
	TermsBook terms;
	CloseReason closed = NotClosed;

	Stage stage() const { return tracker.stage(); }
	/* Created and not yet closed.  */
	bool open() const { return tracker.stage() != ReadyToStart; }

	/* Back to ReadyToStart, terms and flags cleared.  */
	void reset(CloseReason why) {
		tracker.reset();
		terms.clear();
		closed = why;
	}
};

/* Ledger holder that keeps a party's collateral and
 * deposits while the swap runs, e.g.
 * "escrow:<32 hex digits>:a".  */
PartyId escrow_holder(Uuid const&, Slot);

}

#endif /* !defined(SWAP_INSTANCE_HPP) */
