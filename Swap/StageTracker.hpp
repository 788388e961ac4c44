#ifndef SWAP_STAGETRACKER_HPP
#define SWAP_STAGETRACKER_HPP

#include"Swap/Slot.hpp"
#include"Swap/Stage.hpp"

namespace Swap {

/** class Swap::StageTracker
 *
 * @brief global stage of a swap plus a completion flag
 * per party.
 *
 * @desc The stage advances by exactly one edge when
 * both parties have completed the current stage, and
 * both flags are cleared on every advance.
 * Apart from `reset` there is no way to move the stage
 * other than along `next_stage`.
 */
class StageTracker {
private:
	Stage current;
	bool done[2];

public:
	StageTracker() : current(ReadyToStart), done{false, false} { }

	Stage stage() const { return current; }
	bool completed(Slot s) const { return done[s]; }

	/* ReadyToStart -> Started.
	 * Throws std::logic_error from any other stage.  */
	void start();

	/* Set the flag of the given party.
	 * Returns true if that made the stage advance.
	 * Throws std::logic_error from ReadyToStart and
	 * Executed, where completion means nothing.  */
	bool record_completion(Slot);

	/* Back to ReadyToStart with both flags clear.  */
	void reset();

	/* Rebuild a tracker from stored columns, throwing
	 * std::invalid_argument for combinations that the
	 * tracker could never be in.  */
	static
	StageTracker restore(Stage, bool done_a, bool done_b);

	bool operator==(StageTracker const& o) const {
		return current == o.current
		    && done[0] == o.done[0]
		    && done[1] == o.done[1]
		     ;
	}
	bool operator!=(StageTracker const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(SWAP_STAGETRACKER_HPP) */
