#ifndef SWAP_STAGE_HPP
#define SWAP_STAGE_HPP

#include<iostream>
#include<string>

namespace Swap {

/* Stages of a swap instance, in protocol order.
 * These numbers are persisted in the database; do not
 * change them.  */
enum Stage {
	ReadyToStart = 0,
	Started = 1,
	TermsSet = 2,
	TermsAccepted = 3,
	DepositConfirmed = 4,
	Executed = 5
};

/* The single forward edge out of a stage.
 * Throws std::logic_error for Executed, which only
 * leaves via reset.  */
Stage next_stage(Stage);

/* Converts a persisted number back to a Stage,
 * throwing std::out_of_range if it is not one.  */
Stage stage_from_int(int);

/* Lowercase name, e.g. "terms_accepted".  */
char const* stage_name(Stage);

std::ostream& operator<<(std::ostream&, Stage);

}

#endif /* !defined(SWAP_STAGE_HPP) */
