#ifndef SWAP_TERMSBOOK_HPP
#define SWAP_TERMSBOOK_HPP

#include"Swap/Slot.hpp"
#include"Swap/Terms.hpp"

namespace Swap {

/** class Swap::TermsBook
 *
 * @brief per-party terms of one swap instance.
 *
 * @desc An entry can be set once; only `clear` undoes
 * it.
 */
class TermsBook {
private:
	Terms entries[2];

public:
	Terms const& operator[](Slot s) const { return entries[s]; }
	bool is_set(Slot s) const { return !!entries[s].account; }

	/* Throws Swap::TermsAlreadySet if the slot already
	 * has an account, and Swap::PreconditionViolation if
	 * the given account is none.  */
	void set(Slot, Terms);

	void clear(Slot s) { entries[s] = Terms(); }
	void clear() {
		clear(SlotA);
		clear(SlotB);
	}

	/* Used when loading from the database; skips the
	 * set-once check.  */
	void restore(Slot s, Terms t) { entries[s] = std::move(t); }

	bool operator==(TermsBook const& o) const {
		return entries[0] == o.entries[0]
		    && entries[1] == o.entries[1]
		     ;
	}
	bool operator!=(TermsBook const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(SWAP_TERMSBOOK_HPP) */
