#ifndef SWAP_PARTIES_HPP
#define SWAP_PARTIES_HPP

#include"Swap/PartyId.hpp"
#include"Swap/Slot.hpp"

namespace Swap {

/** class Swap::Parties
 *
 * @brief the two identities bound to a swap instance.
 *
 * @desc Slot A is the initiator, slot B the
 * counterparty.
 * A default-constructed `Parties` (both sentinel) is
 * what a closed or never-started instance holds before
 * `create`.
 */
class Parties {
private:
	PartyId a;
	PartyId b;

public:
	Parties() =default;
	Parties(Parties const&) =default;
	Parties& operator=(Parties const&) =default;

	/* Throws Swap::InvalidParty if either is the
	 * sentinel or both are the same.  */
	Parties(PartyId initiator, PartyId counterparty);

	PartyId const& operator[](Slot s) const {
		return s == SlotA ? a : b;
	}
	PartyId const& initiator() const { return a; }
	PartyId const& counterparty() const { return b; }

	bool is_party(PartyId const&) const;
	/* Pre-condition: is_party(p).  */
	Slot slot_of(PartyId const& p) const;
	/* The counterpart of p, or the sentinel if p is not
	 * one of the two.  */
	PartyId other(PartyId const& p) const;

	bool operator==(Parties const& o) const {
		return a == o.a && b == o.b;
	}
	bool operator!=(Parties const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(SWAP_PARTIES_HPP) */
