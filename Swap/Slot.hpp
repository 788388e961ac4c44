#ifndef SWAP_SLOT_HPP
#define SWAP_SLOT_HPP

namespace Swap {

/* Which side of a swap a party sits on.
 * A is the initiator, B the counterparty.
 * Persisted; do not change the numbers.  */
enum Slot {
	SlotA = 0,
	SlotB = 1
};

inline
Slot other_slot(Slot s) {
	return s == SlotA ? SlotB : SlotA;
}

}

#endif /* !defined(SWAP_SLOT_HPP) */
