#ifndef FAIRSWAP_MSG_DEPOSITCONFIRMED_HPP
#define FAIRSWAP_MSG_DEPOSITCONFIRMED_HPP

#include"Swap/Amount.hpp"
#include"Swap/PartyId.hpp"
#include"Uuid.hpp"

namespace FairSwap { namespace Msg {

/** struct FairSwap::Msg::DepositConfirmed
 *
 * @brief broadcast when the ledger shows a party's full
 * deposit in escrow.
 */
struct DepositConfirmed {
	Uuid id;
	Swap::PartyId party;
	/* Returned to the party because it deposited more
	 * than its declared quantity.  */
	Swap::Amount excess;
};

}}

#endif /* !defined(FAIRSWAP_MSG_DEPOSITCONFIRMED_HPP) */
