#ifndef FAIRSWAP_MSG_ESCROWRECLAIMED_HPP
#define FAIRSWAP_MSG_ESCROWRECLAIMED_HPP

#include"Swap/AccountId.hpp"
#include"Swap/Amount.hpp"
#include"Swap/PartyId.hpp"
#include"Uuid.hpp"

namespace FairSwap { namespace Msg {

/** struct FairSwap::Msg::EscrowReclaimed
 *
 * @brief broadcast when a party withdraws escrow left
 * over in a closed swap.
 */
struct EscrowReclaimed {
	Uuid id;
	Swap::PartyId party;
	Swap::AccountId account;
	Swap::Amount amount;
};

}}

#endif /* !defined(FAIRSWAP_MSG_ESCROWRECLAIMED_HPP) */
