#ifndef FAIRSWAP_MSG_SWAPSTARTED_HPP
#define FAIRSWAP_MSG_SWAPSTARTED_HPP

#include"Swap/Amount.hpp"
#include"Swap/PartyId.hpp"
#include"Uuid.hpp"

namespace FairSwap { namespace Msg {

/** struct FairSwap::Msg::SwapStarted
 *
 * @brief broadcast when a new swap instance binds its
 * two parties.
 */
struct SwapStarted {
	Uuid id;
	Swap::PartyId initiator;
	Swap::PartyId counterparty;
	Swap::Amount collateral;
};

}}

#endif /* !defined(FAIRSWAP_MSG_SWAPSTARTED_HPP) */
