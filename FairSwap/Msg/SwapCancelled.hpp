#ifndef FAIRSWAP_MSG_SWAPCANCELLED_HPP
#define FAIRSWAP_MSG_SWAPCANCELLED_HPP

#include"Swap/PartyId.hpp"
#include"Uuid.hpp"

namespace FairSwap { namespace Msg {

/** struct FairSwap::Msg::SwapCancelled
 *
 * @brief broadcast when a party cancels a swap.
 */
struct SwapCancelled {
	Uuid id;
	Swap::PartyId canceller;
};

}}

#endif /* !defined(FAIRSWAP_MSG_SWAPCANCELLED_HPP) */
