#ifndef FAIRSWAP_MSG_SWAPOVERRIDDEN_HPP
#define FAIRSWAP_MSG_SWAPOVERRIDDEN_HPP

#include"Swap/PartyId.hpp"
#include"Uuid.hpp"

namespace FairSwap { namespace Msg {

/** struct FairSwap::Msg::SwapOverridden
 *
 * @brief broadcast when the administrator overrides a
 * stuck swap.
 */
struct SwapOverridden {
	Uuid id;
	Swap::PartyId admin;
	/* Whether the override policy closed the swap.  */
	bool closed;
};

}}

#endif /* !defined(FAIRSWAP_MSG_SWAPOVERRIDDEN_HPP) */
