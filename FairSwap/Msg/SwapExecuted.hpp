#ifndef FAIRSWAP_MSG_SWAPEXECUTED_HPP
#define FAIRSWAP_MSG_SWAPEXECUTED_HPP

#include"Swap/PartyId.hpp"
#include"Swap/Terms.hpp"
#include"Uuid.hpp"

namespace FairSwap { namespace Msg {

/** struct FairSwap::Msg::SwapExecuted
 *
 * @brief broadcast once per party, when that party has
 * received the other side of the exchange.
 */
struct SwapExecuted {
	Uuid id;
	Swap::PartyId party;
	Swap::Terms received;
};

}}

#endif /* !defined(FAIRSWAP_MSG_SWAPEXECUTED_HPP) */
