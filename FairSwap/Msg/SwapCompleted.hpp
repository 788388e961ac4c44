#ifndef FAIRSWAP_MSG_SWAPCOMPLETED_HPP
#define FAIRSWAP_MSG_SWAPCOMPLETED_HPP

#include"Uuid.hpp"

namespace FairSwap { namespace Msg {

/** struct FairSwap::Msg::SwapCompleted
 *
 * @brief broadcast after both parties have finalized and
 * the swap instance is closed.
 */
struct SwapCompleted {
	Uuid id;
};

}}

#endif /* !defined(FAIRSWAP_MSG_SWAPCOMPLETED_HPP) */
