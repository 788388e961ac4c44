#ifndef FAIRSWAP_MSG_TRANSFERFAILED_HPP
#define FAIRSWAP_MSG_TRANSFERFAILED_HPP

#include"Swap/Effect.hpp"
#include"Uuid.hpp"
#include<string>

namespace FairSwap { namespace Msg {

/** struct FairSwap::Msg::TransferFailed
 *
 * @brief broadcast when the ledger refuses or fails a
 * transfer that a committed swap transition asked for.
 *
 * @desc The swap state is not rolled back; an operator
 * has to make the transfer good by hand.
 */
struct TransferFailed {
	Uuid id;
	Swap::Effect effect;
	std::string reason;
};

}}

#endif /* !defined(FAIRSWAP_MSG_TRANSFERFAILED_HPP) */
