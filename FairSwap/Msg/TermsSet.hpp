#ifndef FAIRSWAP_MSG_TERMSSET_HPP
#define FAIRSWAP_MSG_TERMSSET_HPP

#include"Swap/PartyId.hpp"
#include"Swap/Terms.hpp"
#include"Uuid.hpp"

namespace FairSwap { namespace Msg {

/** struct FairSwap::Msg::TermsSet
 *
 * @brief broadcast when a party declares what it puts
 * into the swap.
 */
struct TermsSet {
	Uuid id;
	Swap::PartyId party;
	Swap::Terms terms;
};

}}

#endif /* !defined(FAIRSWAP_MSG_TERMSSET_HPP) */
