#ifndef FAIRSWAP_MSG_TERMSACCEPTED_HPP
#define FAIRSWAP_MSG_TERMSACCEPTED_HPP

#include"Swap/PartyId.hpp"
#include"Uuid.hpp"

namespace FairSwap { namespace Msg {

/** struct FairSwap::Msg::TermsAccepted
 *
 * @brief broadcast when a party has posted its collateral
 * and accepted both terms.
 */
struct TermsAccepted {
	Uuid id;
	Swap::PartyId party;
	/* Whether this acceptance moved the swap to
	 * TermsAccepted.  */
	bool advanced;
};

}}

#endif /* !defined(FAIRSWAP_MSG_TERMSACCEPTED_HPP) */
