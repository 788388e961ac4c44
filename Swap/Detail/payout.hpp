#ifndef SWAP_DETAIL_PAYOUT_HPP
#define SWAP_DETAIL_PAYOUT_HPP

#include"Swap/Effect.hpp"
#include"Swap/Slot.hpp"
#include<vector>

namespace Swap { struct Config; }
namespace Swap { struct Instance; }

namespace Swap { namespace Detail {

/* Appends a transfer unless the amount is zero.  */
void pay( std::vector<Effect>& effects
	, AccountId const& account
	, PartyId const& from
	, PartyId const& to
	, Amount amount
	, Effect::Purpose purpose
	);

/* The collateral posted by `from`, sent from its escrow
 * to the owner of slot `to`.  */
void pay_collateral( std::vector<Effect>& effects
		   , Instance const& inst
		   , Config const& config
		   , Slot from
		   , Slot to
		   , Effect::Purpose purpose
		   );

/* The deposit declared by `from`, sent from its escrow
 * to the owner of slot `to`.  */
void pay_deposit( std::vector<Effect>& effects
		, Instance const& inst
		, Slot from
		, Slot to
		, Effect::Purpose purpose
		);

}}

#endif /* !defined(SWAP_DETAIL_PAYOUT_HPP) */
