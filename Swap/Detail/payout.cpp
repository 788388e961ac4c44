#include"Swap/Config.hpp"
#include"Swap/Detail/payout.hpp"
#include"Swap/Instance.hpp"

namespace Swap { namespace Detail {

void pay( std::vector<Effect>& effects
	, AccountId const& account
	, PartyId const& from
	, PartyId const& to
	, Amount amount
	, Effect::Purpose purpose
	) {
	if (!amount)
		return;
	effects.push_back(Effect{account, from, to, amount, purpose});
}

void pay_collateral( std::vector<Effect>& effects
		   , Instance const& inst
		   , Config const& config
		   , Slot from
		   , Slot to
		   , Effect::Purpose purpose
		   ) {
	pay( effects
	   , config.collateral_account
	   , escrow_holder(inst.id, from)
	   , inst.parties[to]
	   , inst.collateral
	   , purpose
	   );
}

void pay_deposit( std::vector<Effect>& effects
		, Instance const& inst
		, Slot from
		, Slot to
		, Effect::Purpose purpose
		) {
	auto const& t = inst.terms[from];
	if (!t.account)
		return;
	pay( effects
	   , t.account
	   , escrow_holder(inst.id, from)
	   , inst.parties[to]
	   , t.quantity
	   , purpose
	   );
}

}}
