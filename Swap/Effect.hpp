#ifndef SWAP_EFFECT_HPP
#define SWAP_EFFECT_HPP

#include"Swap/AccountId.hpp"
#include"Swap/Amount.hpp"
#include"Swap/PartyId.hpp"

namespace Swap {

/** struct Swap::Effect
 *
 * @brief one ledger transfer a transition asks for.
 *
 * @desc Effects are computed while the instance is
 * validated and executed by the daemon only after the
 * new instance state is committed.
 */
struct Effect {
	/* Persisted in the event log; do not change the
	 * numbers.  */
	enum Purpose {
		AssetDelivery = 0,
		CollateralRefund = 1,
		CollateralForfeit = 2,
		DepositReturn = 3,
		ExcessReturn = 4,
		Reclaim = 5
	};

	AccountId account;
	PartyId from;
	PartyId to;
	Amount amount;
	Purpose purpose;

	bool operator==(Effect const& o) const {
		return account == o.account
		    && from == o.from
		    && to == o.to
		    && amount == o.amount
		    && purpose == o.purpose
		     ;
	}
};

char const* purpose_name(Effect::Purpose);

}

#endif /* !defined(SWAP_EFFECT_HPP) */
