#ifndef FAIRSWAP_DBLEDGER_HPP
#define FAIRSWAP_DBLEDGER_HPP

#include"Swap/LedgerIF.hpp"
#include<memory>

namespace S { class Bus; }

namespace FairSwap {

/** class FairSwap::DbLedger
 *
 * @brief demonstration asset ledger kept in the
 * `"FairSwap_ledger"` table of the daemon database.
 *
 * @desc Balances are per (account, holder) pair.
 * `transfer` passes false, moving nothing, if the
 * source holds less than the amount.
 * The db arrives by `FairSwap::Msg::DbResource`;
 * calling any operation before that throws.
 */
class DbLedger : public Swap::LedgerIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	DbLedger() =delete;
	DbLedger(DbLedger const&) =delete;

	explicit
	DbLedger(S::Bus& bus);
	DbLedger(DbLedger&&);
	~DbLedger();

	/* Mint `amount` new units to `holder`.  */
	Ev::Io<void> credit( Swap::AccountId const& account
			   , Swap::PartyId const& holder
			   , Swap::Amount amount
			   );

	Ev::Io<Swap::Amount> balance( Swap::AccountId const& account
				    , Swap::PartyId const& holder
				    ) override;
	Ev::Io<bool> transfer( Swap::AccountId const& account
			     , Swap::PartyId const& from
			     , Swap::PartyId const& to
			     , Swap::Amount amount
			     ) override;
};

}

#endif /* !defined(FAIRSWAP_DBLEDGER_HPP) */
