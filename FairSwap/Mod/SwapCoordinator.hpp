#ifndef FAIRSWAP_MOD_SWAPCOORDINATOR_HPP
#define FAIRSWAP_MOD_SWAPCOORDINATOR_HPP

#include"Ev/now.hpp"
#include"Swap/AccountId.hpp"
#include"Swap/Amount.hpp"
#include"Swap/Config.hpp"
#include"Swap/PartyId.hpp"
#include<functional>
#include<memory>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }
namespace Swap { struct Instance; }
namespace Swap { class LedgerIF; }
namespace Swap { class OverrideIF; }
class Uuid;

namespace FairSwap { namespace Mod {

/** class FairSwap::Mod::SwapCoordinator
 *
 * @brief runs the swap protocol against the database
 * and the ledger.
 *
 * @desc Swap instances live in the `"FairSwap_swaps"`
 * table, keyed by their `Uuid`.
 * Every operation loads the instance, applies the
 * `Swap::Coordinator` transition and stores the result
 * in one transaction, and only after the commit makes
 * the ledger transfers and raises the notifications,
 * in that order.
 * A failed check throws a `Swap::Error` through the
 * returned action and leaves the stored instance as it
 * was.
 * A transfer the ledger refuses after the commit is
 * logged and raised as `FairSwap::Msg::TransferFailed`;
 * the operation itself still succeeds.
 *
 * The db arrives by `FairSwap::Msg::DbResource`.
 */
class SwapCoordinator {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	SwapCoordinator() =delete;

	SwapCoordinator(SwapCoordinator&&);
	~SwapCoordinator();

	SwapCoordinator( S::Bus& bus
		       , Swap::LedgerIF& ledger
		       , Swap::Config config
		       , std::shared_ptr<Swap::OverrideIF const> override_policy
		       , std::function<double()> get_now = &Ev::now
		       );

	Swap::Config const& get_config() const;

	/* Each passes the instance as stored afterwards.  */
	Ev::Io<Swap::Instance>
	create_swap( Swap::PartyId const& initiator
		   , Swap::PartyId const& counterparty
		   , Swap::Amount collateral
		   );
	Ev::Io<Swap::Instance>
	set_terms( Uuid const& id
		 , Swap::PartyId const& caller
		 , Swap::AccountId const& account
		 , Swap::Amount quantity
		 );
	/* The collateral is what the caller has credited to
	 * its escrow holder on the collateral account.  */
	Ev::Io<Swap::Instance>
	accept_terms(Uuid const& id, Swap::PartyId const& caller);
	/* The deposit is what the caller has credited to its
	 * escrow holder on its declared account.  */
	Ev::Io<Swap::Instance>
	confirm_deposit(Uuid const& id, Swap::PartyId const& caller);
	Ev::Io<Swap::Instance>
	request_final_transfer(Uuid const& id, Swap::PartyId const& caller);
	Ev::Io<Swap::Instance>
	cancel(Uuid const& id, Swap::PartyId const& caller);
	Ev::Io<Swap::Instance>
	manual_override(Uuid const& id, Swap::PartyId const& caller);

	/* Passes the amount swept back to the caller.  */
	Ev::Io<Swap::Amount>
	reclaim( Uuid const& id
	       , Swap::PartyId const& caller
	       , Swap::AccountId const& account
	       );

	/* Throws Swap::UnknownSwap if absent.  */
	Ev::Io<Swap::Instance> review(Uuid const& id);
	/* All instances, oldest first.  */
	Ev::Io<std::vector<Swap::Instance>> list();
};

}}

#endif /* !defined(FAIRSWAP_MOD_SWAPCOORDINATOR_HPP) */
