#ifndef SWAP_COORDINATOR_HPP
#define SWAP_COORDINATOR_HPP

#include"Swap/AccountId.hpp"
#include"Swap/Amount.hpp"
#include"Swap/Config.hpp"
#include"Swap/Outcome.hpp"
#include"Swap/PartyId.hpp"
#include<memory>

namespace Swap { struct Instance; }
namespace Swap { class OverrideIF; }

namespace Swap {

/** class Swap::Coordinator
 *
 * @brief the swap protocol as pure transitions on
 * `Swap::Instance` values.
 *
 * @desc Each operation checks everything first and
 * throws a `Swap::Error` without touching the instance
 * if any check fails.
 * On success the instance is updated in place and the
 * returned `Swap::Outcome` lists the ledger transfers
 * to make and the notifications to raise.
 * The coordinator never talks to the ledger itself:
 * the caller persists the updated instance and only
 * then executes the effects, so a transfer that
 * re-enters the protocol sees the new state.
 *
 * Times are seconds, as from `Ev::now`, and are always
 * passed in by the caller.
 */
class Coordinator {
private:
	Config config;
	std::shared_ptr<OverrideIF const> override_policy;

public:
	Coordinator() =delete;
	/* Throws std::invalid_argument if the config does not
	 * validate or there is no override policy.  */
	Coordinator( Config config
		   , std::shared_ptr<OverrideIF const> override_policy
		   );

	Config const& get_config() const { return config; }

	/* Bind two parties to a fresh instance.
	 * `inst.id` must already be set.  */
	Outcome create( Instance& inst
		      , PartyId const& initiator
		      , PartyId const& counterparty
		      , Amount collateral
		      , double now
		      ) const;
	Outcome set_terms( Instance& inst
			 , PartyId const& caller
			 , AccountId const& account
			 , Amount quantity
			 ) const;
	/* `value` is what the caller has posted as
	 * collateral, i.e. its escrow balance on the
	 * collateral account.  */
	Outcome accept_terms( Instance& inst
			    , PartyId const& caller
			    , Amount value
			    , double now
			    ) const;
	/* `balance` is the caller's escrow balance on its
	 * declared account.  */
	Outcome confirm_deposit( Instance& inst
			       , PartyId const& caller
			       , Amount balance
			       ) const;
	Outcome request_final_transfer( Instance& inst
				      , PartyId const& caller
				      ) const;
	Outcome cancel( Instance& inst
		      , PartyId const& caller
		      , double now
		      ) const;
	Outcome manual_override( Instance& inst
			       , PartyId const& caller
			       , double now
			       ) const;
	/* Sweep what is left in the caller's escrow on
	 * `account` once the instance is closed.
	 * `balance` is that escrow balance.  */
	Outcome reclaim( Instance const& inst
		       , PartyId const& caller
		       , AccountId const& account
		       , Amount balance
		       ) const;

	/* Counterpart of `p`, or the sentinel.  */
	static
	PartyId other_party(Instance const& inst, PartyId const& p);
};

}

#endif /* !defined(SWAP_COORDINATOR_HPP) */
