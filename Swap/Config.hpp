#ifndef SWAP_CONFIG_HPP
#define SWAP_CONFIG_HPP

#include"Swap/AccountId.hpp"
#include"Swap/PartyId.hpp"

namespace Swap {

/** struct Swap::Config
 *
 * @brief deployment settings of the coordinator.
 *
 * @desc Delays are in seconds, measured from the swap
 * start time.
 */
struct Config {
	/* The only caller allowed to manual_override.
	 * None means nobody can.  */
	PartyId admin;
	double cancel_delay;
	double override_delay;
	/* Ledger account on which collateral is posted.  */
	AccountId collateral_account;

	Config() : cancel_delay(86400)
		 , override_delay(604800)
		 , collateral_account("collateral")
		 { }

	/* Throws std::invalid_argument unless both delays
	 * are non-negative, the override delay exceeds the
	 * cancel delay, and a collateral account is named.  */
	void validate() const;
};

}

#endif /* !defined(SWAP_CONFIG_HPP) */
