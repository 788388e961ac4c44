#ifndef SWAP_LEDGERIF_HPP
#define SWAP_LEDGERIF_HPP

#include"Swap/AccountId.hpp"
#include"Swap/Amount.hpp"
#include"Swap/PartyId.hpp"

namespace Ev { template<typename a> class Io; }

namespace Swap {

/** class Swap::LedgerIF
 *
 * @brief the asset ledger the coordinator moves funds
 * on.
 *
 * @desc The ledger is owned outside the coordinator.
 * `transfer` passes false if the ledger refuses (for
 * example not enough funds) and fails only for
 * breakage.
 * Implementations may re-enter the coordinator from
 * within `transfer`.
 */
class LedgerIF {
public:
	virtual ~LedgerIF() { }

	virtual
	Ev::Io<Amount> balance( AccountId const& account
			      , PartyId const& holder
			      ) =0;
	virtual
	Ev::Io<bool> transfer( AccountId const& account
			     , PartyId const& from
			     , PartyId const& to
			     , Amount amount
			     ) =0;
};

}

#endif /* !defined(SWAP_LEDGERIF_HPP) */
