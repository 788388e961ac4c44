#ifndef SWAP_TERMS_HPP
#define SWAP_TERMS_HPP

#include"Swap/AccountId.hpp"
#include"Swap/Amount.hpp"

namespace Swap {

/* What one party puts into the swap: `quantity` units
 * on `account`.  An unset entry has no account and zero
 * quantity.  */
struct Terms {
	AccountId account;
	Amount quantity;

	bool operator==(Terms const& o) const {
		return account == o.account && quantity == o.quantity;
	}
	bool operator!=(Terms const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(SWAP_TERMS_HPP) */
