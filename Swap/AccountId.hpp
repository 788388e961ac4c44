#ifndef SWAP_ACCOUNTID_HPP
#define SWAP_ACCOUNTID_HPP

#include<cstddef>
#include<functional>
#include<iostream>
#include<string>

namespace Swap {

/** class Swap::AccountId
 *
 * @brief opaque label naming an asset account on the ledger.
 *
 * @desc Default-constructed means "none", which is
 * what an unset terms entry holds.
 */
class AccountId {
private:
	std::string label;

public:
	AccountId() =default;
	AccountId(AccountId const&) =default;
	AccountId(AccountId&&) =default;
	AccountId& operator=(AccountId const&) =default;
	AccountId& operator=(AccountId&&) =default;
	~AccountId() =default;

	/* Throws std::invalid_argument if !valid_string.  */
	explicit
	AccountId(std::string const&);
	static
	bool valid_string(std::string const&);

	explicit
	operator std::string() const { return label; }

	explicit
	operator bool() const { return !label.empty(); }
	bool operator!() const { return label.empty(); }

	bool operator==(AccountId const& o) const {
		return label == o.label;
	}
	bool operator!=(AccountId const& o) const {
		return !(*this == o);
	}
	bool operator<(AccountId const& o) const {
		return label < o.label;
	}

	std::size_t hash() const {
		return std::hash<std::string>()(label);
	}
};

std::ostream& operator<<(std::ostream&, AccountId const&);

}

namespace std {

template<>
struct hash<Swap::AccountId> {
	std::size_t operator()(Swap::AccountId const& i) const {
		return i.hash();
	}
};

}

#endif /* !defined(SWAP_ACCOUNTID_HPP) */
