#ifndef SWAP_AMOUNT_HPP
#define SWAP_AMOUNT_HPP

#include<cstdint>
#include<iostream>
#include<string>

namespace Swap {

/** class Swap::Amount
 *
 * @brief a whole-unit quantity of some ledger asset.
 *
 * @desc Arithmetic never wraps or saturates.
 * An addition past 2^64 - 1 throws `std::overflow_error`
 * and a subtraction below zero throws
 * `std::underflow_error`.
 */
class Amount {
private:
	std::uint64_t v;

public:
	Amount() : v(0) { }
	Amount(Amount const&) =default;
	Amount& operator=(Amount const&) =default;
	~Amount() =default;

	static
	Amount units(std::uint64_t v) {
		auto ret = Amount();
		ret.v = v;
		return ret;
	}
	std::uint64_t to_units() const { return v; }

	/* Decimal digits only, no sign, no whitespace.  */
	explicit
	Amount(std::string const&);
	explicit
	operator std::string() const;
	static
	bool valid_string(std::string const&);

	Amount& operator+=(Amount const& i);
	Amount operator+(Amount const& i) const {
		return Amount(*this) += i;
	}
	Amount& operator-=(Amount const& i);
	Amount operator-(Amount const& i) const {
		return Amount(*this) -= i;
	}

	bool operator<(Amount const& o) const {
		return v < o.v;
	}
	bool operator>(Amount const& o) const {
		return o < (*this);
	}
	bool operator<=(Amount const& o) const {
		return !(*this > o);
	}
	bool operator>=(Amount const& o) const {
		return o <= (*this);
	}
	bool operator==(Amount const& o) const {
		return v == o.v;
	}
	bool operator!=(Amount const& o) const {
		return !(*this == o);
	}

	explicit
	operator bool() const { return v != 0; }
	bool operator!() const { return v == 0; }
};

std::ostream& operator<<(std::ostream&, Amount const&);

}

#endif /* !defined(SWAP_AMOUNT_HPP) */
