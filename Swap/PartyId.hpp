#ifndef SWAP_PARTYID_HPP
#define SWAP_PARTYID_HPP

#include<cstddef>
#include<functional>
#include<iostream>
#include<string>

namespace Swap {

/** class Swap::PartyId
 *
 * @brief opaque label naming a participant in a swap,
 * an escrow holder, or the administrator.
 *
 * @desc A default-constructed `PartyId` is the
 * "no party" sentinel; it is false in a boolean
 * context and prints as the empty string.
 */
class PartyId {
private:
	std::string label;

public:
	PartyId() =default;
	PartyId(PartyId const&) =default;
	PartyId(PartyId&&) =default;
	PartyId& operator=(PartyId const&) =default;
	PartyId& operator=(PartyId&&) =default;
	~PartyId() =default;

	/* Throws std::invalid_argument if !valid_string.  */
	explicit
	PartyId(std::string const&);
	static
	bool valid_string(std::string const&);

	explicit
	operator std::string() const { return label; }

	explicit
	operator bool() const { return !label.empty(); }
	bool operator!() const { return label.empty(); }

	bool operator==(PartyId const& o) const {
		return label == o.label;
	}
	bool operator!=(PartyId const& o) const {
		return !(*this == o);
	}
	bool operator<(PartyId const& o) const {
		return label < o.label;
	}

	std::size_t hash() const {
		return std::hash<std::string>()(label);
	}
};

std::ostream& operator<<(std::ostream&, PartyId const&);

}

namespace std {

template<>
struct hash<Swap::PartyId> {
	std::size_t operator()(Swap::PartyId const& i) const {
		return i.hash();
	}
};

}

#endif /* !defined(SWAP_PARTYID_HPP) */
