#include"Swap/Error.hpp"
#include"Swap/Parties.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace Swap {

Parties::Parties(PartyId initiator, PartyId counterparty)
	: a(std::move(initiator))
	, b(std::move(counterparty)) {
	if (!a || !b)
		throw InvalidParty("Both parties must be named.");
	if (a == b)
		throw InvalidParty( "Initiator and counterparty are both "
				  + std::string(a)
				  );
}

bool Parties::is_party(PartyId const& p) const {
	if (!p)
		return false;
	return p == a || p == b;
}

Slot Parties::slot_of(PartyId const& p) const {
	if (p && p == a)
		return SlotA;
	if (p && p == b)
		return SlotB;
	throw Util::BacktraceException<std::logic_error>(
		"Swap::Parties::slot_of: not a party: " + std::string(p)
	);
}

PartyId Parties::other(PartyId const& p) const {
	if (!is_party(p))
		return PartyId();
	return p == a ? b : a;
}

}
