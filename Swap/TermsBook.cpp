#include"Swap/Error.hpp"
#include"Swap/TermsBook.hpp"

namespace Swap {

void TermsBook::set(Slot s, Terms t) {
	if (is_set(s))
		throw TermsAlreadySet(
			"Terms already set on account " +
			std::string(entries[s].account)
		);
	if (!t.account)
		throw PreconditionViolation("Terms need an asset account.");
	entries[s] = std::move(t);
}

}
