#undef NDEBUG
#include"Swap/AccountId.hpp"
#include"Swap/Amount.hpp"
#include"Swap/PartyId.hpp"
#include<assert.h>
#include<sstream>
#include<stdexcept>
#include<unordered_set>

int main() {
	/* Amount.  */
	{
		auto a = Swap::Amount();
		assert(!a);
		assert(a.to_units() == 0);

		a = Swap::Amount::units(10);
		assert(a);
		assert(a + Swap::Amount::units(5) == Swap::Amount::units(15));
		assert(a - Swap::Amount::units(10) == Swap::Amount());
		assert(Swap::Amount::units(3) < a);
		assert(a >= Swap::Amount::units(10));
		assert(a <= Swap::Amount::units(10));
		assert(a != Swap::Amount::units(11));

		auto os = std::ostringstream();
		os << a;
		assert(os.str() == "10");
	}
	{
		auto caught = false;
		try {
			Swap::Amount::units(3) - Swap::Amount::units(4);
		} catch (std::underflow_error const&) {
			caught = true;
		}
		assert(caught);

		caught = false;
		try {
			Swap::Amount::units(18446744073709551615ULL)
				+ Swap::Amount::units(1);
		} catch (std::overflow_error const&) {
			caught = true;
		}
		assert(caught);
	}
	{
		assert(Swap::Amount("0") == Swap::Amount());
		assert(Swap::Amount("1234") == Swap::Amount::units(1234));
		assert( Swap::Amount("18446744073709551615")
		     == Swap::Amount::units(18446744073709551615ULL)
		      );
		assert(std::string(Swap::Amount::units(42)) == "42");

		assert(!Swap::Amount::valid_string(""));
		assert(!Swap::Amount::valid_string("-1"));
		assert(!Swap::Amount::valid_string("1.5"));
		assert(!Swap::Amount::valid_string(" 1"));

		auto caught = false;
		try {
			Swap::Amount("12a");
		} catch (std::invalid_argument const&) {
			caught = true;
		}
		assert(caught);

		caught = false;
		try {
			Swap::Amount("18446744073709551616");
		} catch (std::out_of_range const&) {
			caught = true;
		}
		assert(caught);
	}

	/* PartyId.  */
	{
		auto none = Swap::PartyId();
		assert(!none);
		assert(std::string(none) == "");

		auto alice = Swap::PartyId("alice");
		auto bob = Swap::PartyId("bob@example.com");
		assert(alice);
		assert(alice != bob);
		assert(alice == Swap::PartyId("alice"));
		assert(alice < bob);
		assert(std::string(bob) == "bob@example.com");

		auto set = std::unordered_set<Swap::PartyId>();
		set.insert(alice);
		set.insert(Swap::PartyId("alice"));
		set.insert(bob);
		assert(set.size() == 2);

		assert(Swap::PartyId::valid_string("escrow:00ff:a"));
		assert(Swap::PartyId::valid_string("A-b_c.d"));
		assert(!Swap::PartyId::valid_string(""));
		assert(!Swap::PartyId::valid_string("has space"));
		assert(!Swap::PartyId::valid_string("quote\""));
		assert(!Swap::PartyId::valid_string(std::string(129, 'x')));
		assert(Swap::PartyId::valid_string(std::string(128, 'x')));

		auto caught = false;
		try {
			Swap::PartyId("a b");
		} catch (std::invalid_argument const&) {
			caught = true;
		}
		assert(caught);
	}

	/* AccountId.  */
	{
		auto none = Swap::AccountId();
		assert(!none);
		auto gold = Swap::AccountId("gold");
		assert(gold);
		assert(gold == Swap::AccountId("gold"));
		assert(gold != Swap::AccountId("silver"));
		assert(std::string(gold) == "gold");

		auto os = std::ostringstream();
		os << gold;
		assert(os.str() == "gold");

		auto caught = false;
		try {
			Swap::AccountId("gold/silver");
		} catch (std::invalid_argument const&) {
			caught = true;
		}
		assert(caught);
	}

	return 0;
}
