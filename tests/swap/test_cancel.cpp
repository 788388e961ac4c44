#undef NDEBUG
#include"Swap/Coordinator.hpp"
#include"Swap/Error.hpp"
#include"Swap/Instance.hpp"
#include"Swap/Override/Hold.hpp"
#include"Uuid.hpp"
#include<assert.h>
#include<initializer_list>
#include<map>
#include<memory>

namespace {

auto const A = Swap::PartyId("alice");
auto const B = Swap::PartyId("bob");
auto const gold = Swap::AccountId("gold");
auto const silver = Swap::AccountId("silver");
auto const collateral = Swap::AccountId("collateral");

Swap::Amount units(std::uint64_t u) {
	return Swap::Amount::units(u);
}

auto const start = double(5000);

Swap::Coordinator make_core() {
	auto config = Swap::Config();
	config.cancel_delay = 60;
	config.override_delay = 600;
	return Swap::Coordinator( config
				, std::make_shared<Swap::Override::Hold>()
				);
}

/* A fresh instance, both parties through acceptance.  */
Swap::Instance accepted(Swap::Coordinator const& core) {
	auto inst = Swap::Instance();
	inst.id = Uuid::random();
	core.create(inst, A, B, units(10), start);
	core.set_terms(inst, A, gold, units(5));
	core.set_terms(inst, B, silver, units(7));
	core.accept_terms(inst, A, units(10), start + 1);
	core.accept_terms(inst, B, units(10), start + 2);
	assert(inst.stage() == Swap::TermsAccepted);
	return inst;
}

/* Collateral paid out, per recipient.  */
std::map<Swap::PartyId, std::uint64_t>
collateral_paid(Swap::Outcome const& out) {
	auto rv = std::map<Swap::PartyId, std::uint64_t>();
	for (auto const& e : out.effects)
		if (e.account == collateral)
			rv[e.to] += e.amount.to_units();
	return rv;
}

std::uint64_t total(std::map<Swap::PartyId, std::uint64_t> const& m) {
	auto rv = std::uint64_t(0);
	for (auto const& e : m)
		rv += e.second;
	return rv;
}

void check_closed(Swap::Instance const& inst) {
	assert(inst.stage() == Swap::ReadyToStart);
	assert(inst.closed == Swap::ClosedCancelled);
	assert(!inst.terms.is_set(Swap::SlotA));
	assert(!inst.terms.is_set(Swap::SlotB));
	assert(!inst.tracker.completed(Swap::SlotA));
	assert(!inst.tracker.completed(Swap::SlotB));
}

}

int main() {
	auto core = make_core();

	/* Early cancel from Started moves nothing.  */
	{
		auto inst = Swap::Instance();
		inst.id = Uuid::random();
		core.create(inst, A, B, units(10), start);

		auto caught = false;
		try {
			core.cancel(inst, B, start + 59);
		} catch (Swap::TimingViolation const&) {
			caught = true;
		}
		assert(caught);
		assert(inst.stage() == Swap::Started);

		/* Strangers cannot cancel, even late.  */
		caught = false;
		try {
			core.cancel(inst, Swap::PartyId("mallory"), start + 600);
		} catch (Swap::Unauthorized const&) {
			caught = true;
		}
		assert(caught);

		auto out = core.cancel(inst, B, start + 60);
		assert(out.effects.empty());
		assert(out.events.size() == 1);
		assert(out.events[0].kind == Swap::Event::Cancelled);
		assert(out.events[0].party == B);
		check_closed(inst);
	}

	/* Cancel from TermsSet clears terms, no transfers,
	 * even if one party already accepted.  */
	{
		auto inst = Swap::Instance();
		inst.id = Uuid::random();
		core.create(inst, A, B, units(10), start);
		core.set_terms(inst, A, gold, units(5));
		core.set_terms(inst, B, silver, units(7));
		core.accept_terms(inst, A, units(10), start + 1);
		assert(inst.stage() == Swap::TermsSet);

		auto out = core.cancel(inst, A, start + 100);
		assert(out.effects.empty());
		check_closed(inst);

		/* Closed instances cannot be cancelled again.  */
		auto caught = false;
		try {
			core.cancel(inst, A, start + 100);
		} catch (Swap::PreconditionViolation const&) {
			caught = true;
		}
		assert(caught);
	}

	/* Both accepted, nobody confirmed: cancel before the
	 * grace period fails, after it both collaterals go
	 * back to their owners.  */
	{
		auto inst = accepted(core);
		auto before = inst;

		auto caught = false;
		try {
			core.cancel(inst, A, start + 30);
		} catch (Swap::TimingViolation const&) {
			caught = true;
		}
		assert(caught);
		assert(inst.stage() == Swap::TermsAccepted);
		assert(inst.terms == before.terms);

		auto out = core.cancel(inst, A, start + 61);
		auto paid = collateral_paid(out);
		assert(paid[A] == 10);
		assert(paid[B] == 10);
		assert(total(paid) == 20);
		assert(out.effects.size() == 2);
		assert(out.effects[0].from == Swap::escrow_holder(inst.id, Swap::SlotA));
		assert(out.effects[0].purpose == Swap::Effect::CollateralRefund);
		assert(out.effects[1].from == Swap::escrow_holder(inst.id, Swap::SlotB));
		assert(out.events.size() == 1);
		assert(out.events[0].party == A);
		check_closed(inst);
	}

	/* B confirmed its deposit; A's late cancel is blocked
	 * and changes nothing.  */
	{
		auto inst = accepted(core);
		core.confirm_deposit(inst, B, units(7));
		auto before = inst;

		auto caught = false;
		try {
			core.cancel(inst, A, start + 100);
		} catch (Swap::CancelBlocked const&) {
			caught = true;
		}
		assert(caught);
		assert(inst.stage() == Swap::TermsAccepted);
		assert(inst.tracker == before.tracker);
		assert(inst.terms == before.terms);
		assert(inst.closed == Swap::NotClosed);

		/* B, who committed in good faith, cancels instead
		 * and takes both collaterals plus its deposit.  */
		auto out = core.cancel(inst, B, start + 100);
		auto paid = collateral_paid(out);
		assert(paid[B] == 20);
		assert(paid.count(A) == 0);
		assert(total(paid) == 20);

		assert(out.effects.size() == 3);
		assert(out.effects[0].purpose == Swap::Effect::CollateralRefund);
		assert(out.effects[0].from == Swap::escrow_holder(inst.id, Swap::SlotB));
		assert(out.effects[1].purpose == Swap::Effect::CollateralForfeit);
		assert(out.effects[1].from == Swap::escrow_holder(inst.id, Swap::SlotA));
		assert(out.effects[1].to == B);
		assert(out.effects[2].purpose == Swap::Effect::DepositReturn);
		assert(out.effects[2].account == silver);
		assert(out.effects[2].to == B);
		assert(out.effects[2].amount == units(7));
		check_closed(inst);
	}

	/* Zero collateral: a forfeit moves nothing.  */
	{
		auto inst = Swap::Instance();
		inst.id = Uuid::random();
		core.create(inst, A, B, units(0), start);
		core.set_terms(inst, A, gold, units(5));
		core.set_terms(inst, B, silver, units(7));
		core.accept_terms(inst, A, units(0), start);
		core.accept_terms(inst, B, units(0), start);
		core.confirm_deposit(inst, A, units(5));

		auto out = core.cancel(inst, A, start + 60);
		assert(collateral_paid(out).empty());
		assert(out.effects.size() == 1);
		assert(out.effects[0].purpose == Swap::Effect::DepositReturn);
		assert(out.effects[0].to == A);
	}

	/* Collateral paid out never exceeds twice the
	 * collateral, whoever cancels.  */
	for (auto confirm_a : {false, true}) {
		for (auto confirm_b : {false, true}) {
			if (confirm_a && confirm_b)
				/* Would have advanced past TermsAccepted.  */
				continue;
			for (auto canceller : {A, B}) {
				auto inst = accepted(core);
				if (confirm_a)
					core.confirm_deposit(inst, A, units(5));
				if (confirm_b)
					core.confirm_deposit(inst, B, units(7));
				try {
					auto out = core.cancel(inst, canceller, start + 60);
					assert(total(collateral_paid(out)) == 20);
				} catch (Swap::CancelBlocked const&) {
					/* Only when the other party committed.  */
					auto other_committed = (canceller == A)
							     ? confirm_b
							     : confirm_a
							     ;
					assert(other_committed);
					assert(inst.stage() == Swap::TermsAccepted);
				}
			}
		}
	}

	return 0;
}
