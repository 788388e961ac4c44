#undef NDEBUG
#include"Swap/Coordinator.hpp"
#include"Swap/Error.hpp"
#include"Swap/Instance.hpp"
#include"Swap/Override/Hold.hpp"
#include"Swap/Override/Unwind.hpp"
#include"Uuid.hpp"
#include<assert.h>
#include<memory>

namespace {

auto const A = Swap::PartyId("alice");
auto const B = Swap::PartyId("bob");
auto const admin = Swap::PartyId("admin");
auto const gold = Swap::AccountId("gold");
auto const silver = Swap::AccountId("silver");
auto const collateral = Swap::AccountId("collateral");

Swap::Amount units(std::uint64_t u) {
	return Swap::Amount::units(u);
}

Swap::Config make_config() {
	auto config = Swap::Config();
	config.admin = admin;
	config.cancel_delay = 10;
	config.override_delay = 100;
	return config;
}

/* Drive a fresh instance up to the given stage, with
 * party A having completed it if `a_done`.  */
Swap::Instance drive( Swap::Coordinator const& core
		    , Swap::Stage stage
		    , bool a_done
		    ) {
	auto inst = Swap::Instance();
	inst.id = Uuid::random();
	core.create(inst, A, B, units(10), 0);
	if (stage == Swap::Started) {
		if (a_done)
			core.set_terms(inst, A, gold, units(5));
		return inst;
	}
	core.set_terms(inst, A, gold, units(5));
	core.set_terms(inst, B, silver, units(7));
	if (stage == Swap::TermsSet) {
		if (a_done)
			core.accept_terms(inst, A, units(10), 1);
		return inst;
	}
	core.accept_terms(inst, A, units(10), 1);
	core.accept_terms(inst, B, units(10), 1);
	if (stage == Swap::TermsAccepted) {
		if (a_done)
			core.confirm_deposit(inst, A, units(5));
		return inst;
	}
	core.confirm_deposit(inst, A, units(5));
	core.confirm_deposit(inst, B, units(7));
	if (a_done)
		core.request_final_transfer(inst, A);
	return inst;
}

bool has( Swap::OverrideIF::Settlement const& s
	, Swap::AccountId const& account
	, Swap::PartyId const& from
	, Swap::PartyId const& to
	, std::uint64_t amount
	, Swap::Effect::Purpose purpose
	) {
	auto e = Swap::Effect{account, from, to, units(amount), purpose};
	for (auto const& x : s.effects)
		if (x == e)
			return true;
	return false;
}

}

int main() {
	auto config = make_config();

	/* Hold: nothing moves, instance stays open.  */
	{
		auto core = Swap::Coordinator( config
					     , std::make_shared<Swap::Override::Hold>()
					     );
		auto inst = drive(core, Swap::TermsAccepted, true);
		auto before = inst;

		/* Only the administrator.  */
		auto caught = false;
		try {
			core.manual_override(inst, A, 1000);
		} catch (Swap::Unauthorized const&) {
			caught = true;
		}
		assert(caught);

		/* Only after the longer delay.  */
		caught = false;
		try {
			core.manual_override(inst, admin, 50);
		} catch (Swap::TimingViolation const&) {
			caught = true;
		}
		assert(caught);
		assert(inst.tracker == before.tracker);

		auto out = core.manual_override(inst, admin, 100);
		assert(out.effects.empty());
		assert(out.events.size() == 1);
		assert(out.events[0].kind == Swap::Event::Overridden);
		assert(out.events[0].party == admin);
		assert(inst.open());
		assert(inst.tracker == before.tracker);
		assert(inst.terms == before.terms);
		assert(inst.closed == Swap::NotClosed);

		/* The swap can still proceed afterwards.  */
		core.confirm_deposit(inst, B, units(7));
		assert(inst.stage() == Swap::DepositConfirmed);
	}

	/* Without an administrator nobody can override.  */
	{
		auto c = Swap::Config();
		c.cancel_delay = 10;
		c.override_delay = 100;
		auto core = Swap::Coordinator( c
					     , std::make_shared<Swap::Override::Hold>()
					     );
		auto inst = drive(core, Swap::Started, false);
		auto caught = false;
		try {
			core.manual_override(inst, Swap::PartyId(), 1000);
		} catch (Swap::Unauthorized const&) {
			caught = true;
		}
		assert(caught);
	}

	auto unwind = std::make_shared<Swap::Override::Unwind>();
	auto core = Swap::Coordinator(config, unwind);

	/* Closed instances cannot be overridden.  */
	{
		auto inst = drive(core, Swap::Started, false);
		core.cancel(inst, A, 10);
		auto caught = false;
		try {
			core.manual_override(inst, admin, 1000);
		} catch (Swap::PreconditionViolation const&) {
			caught = true;
		}
		assert(caught);
	}

	/* Unwind at Started closes with no transfers.  */
	{
		auto inst = drive(core, Swap::Started, true);
		auto out = core.manual_override(inst, admin, 100);
		assert(out.effects.empty());
		assert(!inst.open());
		assert(inst.closed == Swap::ClosedOverridden);
		assert(!inst.terms.is_set(Swap::SlotA));
	}

	/* At TermsSet only those who accepted posted
	 * collateral.  */
	{
		auto inst = drive(core, Swap::TermsSet, true);
		auto s = unwind->settle(inst, config);
		assert(s.close);
		assert(s.effects.size() == 1);
		assert(has( s, collateral
			  , Swap::escrow_holder(inst.id, Swap::SlotA), A, 10
			  , Swap::Effect::CollateralRefund
			  ));
	}

	/* At TermsAccepted both collaterals, plus deposits
	 * already confirmed.  */
	{
		auto inst = drive(core, Swap::TermsAccepted, true);
		auto s = unwind->settle(inst, config);
		assert(s.effects.size() == 3);
		assert(has( s, collateral
			  , Swap::escrow_holder(inst.id, Swap::SlotA), A, 10
			  , Swap::Effect::CollateralRefund
			  ));
		assert(has( s, collateral
			  , Swap::escrow_holder(inst.id, Swap::SlotB), B, 10
			  , Swap::Effect::CollateralRefund
			  ));
		assert(has( s, gold
			  , Swap::escrow_holder(inst.id, Swap::SlotA), A, 5
			  , Swap::Effect::DepositReturn
			  ));
	}

	/* At DepositConfirmed with nobody finalized,
	 * everything goes back.  */
	{
		auto inst = drive(core, Swap::DepositConfirmed, false);
		auto s = unwind->settle(inst, config);
		assert(s.effects.size() == 4);
		assert(has( s, gold
			  , Swap::escrow_holder(inst.id, Swap::SlotA), A, 5
			  , Swap::Effect::DepositReturn
			  ));
		assert(has( s, silver
			  , Swap::escrow_holder(inst.id, Swap::SlotB), B, 7
			  , Swap::Effect::DepositReturn
			  ));
	}

	/* At DepositConfirmed with A finalized, B's deposit
	 * is gone, so B gets what A put in and its own
	 * collateral.  */
	{
		auto inst = drive(core, Swap::DepositConfirmed, true);
		assert(inst.tracker.completed(Swap::SlotA));
		auto out = core.manual_override(inst, admin, 150);
		assert(out.effects.size() == 2);
		assert(out.effects[0].account == gold);
		assert(out.effects[0].to == B);
		assert(out.effects[0].amount == units(5));
		assert(out.effects[0].purpose == Swap::Effect::AssetDelivery);
		assert(out.effects[1].account == collateral);
		assert(out.effects[1].to == B);
		assert(out.effects[1].purpose == Swap::Effect::CollateralRefund);
		assert(inst.closed == Swap::ClosedOverridden);
		assert(inst.stage() == Swap::ReadyToStart);
	}

	return 0;
}
