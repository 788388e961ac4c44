#include"Swap/Coordinator.hpp"
#include"Swap/Detail/payout.hpp"
#include"Swap/Error.hpp"
#include"Swap/Instance.hpp"
#include"Swap/OverrideIF.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

using Swap::Detail::pay;
using Swap::Detail::pay_collateral;
using Swap::Detail::pay_deposit;

namespace {

Swap::Slot authorize( Swap::Instance const& inst
		    , Swap::PartyId const& caller
		    , char const* op
		    ) {
	if (!inst.parties.is_party(caller))
		throw Swap::Unauthorized(
			std::string(op) + ": " + std::string(caller) +
			" is not a party to swap " + std::string(inst.id)
		);
	return inst.parties.slot_of(caller);
}

void require_stage( Swap::Instance const& inst
		  , Swap::Stage stage
		  , char const* op
		  ) {
	if (inst.stage() != stage)
		throw Swap::PreconditionViolation(
			std::string(op) + ": swap is at " +
			Swap::stage_name(inst.stage()) + ", needs " +
			Swap::stage_name(stage)
		);
}

void require_elapsed( Swap::Instance const& inst
		    , double delay
		    , double now
		    , char const* op
		    ) {
	auto eligible = inst.start_time + delay;
	if (now < eligible)
		throw Swap::TimingViolation(
			std::string(op) + ": not allowed for another " +
			std::to_string(eligible - now) + " seconds"
		);
}

Swap::Event event(Swap::Event::Kind k, Swap::PartyId p) {
	return Swap::Event{k, std::move(p)};
}

}

namespace Swap {

Coordinator::Coordinator( Config config_
			, std::shared_ptr<OverrideIF const> override_policy_
			) : config(std::move(config_))
			  , override_policy(std::move(override_policy_)) {
	config.validate();
	if (!override_policy)
		throw std::invalid_argument("Swap::Coordinator: no override policy");
}

Outcome Coordinator::create( Instance& inst
			   , PartyId const& initiator
			   , PartyId const& counterparty
			   , Amount collateral
			   , double now
			   ) const {
	if (!inst.id)
		throw Util::BacktraceException<std::logic_error>(
			"Swap::Coordinator::create: instance has no id"
		);
	if (inst.open() || inst.closed != NotClosed)
		throw PreconditionViolation(
			"create: swap " + std::string(inst.id) +
			" was already used"
		);

	auto next = inst;
	next.parties = Parties(initiator, counterparty);
	next.collateral = collateral;
	next.start_time = now;
	next.accepted_time = 0;
	next.tracker.start();

	auto rv = Outcome();
	rv.events.push_back(event(Event::SwapStarted, initiator));
	inst = std::move(next);
	return rv;
}

Outcome Coordinator::set_terms( Instance& inst
			      , PartyId const& caller
			      , AccountId const& account
			      , Amount quantity
			      ) const {
	auto slot = authorize(inst, caller, "set_terms");
	require_stage(inst, Started, "set_terms");
	if (inst.terms.is_set(slot))
		throw TermsAlreadySet(
			"set_terms: " + std::string(caller) +
			" already set terms on account " +
			std::string(inst.terms[slot].account)
		);
	if (account == config.collateral_account)
		throw PreconditionViolation(
			"set_terms: account " + std::string(account) +
			" is reserved for collateral"
		);

	auto next = inst;
	next.terms.set(slot, Terms{account, quantity});
	next.tracker.record_completion(slot);

	auto rv = Outcome();
	rv.events.push_back(event(Event::TermsSet, caller));
	inst = std::move(next);
	return rv;
}

Outcome Coordinator::accept_terms( Instance& inst
				 , PartyId const& caller
				 , Amount value
				 , double now
				 ) const {
	auto slot = authorize(inst, caller, "accept_terms");
	require_stage(inst, TermsSet, "accept_terms");
	if (inst.tracker.completed(slot))
		throw StageAlreadyCompleted(
			"accept_terms: " + std::string(caller) +
			" already accepted"
		);
	if (value != inst.collateral)
		throw CollateralMismatch(
			"accept_terms: posted " + std::string(value) +
			", collateral is " + std::string(inst.collateral)
		);

	auto next = inst;
	if (next.tracker.record_completion(slot))
		next.accepted_time = now;

	auto rv = Outcome();
	rv.events.push_back(event(Event::TermsAccepted, caller));
	inst = std::move(next);
	return rv;
}

Outcome Coordinator::confirm_deposit( Instance& inst
				    , PartyId const& caller
				    , Amount balance
				    ) const {
	auto slot = authorize(inst, caller, "confirm_deposit");
	require_stage(inst, TermsAccepted, "confirm_deposit");
	if (inst.tracker.completed(slot))
		throw StageAlreadyCompleted(
			"confirm_deposit: " + std::string(caller) +
			" already confirmed"
		);
	auto const& t = inst.terms[slot];
	if (balance < t.quantity)
		throw InsufficientDeposit(
			"confirm_deposit: " + std::string(caller) +
			" deposited " + std::string(balance) + " of " +
			std::string(t.quantity) + " on " +
			std::string(t.account)
		);

	auto next = inst;
	next.tracker.record_completion(slot);

	auto rv = Outcome();
	pay( rv.effects
	   , t.account, escrow_holder(inst.id, slot), caller
	   , balance - t.quantity
	   , Effect::ExcessReturn
	   );
	rv.events.push_back(event(Event::DepositConfirmed, caller));
	inst = std::move(next);
	return rv;
}

Outcome Coordinator::request_final_transfer( Instance& inst
					   , PartyId const& caller
					   ) const {
	auto slot = authorize(inst, caller, "request_final_transfer");
	require_stage(inst, DepositConfirmed, "request_final_transfer");
	if (inst.tracker.completed(slot))
		throw AlreadyExecuted(
			"request_final_transfer: " + std::string(caller) +
			" already finalized"
		);
	auto other = other_slot(slot);

	auto next = inst;
	next.tracker.record_completion(slot);

	auto rv = Outcome();
	pay_deposit(rv.effects, inst, other, slot, Effect::AssetDelivery);
	pay_collateral( rv.effects, inst, config, slot, slot
		      , Effect::CollateralRefund
		      );
	rv.events.push_back(event(Event::Executed, caller));

	next.terms.clear(other);
	if (next.stage() == Executed) {
		next.reset(ClosedExecuted);
		rv.events.push_back(event(Event::Completed, PartyId()));
	}
	inst = std::move(next);
	return rv;
}

Outcome Coordinator::cancel( Instance& inst
			   , PartyId const& caller
			   , double now
			   ) const {
	auto slot = authorize(inst, caller, "cancel");
	auto stage = inst.stage();
	if (stage != Started && stage != TermsSet && stage != TermsAccepted)
		throw PreconditionViolation(
			std::string("cancel: not possible at ") +
			stage_name(stage)
		);
	require_elapsed(inst, config.cancel_delay, now, "cancel");

	auto rv = Outcome();
	if (stage == TermsAccepted) {
		auto other = other_slot(slot);
		auto mine = inst.tracker.completed(slot);
		auto theirs = inst.tracker.completed(other);
		if (!mine && !theirs) {
			pay_collateral( rv.effects, inst, config, slot, slot
				      , Effect::CollateralRefund
				      );
			pay_collateral( rv.effects, inst, config, other, other
				      , Effect::CollateralRefund
				      );
		} else if (mine && !theirs) {
			pay_collateral( rv.effects, inst, config, slot, slot
				      , Effect::CollateralRefund
				      );
			pay_collateral( rv.effects, inst, config, other, slot
				      , Effect::CollateralForfeit
				      );
			pay_deposit( rv.effects, inst, slot, slot
				   , Effect::DepositReturn
				   );
		} else
			throw CancelBlocked(
				"cancel: " +
				std::string(inst.parties[other]) +
				" has already confirmed its deposit"
			);
	}

	auto next = inst;
	next.reset(ClosedCancelled);
	rv.events.push_back(event(Event::Cancelled, caller));
	inst = std::move(next);
	return rv;
}

Outcome Coordinator::manual_override( Instance& inst
				    , PartyId const& caller
				    , double now
				    ) const {
	if (!config.admin || caller != config.admin)
		throw Unauthorized(
			"manual_override: " + std::string(caller) +
			" is not the administrator"
		);
	auto stage = inst.stage();
	if (stage == ReadyToStart || stage == Executed)
		throw PreconditionViolation(
			std::string("manual_override: not possible at ") +
			stage_name(stage)
		);
	require_elapsed( inst, config.override_delay, now
		       , "manual_override"
		       );

	auto settlement = override_policy->settle(inst, config);

	auto next = inst;
	if (settlement.close)
		next.reset(ClosedOverridden);

	auto rv = Outcome();
	rv.effects = std::move(settlement.effects);
	rv.events.push_back(event(Event::Overridden, caller));
	inst = std::move(next);
	return rv;
}

Outcome Coordinator::reclaim( Instance const& inst
			    , PartyId const& caller
			    , AccountId const& account
			    , Amount balance
			    ) const {
	auto slot = authorize(inst, caller, "reclaim");
	if (inst.open())
		throw PreconditionViolation(
			"reclaim: swap " + std::string(inst.id) +
			" is still open"
		);
	if (!account)
		throw PreconditionViolation("reclaim: no account given");

	auto rv = Outcome();
	if (!balance)
		return rv;
	pay( rv.effects
	   , account, escrow_holder(inst.id, slot), caller
	   , balance
	   , Effect::Reclaim
	   );
	rv.events.push_back(event(Event::Reclaimed, caller));
	return rv;
}

PartyId Coordinator::other_party(Instance const& inst, PartyId const& p) {
	return inst.parties.other(p);
}

}
