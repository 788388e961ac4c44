#include"Ev/Io.hpp"
#include"FairSwap/Mod/SwapCoordinator.hpp"
#include"FairSwap/Msg/DbResource.hpp"
#include"FairSwap/Msg/DepositConfirmed.hpp"
#include"FairSwap/Msg/EscrowReclaimed.hpp"
#include"FairSwap/Msg/SwapCancelled.hpp"
#include"FairSwap/Msg/SwapCompleted.hpp"
#include"FairSwap/Msg/SwapExecuted.hpp"
#include"FairSwap/Msg/SwapOverridden.hpp"
#include"FairSwap/Msg/SwapStarted.hpp"
#include"FairSwap/Msg/TermsAccepted.hpp"
#include"FairSwap/Msg/TermsSet.hpp"
#include"FairSwap/Msg/TransferFailed.hpp"
#include"FairSwap/log.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Swap/Coordinator.hpp"
#include"Swap/Error.hpp"
#include"Swap/Instance.hpp"
#include"Swap/LedgerIF.hpp"
#include"Swap/OverrideIF.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include"Uuid.hpp"
#include<stdexcept>

namespace {

/* The transfer of the given purpose made to `to`, if
 * any.  */
Swap::Effect const*
find_effect( Swap::Outcome const& outcome
	   , Swap::Effect::Purpose purpose
	   , Swap::PartyId const& to
	   ) {
	for (auto const& e : outcome.effects)
		if (e.purpose == purpose && e.to == to)
			return &e;
	return nullptr;
}

}

namespace FairSwap { namespace Mod {

class SwapCoordinator::Impl {
private:
	S::Bus& bus;
	Swap::LedgerIF& ledger;
	Swap::Coordinator core;
	std::function<double()> get_now;
	Sqlite3::Db db;

	typedef std::function<Swap::Outcome(Swap::Instance&)> Transition;
	typedef std::function<Swap::AccountId( Swap::Instance const&
					     , Swap::Slot
					     )> AccountOf;

	void start() {
		bus.subscribe<Msg::DbResource
			     >([this](Msg::DbResource const& r) {
			db = r.db;
			return init();
		});
	}

	Ev::Io<void> init() {
		return db.transact().then([](Sqlite3::Tx tx) {
			tx.query_execute(R"QRY(
			CREATE TABLE IF NOT EXISTS "FairSwap_swaps"
			     ( uuid TEXT PRIMARY KEY
			     , stage INTEGER NOT NULL
			     , done_a INTEGER NOT NULL
			     , done_b INTEGER NOT NULL
			     , party_a TEXT NOT NULL
			     , party_b TEXT NOT NULL
			     , collateral TEXT NOT NULL
			     , start_time REAL NOT NULL
			     , accepted_time REAL NOT NULL
			     , account_a TEXT
			     , quantity_a TEXT
			     , account_b TEXT
			     , quantity_b TEXT
			     , closed INTEGER NOT NULL
			     );
			CREATE INDEX IF NOT EXISTS
			    idx_fairswap_swaps_start ON "FairSwap_swaps" (start_time);
			)QRY");
			tx.commit();
			return Ev::lift();
		});
	}

	Sqlite3::Db& get_db() {
		if (!db)
			throw Util::BacktraceException<std::logic_error>(
				"FairSwap::Mod::SwapCoordinator: "
				"no database yet"
			);
		return db;
	}

	/* Unset terms are stored as NULL.  */
	static
	Swap::Terms read_terms(Sqlite3::Row& r, int c) {
		if (r.is_null(c))
			return Swap::Terms();
		return Swap::Terms{ Swap::AccountId(r.get<std::string>(c))
				  , Swap::Amount(r.get<std::string>(c + 1))
				  };
	}
	static
	Swap::Instance read_instance(Sqlite3::Row& r) {
		auto inst = Swap::Instance();
		inst.id = Uuid(r.get<std::string>(0));
		inst.tracker = Swap::StageTracker::restore(
			Swap::stage_from_int(r.get<int>(1)),
			r.get<bool>(2),
			r.get<bool>(3)
		);
		inst.parties = Swap::Parties(
			Swap::PartyId(r.get<std::string>(4)),
			Swap::PartyId(r.get<std::string>(5))
		);
		inst.collateral = Swap::Amount(r.get<std::string>(6));
		inst.start_time = r.get<double>(7);
		inst.accepted_time = r.get<double>(8);
		inst.terms.restore(Swap::SlotA, read_terms(r, 9));
		inst.terms.restore(Swap::SlotB, read_terms(r, 11));
		inst.closed = Swap::close_reason_from_int(r.get<int>(13));
		return inst;
	}

	static
	bool fetch(Sqlite3::Tx& tx, Uuid const& id, Swap::Instance& inst) {
		auto rows = tx.query(R"QRY(
		SELECT uuid, stage, done_a, done_b, party_a, party_b
		     , collateral, start_time, accepted_time
		     , account_a, quantity_a, account_b, quantity_b
		     , closed
		  FROM "FairSwap_swaps"
		 WHERE uuid = :uuid
		     ;
		)QRY")
			.bind(":uuid", std::string(id))
			.execute()
			;
		auto found = false;
		for (auto& r : rows) {
			inst = read_instance(r);
			found = true;
		}
		return found;
	}
	static
	Swap::Instance load(Sqlite3::Tx& tx, Uuid const& id) {
		auto inst = Swap::Instance();
		if (!fetch(tx, id, inst))
			throw Swap::UnknownSwap(
				"No swap " + std::string(id)
			);
		return inst;
	}

	static
	void save(Sqlite3::Tx& tx, Swap::Instance const& inst) {
		auto const& ta = inst.terms[Swap::SlotA];
		auto const& tb = inst.terms[Swap::SlotB];
		tx.query(R"QRY(
		INSERT OR REPLACE INTO "FairSwap_swaps"
		VALUES( :uuid, :stage, :done_a, :done_b
		      , :party_a, :party_b
		      , :collateral, :start_time, :accepted_time
		      , :account_a, :quantity_a, :account_b, :quantity_b
		      , :closed
		      );
		)QRY")
			.bind(":uuid", std::string(inst.id))
			.bind(":stage", int(inst.stage()))
			.bind(":done_a", inst.tracker.completed(Swap::SlotA))
			.bind(":done_b", inst.tracker.completed(Swap::SlotB))
			.bind(":party_a", std::string(inst.parties.initiator()))
			.bind(":party_b", std::string(inst.parties.counterparty()))
			.bind(":collateral", std::string(inst.collateral))
			.bind(":start_time", inst.start_time)
			.bind(":accepted_time", inst.accepted_time)
			.bind_or_null(":account_a", bool(ta.account), std::string(ta.account))
			.bind_or_null(":quantity_a", bool(ta.account), std::string(ta.quantity))
			.bind_or_null(":account_b", bool(tb.account), std::string(tb.account))
			.bind_or_null(":quantity_b", bool(tb.account), std::string(tb.quantity))
			.bind(":closed", int(inst.closed))
			.execute()
			;
	}

	/* Load, transition and store in one transaction,
	 * then carry out the outcome.
	 * With `fresh`, the instance is new and must not be
	 * in the table yet.  */
	Ev::Io<Swap::Instance>
	transition(Uuid const& id, bool fresh, Transition f) {
		auto inst = std::make_shared<Swap::Instance>();
		auto outcome = std::make_shared<Swap::Outcome>();
		return Ev::lift().then([this]() {
			return get_db().transact();
		}).then([id, fresh, f, inst, outcome](Sqlite3::Tx tx) {
			if (fresh) {
				if (fetch(tx, id, *inst))
					throw Util::BacktraceException<std::logic_error>(
						"FairSwap::Mod::SwapCoordinator: "
						"duplicate swap " + std::string(id)
					);
				*inst = Swap::Instance();
				inst->id = id;
			} else
				*inst = load(tx, id);
			*outcome = f(*inst);
			save(tx, *inst);
			tx.commit();
			return Ev::lift();
		}).then([this, inst, outcome]() {
			return carry_out(inst, outcome);
		}).then([inst]() {
			return Ev::lift(*inst);
		});
	}

	/* Escrow balance of the caller on the account chosen
	 * by `account_of`.
	 * Zero when the caller is not a party or there is no
	 * account; the transition then reports why.  */
	Ev::Io<Swap::Amount>
	escrow_balance( Uuid const& id
		      , Swap::PartyId const& caller
		      , AccountOf account_of
		      ) {
		return review(id).then([ this, caller, account_of
				       ](Swap::Instance inst) {
			if (!inst.parties.is_party(caller))
				return Ev::lift(Swap::Amount());
			auto slot = inst.parties.slot_of(caller);
			auto account = account_of(inst, slot);
			if (!account)
				return Ev::lift(Swap::Amount());
			return ledger.balance( account
					     , Swap::escrow_holder(inst.id, slot)
					     );
		});
	}

	Ev::Io<void>
	carry_out( std::shared_ptr<Swap::Instance const> inst
		 , std::shared_ptr<Swap::Outcome const> outcome
		 ) {
		return execute_effects(inst->id, outcome, 0)
			.then([this, inst, outcome]() {
			return announce(inst, outcome, 0);
		});
	}

	Ev::Io<void>
	execute_effects( Uuid const& id
		       , std::shared_ptr<Swap::Outcome const> outcome
		       , std::size_t i
		       ) {
		if (i >= outcome->effects.size())
			return Ev::lift();
		auto e = outcome->effects[i];
		auto reason = std::make_shared<std::string>(
			"refused by the ledger"
		);
		return Ev::lift().then([this, e]() {
			return ledger.transfer(e.account, e.from, e.to, e.amount);
		}).catching<std::exception>([reason](std::exception const& ex) {
			*reason = ex.what();
			return Ev::lift(false);
		}).then([this, id, e, reason](bool ok) {
			if (!ok)
				return transfer_failed(id, e, *reason);
			return log( bus, Debug
				  , "swap %s: %s of %s on %s from %s to %s"
				  , std::string(id).c_str()
				  , Swap::purpose_name(e.purpose)
				  , std::string(e.amount).c_str()
				  , std::string(e.account).c_str()
				  , std::string(e.from).c_str()
				  , std::string(e.to).c_str()
				  );
		}).then([this, id, outcome, i]() {
			return execute_effects(id, outcome, i + 1);
		});
	}

	Ev::Io<void> transfer_failed( Uuid const& id
				    , Swap::Effect const& e
				    , std::string const& reason
				    ) {
		return log( bus, Error
			  , "swap %s: %s of %s on %s from %s to %s failed: %s"
			  , std::string(id).c_str()
			  , Swap::purpose_name(e.purpose)
			  , std::string(e.amount).c_str()
			  , std::string(e.account).c_str()
			  , std::string(e.from).c_str()
			  , std::string(e.to).c_str()
			  , reason.c_str()
			  ).then([this, id, e, reason]() {
			return bus.raise(Msg::TransferFailed{id, e, reason});
		});
	}

	Ev::Io<void>
	announce( std::shared_ptr<Swap::Instance const> inst
		, std::shared_ptr<Swap::Outcome const> outcome
		, std::size_t i
		) {
		if (i >= outcome->events.size())
			return Ev::lift();
		auto ev = outcome->events[i];
		return log( bus, Info
			  , "swap %s: %s%s%s"
			  , std::string(inst->id).c_str()
			  , Swap::event_name(ev.kind)
			  , ev.party ? " by " : ""
			  , std::string(ev.party).c_str()
			  ).then([this, inst, outcome, ev]() {
			return raise_event(*inst, *outcome, ev);
		}).then([this, inst, outcome, i]() {
			return announce(inst, outcome, i + 1);
		});
	}

	Ev::Io<void> raise_event( Swap::Instance const& inst
				, Swap::Outcome const& outcome
				, Swap::Event const& ev
				) {
		auto const& id = inst.id;
		switch (ev.kind) {
		case Swap::Event::SwapStarted:
			return bus.raise(Msg::SwapStarted{
				id, inst.parties.initiator(),
				inst.parties.counterparty(), inst.collateral
			});
		case Swap::Event::TermsSet:
			return bus.raise(Msg::TermsSet{
				id, ev.party,
				inst.terms[inst.parties.slot_of(ev.party)]
			});
		case Swap::Event::TermsAccepted:
			return bus.raise(Msg::TermsAccepted{
				id, ev.party,
				inst.stage() == Swap::TermsAccepted
			});
		case Swap::Event::DepositConfirmed: {
			auto e = find_effect( outcome, Swap::Effect::ExcessReturn
					    , ev.party
					    );
			return bus.raise(Msg::DepositConfirmed{
				id, ev.party, e ? e->amount : Swap::Amount()
			});
		}
		case Swap::Event::Executed: {
			auto e = find_effect( outcome, Swap::Effect::AssetDelivery
					    , ev.party
					    );
			auto received = Swap::Terms();
			if (e)
				received = Swap::Terms{e->account, e->amount};
			return bus.raise(Msg::SwapExecuted{
				id, ev.party, received
			});
		}
		case Swap::Event::Cancelled:
			return bus.raise(Msg::SwapCancelled{id, ev.party});
		case Swap::Event::Completed:
			return bus.raise(Msg::SwapCompleted{id});
		case Swap::Event::Overridden:
			return bus.raise(Msg::SwapOverridden{
				id, ev.party, !inst.open()
			});
		case Swap::Event::Reclaimed: {
			auto e = find_effect( outcome, Swap::Effect::Reclaim
					    , ev.party
					    );
			if (!e)
				return Ev::lift();
			return bus.raise(Msg::EscrowReclaimed{
				id, ev.party, e->account, e->amount
			});
		}
		}
		return Ev::lift();
	}

public:
	Impl( S::Bus& bus_
	    , Swap::LedgerIF& ledger_
	    , Swap::Config config
	    , std::shared_ptr<Swap::OverrideIF const> override_policy
	    , std::function<double()> get_now_
	    ) : bus(bus_)
	      , ledger(ledger_)
	      , core(std::move(config), std::move(override_policy))
	      , get_now(std::move(get_now_))
	      { start(); }

	Swap::Config const& get_config() const {
		return core.get_config();
	}

	Ev::Io<Swap::Instance>
	create_swap( Swap::PartyId const& initiator
		   , Swap::PartyId const& counterparty
		   , Swap::Amount collateral
		   ) {
		return transition( Uuid::random(), true
				 , [ this, initiator, counterparty
				   , collateral
				   ](Swap::Instance& inst) {
			return core.create( inst, initiator, counterparty
					  , collateral, get_now()
					  );
		});
	}
	Ev::Io<Swap::Instance>
	set_terms( Uuid const& id
		 , Swap::PartyId const& caller
		 , Swap::AccountId const& account
		 , Swap::Amount quantity
		 ) {
		return transition( id, false
				 , [ this, caller, account, quantity
				   ](Swap::Instance& inst) {
			return core.set_terms(inst, caller, account, quantity);
		});
	}
	Ev::Io<Swap::Instance>
	accept_terms(Uuid const& id, Swap::PartyId const& caller) {
		auto collateral_of = [this]( Swap::Instance const&
					   , Swap::Slot
					   ) {
			return core.get_config().collateral_account;
		};
		return escrow_balance(id, caller, collateral_of)
			.then([this, id, caller](Swap::Amount value) {
			return transition( id, false
					 , [ this, caller, value
					   ](Swap::Instance& inst) {
				return core.accept_terms( inst, caller, value
							, get_now()
							);
			});
		});
	}
	Ev::Io<Swap::Instance>
	confirm_deposit(Uuid const& id, Swap::PartyId const& caller) {
		auto declared = []( Swap::Instance const& inst
				  , Swap::Slot slot
				  ) {
			return inst.terms[slot].account;
		};
		return escrow_balance(id, caller, declared)
			.then([this, id, caller](Swap::Amount balance) {
			return transition( id, false
					 , [ this, caller, balance
					   ](Swap::Instance& inst) {
				return core.confirm_deposit( inst, caller
							   , balance
							   );
			});
		});
	}
	Ev::Io<Swap::Instance>
	request_final_transfer(Uuid const& id, Swap::PartyId const& caller) {
		return transition(id, false, [this, caller](Swap::Instance& inst) {
			return core.request_final_transfer(inst, caller);
		});
	}
	Ev::Io<Swap::Instance>
	cancel(Uuid const& id, Swap::PartyId const& caller) {
		return transition(id, false, [this, caller](Swap::Instance& inst) {
			return core.cancel(inst, caller, get_now());
		});
	}
	Ev::Io<Swap::Instance>
	manual_override(Uuid const& id, Swap::PartyId const& caller) {
		return transition(id, false, [this, caller](Swap::Instance& inst) {
			return core.manual_override(inst, caller, get_now());
		});
	}

	Ev::Io<Swap::Amount>
	reclaim( Uuid const& id
	       , Swap::PartyId const& caller
	       , Swap::AccountId const& account
	       ) {
		auto given = [account]( Swap::Instance const&
				      , Swap::Slot
				      ) {
			return account;
		};
		return escrow_balance(id, caller, given)
			.then([this, id, caller, account](Swap::Amount balance) {
			return transition( id, false
					 , [ this, caller, account, balance
					   ](Swap::Instance& inst) {
				return core.reclaim(inst, caller, account, balance);
			}).then([balance](Swap::Instance) {
				return Ev::lift(balance);
			});
		});
	}

	Ev::Io<Swap::Instance> review(Uuid const& id) {
		return Ev::lift().then([this]() {
			return get_db().transact();
		}).then([id](Sqlite3::Tx tx) {
			auto inst = load(tx, id);
			tx.commit();
			return Ev::lift(std::move(inst));
		});
	}

	Ev::Io<std::vector<Swap::Instance>> list() {
		return Ev::lift().then([this]() {
			return get_db().transact();
		}).then([](Sqlite3::Tx tx) {
			auto rv = std::vector<Swap::Instance>();
			auto rows = tx.query(R"QRY(
			SELECT uuid, stage, done_a, done_b, party_a, party_b
			     , collateral, start_time, accepted_time
			     , account_a, quantity_a, account_b, quantity_b
			     , closed
			  FROM "FairSwap_swaps"
			 ORDER BY start_time, uuid
			     ;
			)QRY").execute();
			for (auto& r : rows)
				rv.push_back(read_instance(r));
			tx.commit();
			return Ev::lift(std::move(rv));
		});
	}
};

SwapCoordinator::SwapCoordinator(SwapCoordinator&& o)
	: pimpl(std::move(o.pimpl)) { }
SwapCoordinator::~SwapCoordinator() { }

SwapCoordinator::SwapCoordinator
		( S::Bus& bus
		, Swap::LedgerIF& ledger
		, Swap::Config config
		, std::shared_ptr<Swap::OverrideIF const> override_policy
		, std::function<double()> get_now
		) : pimpl(Util::make_unique<Impl>( bus, ledger
						 , std::move(config)
						 , std::move(override_policy)
						 , std::move(get_now)
						 ))
		  { }

Swap::Config const& SwapCoordinator::get_config() const {
	return pimpl->get_config();
}

Ev::Io<Swap::Instance>
SwapCoordinator::create_swap( Swap::PartyId const& initiator
			    , Swap::PartyId const& counterparty
			    , Swap::Amount collateral
			    ) {
	return pimpl->create_swap(initiator, counterparty, collateral);
}
Ev::Io<Swap::Instance>
SwapCoordinator::set_terms( Uuid const& id
			  , Swap::PartyId const& caller
			  , Swap::AccountId const& account
			  , Swap::Amount quantity
			  ) {
	return pimpl->set_terms(id, caller, account, quantity);
}
Ev::Io<Swap::Instance>
SwapCoordinator::accept_terms(Uuid const& id, Swap::PartyId const& caller) {
	return pimpl->accept_terms(id, caller);
}
Ev::Io<Swap::Instance>
SwapCoordinator::confirm_deposit(Uuid const& id, Swap::PartyId const& caller) {
	return pimpl->confirm_deposit(id, caller);
}
Ev::Io<Swap::Instance>
SwapCoordinator::request_final_transfer( Uuid const& id
				       , Swap::PartyId const& caller
				       ) {
	return pimpl->request_final_transfer(id, caller);
}
Ev::Io<Swap::Instance>
SwapCoordinator::cancel(Uuid const& id, Swap::PartyId const& caller) {
	return pimpl->cancel(id, caller);
}
Ev::Io<Swap::Instance>
SwapCoordinator::manual_override(Uuid const& id, Swap::PartyId const& caller) {
	return pimpl->manual_override(id, caller);
}
Ev::Io<Swap::Amount>
SwapCoordinator::reclaim( Uuid const& id
			, Swap::PartyId const& caller
			, Swap::AccountId const& account
			) {
	return pimpl->reclaim(id, caller, account);
}
Ev::Io<Swap::Instance> SwapCoordinator::review(Uuid const& id) {
	return pimpl->review(id);
}
Ev::Io<std::vector<Swap::Instance>> SwapCoordinator::list() {
	return pimpl->list();
}

}}
