#include"Ev/Io.hpp"
#include"FairSwap/Mod/EventRecorder.hpp"
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
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include"Uuid.hpp"
#include<stdexcept>

namespace FairSwap { namespace Mod {

class EventRecorder::Impl {
private:
	S::Bus& bus;
	std::function<double()> get_now;
	Sqlite3::Db db;

	void start() {
		bus.subscribe<Msg::DbResource
			     >([this](Msg::DbResource const& r) {
			db = r.db;
			return init();
		});

		bus.subscribe<Msg::SwapStarted
			     >([this](Msg::SwapStarted const& m) {
			return record( m.id, "swap_started"
				     , std::string(m.initiator)
				     , Util::Str::fmt( "counterparty %s collateral %s"
						     , std::string(m.counterparty).c_str()
						     , std::string(m.collateral).c_str()
						     )
				     );
		});
		bus.subscribe<Msg::TermsSet
			     >([this](Msg::TermsSet const& m) {
			return record( m.id, "terms_set"
				     , std::string(m.party)
				     , Util::Str::fmt( "%s on %s"
						     , std::string(m.terms.quantity).c_str()
						     , std::string(m.terms.account).c_str()
						     )
				     );
		});
		bus.subscribe<Msg::TermsAccepted
			     >([this](Msg::TermsAccepted const& m) {
			return record( m.id, "terms_accepted"
				     , std::string(m.party)
				     , m.advanced ? "both accepted" : ""
				     );
		});
		bus.subscribe<Msg::DepositConfirmed
			     >([this](Msg::DepositConfirmed const& m) {
			auto detail = std::string();
			if (m.excess)
				detail = "excess " + std::string(m.excess)
				       + " returned";
			return record( m.id, "deposit_confirmed"
				     , std::string(m.party), detail
				     );
		});
		bus.subscribe<Msg::SwapExecuted
			     >([this](Msg::SwapExecuted const& m) {
			return record( m.id, "executed"
				     , std::string(m.party)
				     , Util::Str::fmt( "received %s on %s"
						     , std::string(m.received.quantity).c_str()
						     , std::string(m.received.account).c_str()
						     )
				     );
		});
		bus.subscribe<Msg::SwapCancelled
			     >([this](Msg::SwapCancelled const& m) {
			return record( m.id, "cancelled"
				     , std::string(m.canceller), ""
				     );
		});
		bus.subscribe<Msg::SwapCompleted
			     >([this](Msg::SwapCompleted const& m) {
			return record(m.id, "completed", "", "");
		});
		bus.subscribe<Msg::SwapOverridden
			     >([this](Msg::SwapOverridden const& m) {
			return record( m.id, "overridden"
				     , std::string(m.admin)
				     , m.closed ? "closed" : "held open"
				     );
		});
		bus.subscribe<Msg::EscrowReclaimed
			     >([this](Msg::EscrowReclaimed const& m) {
			return record( m.id, "reclaimed"
				     , std::string(m.party)
				     , Util::Str::fmt( "%s on %s"
						     , std::string(m.amount).c_str()
						     , std::string(m.account).c_str()
						     )
				     );
		});
		bus.subscribe<Msg::TransferFailed
			     >([this](Msg::TransferFailed const& m) {
			auto const& e = m.effect;
			return record( m.id, "transfer_failed"
				     , std::string(e.to)
				     , Util::Str::fmt( "%s of %s on %s from %s: %s"
						     , Swap::purpose_name(e.purpose)
						     , std::string(e.amount).c_str()
						     , std::string(e.account).c_str()
						     , std::string(e.from).c_str()
						     , m.reason.c_str()
						     )
				     );
		});
	}

	Ev::Io<void> init() {
		return db.transact().then([](Sqlite3::Tx tx) {
			tx.query_execute(R"QRY(
			CREATE TABLE IF NOT EXISTS "FairSwap_events"
			     ( id INTEGER PRIMARY KEY AUTOINCREMENT
			     , time REAL NOT NULL
			     , uuid TEXT NOT NULL
			     , kind TEXT NOT NULL
			     , party TEXT NOT NULL
			     , detail TEXT NOT NULL
			     );
			CREATE INDEX IF NOT EXISTS
			    idx_fairswap_events_uuid ON "FairSwap_events" (uuid, id);
			)QRY");
			tx.commit();
			return Ev::lift();
		});
	}

	Ev::Io<void> record( Uuid const& id
			   , char const* kind
			   , std::string party
			   , std::string detail
			   ) {
		/* Modules can run without persistence in tests.  */
		if (!db)
			return Ev::lift();
		auto now = get_now();
		auto uuid = std::string(id);
		return db.transact().then([ now, uuid, kind, party, detail
					  ](Sqlite3::Tx tx) {
			tx.query(R"QRY(
			INSERT INTO "FairSwap_events"(time, uuid, kind, party, detail)
			VALUES(:time, :uuid, :kind, :party, :detail);
			)QRY")
				.bind(":time", now)
				.bind(":uuid", uuid)
				.bind(":kind", kind)
				.bind(":party", party)
				.bind(":detail", detail)
				.execute()
				;
			tx.commit();
			return Ev::lift();
		});
	}

	Ev::Io<std::vector<Entry>> query(std::string const& uuid) {
		if (!db)
			return Ev::fail<std::vector<Entry>>(
				Util::BacktraceException<std::logic_error>(
					"FairSwap::Mod::EventRecorder: "
					"no database yet"
				)
			);
		return db.transact().then([uuid](Sqlite3::Tx tx) {
			auto rv = std::vector<Entry>();
			auto rows = tx.query(R"QRY(
			SELECT time, uuid, kind, party, detail
			  FROM "FairSwap_events"
			 WHERE :uuid = '' OR uuid = :uuid
			 ORDER BY id
			     ;
			)QRY")
				.bind(":uuid", uuid)
				.execute()
				;
			for (auto& r : rows)
				rv.push_back(Entry{ r.get<double>(0)
						  , r.get<std::string>(1)
						  , r.get<std::string>(2)
						  , r.get<std::string>(3)
						  , r.get<std::string>(4)
						  });
			tx.commit();
			return Ev::lift(std::move(rv));
		});
	}

public:
	Impl( S::Bus& bus_
	    , std::function<double()> get_now_
	    ) : bus(bus_), get_now(std::move(get_now_)) { start(); }

	Ev::Io<std::vector<Entry>> history(Uuid const& id) {
		return query(std::string(id));
	}
	Ev::Io<std::vector<Entry>> all() {
		return query("");
	}
};

EventRecorder::EventRecorder(EventRecorder&& o)
	: pimpl(std::move(o.pimpl)) { }
EventRecorder::~EventRecorder() { }

EventRecorder::EventRecorder( S::Bus& bus
			    , std::function<double()> get_now
			    ) : pimpl(Util::make_unique<Impl>(bus, std::move(get_now)))
			      { }

Ev::Io<std::vector<EventRecorder::Entry>>
EventRecorder::history(Uuid const& id) {
	return pimpl->history(id);
}
Ev::Io<std::vector<EventRecorder::Entry>>
EventRecorder::all() {
	return pimpl->all();
}

}}
