#include"Ev/Io.hpp"
#include"FairSwap/DbLedger.hpp"
#include"FairSwap/Msg/DbResource.hpp"
#include"FairSwap/log.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<stdexcept>

namespace FairSwap {

class DbLedger::Impl {
private:
	S::Bus& bus;
	Sqlite3::Db db;

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
			CREATE TABLE IF NOT EXISTS "FairSwap_ledger"
			     ( account TEXT NOT NULL
			     , holder TEXT NOT NULL
			     , amount TEXT NOT NULL
			     , PRIMARY KEY (account, holder)
			     );
			)QRY");
			tx.commit();
			return Ev::lift();
		});
	}

	Sqlite3::Db& get_db() {
		if (!db)
			throw Util::BacktraceException<std::logic_error>(
				"FairSwap::DbLedger: no database yet"
			);
		return db;
	}

	static
	Swap::Amount read( Sqlite3::Tx& tx
			 , Swap::AccountId const& account
			 , Swap::PartyId const& holder
			 ) {
		auto fetch = tx.query(R"QRY(
		SELECT amount FROM "FairSwap_ledger"
		 WHERE account = :account
		   AND holder = :holder
		     ;
		)QRY")
			.bind(":account", std::string(account))
			.bind(":holder", std::string(holder))
			.execute()
			;
		auto rv = Swap::Amount();
		for (auto& r : fetch)
			rv = Swap::Amount(r.get<std::string>(0));
		return rv;
	}
	static
	void write( Sqlite3::Tx& tx
		  , Swap::AccountId const& account
		  , Swap::PartyId const& holder
		  , Swap::Amount amount
		  ) {
		tx.query(R"QRY(
		INSERT OR REPLACE INTO "FairSwap_ledger"
		VALUES(:account, :holder, :amount);
		)QRY")
			.bind(":account", std::string(account))
			.bind(":holder", std::string(holder))
			.bind(":amount", std::string(amount))
			.execute()
			;
	}

public:
	explicit
	Impl(S::Bus& bus_) : bus(bus_) { start(); }

	Ev::Io<void> credit( Swap::AccountId const& account
			   , Swap::PartyId const& holder
			   , Swap::Amount amount
			   ) {
		return Ev::lift().then([this]() {
			return get_db().transact();
		}).then([account, holder, amount](Sqlite3::Tx tx) {
			write(tx, account, holder, read(tx, account, holder) + amount);
			tx.commit();
			return Ev::lift();
		}).then([this, account, holder, amount]() {
			return log( bus, Debug
				  , "ledger: credit %s to %s on %s"
				  , std::string(amount).c_str()
				  , std::string(holder).c_str()
				  , std::string(account).c_str()
				  );
		});
	}

	Ev::Io<Swap::Amount> balance( Swap::AccountId const& account
				    , Swap::PartyId const& holder
				    ) {
		return Ev::lift().then([this]() {
			return get_db().transact();
		}).then([account, holder](Sqlite3::Tx tx) {
			auto rv = read(tx, account, holder);
			tx.commit();
			return Ev::lift(rv);
		});
	}

	Ev::Io<bool> transfer( Swap::AccountId const& account
			     , Swap::PartyId const& from
			     , Swap::PartyId const& to
			     , Swap::Amount amount
			     ) {
		return Ev::lift().then([this]() {
			return get_db().transact();
		}).then([account, from, to, amount](Sqlite3::Tx tx) {
			auto have = read(tx, account, from);
			if (have < amount) {
				tx.rollback();
				return Ev::lift(false);
			}
			if (from != to) {
				write(tx, account, from, have - amount);
				write( tx, account, to
				     , read(tx, account, to) + amount
				     );
			}
			tx.commit();
			return Ev::lift(true);
		}).then([this, account, from, to, amount](bool ok) {
			return log( bus, Debug
				  , "ledger: %s %s from %s to %s on %s"
				  , ok ? "moved" : "refused"
				  , std::string(amount).c_str()
				  , std::string(from).c_str()
				  , std::string(to).c_str()
				  , std::string(account).c_str()
				  ).then([ok]() {
				return Ev::lift(ok);
			});
		});
	}
};

DbLedger::DbLedger(S::Bus& bus) : pimpl(Util::make_unique<Impl>(bus)) { }
DbLedger::DbLedger(DbLedger&&) =default;
DbLedger::~DbLedger() =default;

Ev::Io<void> DbLedger::credit( Swap::AccountId const& account
			     , Swap::PartyId const& holder
			     , Swap::Amount amount
			     ) {
	return pimpl->credit(account, holder, amount);
}
Ev::Io<Swap::Amount> DbLedger::balance( Swap::AccountId const& account
				      , Swap::PartyId const& holder
				      ) {
	return pimpl->balance(account, holder);
}
Ev::Io<bool> DbLedger::transfer( Swap::AccountId const& account
			       , Swap::PartyId const& from
			       , Swap::PartyId const& to
			       , Swap::Amount amount
			       ) {
	return pimpl->transfer(account, from, to, amount);
}

}
