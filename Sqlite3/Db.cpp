#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Tx.hpp"
#include"Util/BacktraceException.hpp"
#include<queue>
#include<stdexcept>
#include<sqlite3.h>
#include<utility>

namespace {

/* A greenthread waiting for its turn at the database.  */
struct Waiter {
	std::function<void(Sqlite3::Tx)> pass;
	std::function<void(std::exception_ptr)> fail;
};

}

namespace Sqlite3 {

class Db::Impl {
private:
	sqlite3* connection;

	bool in_transaction;
	std::queue<Waiter> blocked;

	void fail_open(char const* step) {
		auto msg = std::string("Not enough memory");
		if (connection) {
			msg = std::string(sqlite3_errmsg(connection));
			sqlite3_close_v2(connection);
			connection = nullptr;
		}
		throw Util::BacktraceException<std::runtime_error>(
			std::string("Sqlite3::Db: ") + step + ": " + msg
		);
	}

	/* Hand a fresh transaction to the given waiter.
	 * If BEGIN fails the waiter gets the exception, and
	 * the Tx constructor has already moved the turn on.  */
	static
	void grant(Db const& db, Waiter const& w) {
		auto tx = Sqlite3::Tx();
		try {
			tx = Sqlite3::Tx(db);
		} catch (...) {
			w.fail(std::current_exception());
			return;
		}
		w.pass(std::move(tx));
	}

public:
	Impl( std::string const& filename
	    , double busy_timeout
	    ) : connection(nullptr)
	      , in_transaction(false) {
		auto res = sqlite3_open(filename.c_str(), &connection);
		if (res != SQLITE_OK)
			fail_open("sqlite3_open");
		res = sqlite3_busy_timeout(connection, int(busy_timeout * 1000));
		if (res != SQLITE_OK)
			fail_open("sqlite3_busy_timeout");
		res = sqlite3_extended_result_codes(connection, 1);
		if (res != SQLITE_OK)
			fail_open("sqlite3_extended_result_codes");
		res = sqlite3_exec( connection, "PRAGMA foreign_keys = ON;"
				  , NULL, NULL, NULL
				  );
		if (res != SQLITE_OK)
			fail_open("PRAGMA foreign_keys = ON");
	}
	~Impl() {
		if (connection)
			sqlite3_close_v2(connection);
	}

	Ev::Io<Sqlite3::Tx> transact(Db const& db) {
		auto ptx = std::make_shared<Sqlite3::Tx>();
		return Ev::Io< Sqlite3::Tx
			     >([ this, db
			       ]( std::function<void(Sqlite3::Tx)> pass
				, std::function<void(std::exception_ptr)> fail
				) {
			auto w = Waiter{std::move(pass), std::move(fail)};
			if (in_transaction)
				blocked.emplace(std::move(w));
			else {
				in_transaction = true;
				grant(db, w);
			}
		}).then([ptx](Sqlite3::Tx tx) {
			*ptx = std::move(tx);
			return Ev::yield();
		}).then([ptx]() {
			return Ev::lift(std::move(*ptx));
		});
	}
	void* get_connection() const { return connection; }
	void transaction_finish(Db const& db) {
		if (!blocked.empty()) {
			auto w = std::move(blocked.front());
			blocked.pop();
			grant(db, w);
		} else
			in_transaction = false;
	}
};

void* Db::get_connection() const {
	return pimpl->get_connection();
}
void Db::transaction_finish() {
	return pimpl->transaction_finish(*this);
}
Ev::Io<Sqlite3::Tx> Db::transact() {
	return pimpl->transact(*this);
}

Db::Db( std::string const& filename
      , double busy_timeout
      ) : pimpl(std::make_shared<Impl>(filename, busy_timeout)) { }

}
