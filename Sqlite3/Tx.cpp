#include"Sqlite3/Db.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Tx.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<stdexcept>
#include<sqlite3.h>

namespace Sqlite3 {

class Tx::Impl {
private:
	Sqlite3::Db db;
	bool finished;

	sqlite3* connection() const {
		return (sqlite3*) db.get_connection();
	}

	void throw_sqlite3(char const* src) {
		auto err = std::string(sqlite3_errmsg(connection()));
		throw Util::BacktraceException<std::runtime_error>(
			std::string("Sqlite3::Tx: ") + src + ": " + err
		);
	}

	void finish() {
		finished = true;
		db.transaction_finish();
	}

public:
	Impl(Sqlite3::Db const& db_) : db(db_), finished(false) {
		auto res = sqlite3_exec(connection(), "BEGIN", NULL, NULL, NULL);
		if (res != SQLITE_OK) {
			/* Let the next blocked transactor proceed.  */
			finish();
			throw_sqlite3("BEGIN");
		}
	}

	~Impl() {
		if (finished)
			return;
		/* Nothing sensible can be done about a failed
		 * ROLLBACK from a destructor; sqlite reverts an
		 * open transaction on its own when the connection
		 * closes anyway.  */
		(void) sqlite3_exec(connection(), "ROLLBACK", NULL, NULL, NULL);
		finish();
	}

	void commit() {
		auto res = sqlite3_exec(connection(), "COMMIT", NULL, NULL, NULL);
		if (res != SQLITE_OK) {
			auto err = std::string(sqlite3_errmsg(connection()));
			(void) sqlite3_exec( connection(), "ROLLBACK"
					   , NULL, NULL, NULL
					   );
			finish();
			throw Util::BacktraceException<std::runtime_error>(
				"Sqlite3::Tx: COMMIT: " + err
			);
		}
		finish();
	}

	void query_execute(char const* q) {
		auto res = sqlite3_exec(connection(), q, NULL, NULL, NULL);
		if (res != SQLITE_OK)
			throw_sqlite3(q);
	}

	Query query(char const* sql) {
		auto stmt = (sqlite3_stmt*) nullptr;
		auto res = sqlite3_prepare_v2( connection(), sql, -1
					     , &stmt, nullptr
					     );
		if (res != SQLITE_OK)
			throw_sqlite3(sql);

		return Query(db, stmt);
	}
};

Tx::Tx(Sqlite3::Db const& db)
		: pimpl(Util::make_unique<Impl>(db)) { }
Tx::Tx() : pimpl(nullptr) { }
Tx::Tx(Tx&& o) : pimpl(std::move(o.pimpl)) { }
Tx::~Tx() { }

Tx& Tx::operator=(Tx&& o) {
	auto tmp = std::move(o);
	std::swap(pimpl, tmp.pimpl);
	return *this;
}

void Tx::commit() {
	auto impl = std::move(pimpl);
	impl->commit();
}
void Tx::rollback() {
	pimpl = nullptr;
}

Query Tx::query(char const* sql) {
	return pimpl->query(sql);
}
Query Tx::query(std::string const& q) {
	return query(q.c_str());
}

void Tx::query_execute(char const* q) {
	return pimpl->query_execute(q);
}

}
