#undef NDEBUG
#include"Sqlite3.hpp"
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<exception>
#include<memory>
#include<stdexcept>
#include<vector>

namespace {

/* Count rows of the swaps table.  */
int count_rows(Sqlite3::Tx& tx) {
	auto rv = 0;
	auto res = tx.query("SELECT COUNT(*) FROM \"swaps\";").execute();
	for (auto& r : res)
		rv = r.get<int>(0);
	return rv;
}

/* Runs `io` as a separate greenthread.  */
void start_waiting(Ev::Io<void> io) {
	io.run([]() { }, [](std::exception_ptr) {
		assert(false);
	});
}

Ev::Io<void> wait_for(std::shared_ptr<std::vector<int>> order, std::size_t n) {
	if (order->size() >= n)
		return Ev::lift();
	return Ev::yield().then([order, n]() {
		return wait_for(order, n);
	});
}

}

int main() {
	auto db = Sqlite3::Db(":memory:");
	auto order = std::make_shared<std::vector<int>>();

	auto ordered_transaction = [&](int i) {
		return db.transact().then([order, i](Sqlite3::Tx tx) {
			order->push_back(i);
			tx.commit();
			return Ev::lift();
		});
	};

	auto code = Ev::lift().then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.query_execute(R"QRY(
		CREATE TABLE "swaps"
		     ( uuid TEXT PRIMARY KEY
		     , stage INTEGER NOT NULL
		     , done INTEGER NOT NULL
		     , start_time REAL NOT NULL
		     , collateral TEXT NOT NULL
		     , big INTEGER
		     , note TEXT
		     );
		)QRY");
		tx.commit();
		assert(!tx);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query(R"QRY(
		INSERT INTO "swaps" VALUES
		     (:uuid, :stage, :done, :start_time, :collateral, :big, :note);
		)QRY")
			.bind(":uuid", "00112233445566778899aabbccddeeff")
			.bind(":stage", 3)
			.bind(":done", true)
			.bind(":start_time", 1000.5)
			.bind(":collateral", std::string("18446744073709551615"))
			.bind_or_null(":big", true, 9007199254740993LL)
			.bind_or_null(":note", false, std::string("dropped"))
			.execute()
			;
		tx.commit();

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto res = tx.query(R"QRY(
		SELECT uuid, stage, done, start_time, collateral, big, note
		  FROM "swaps"
		 WHERE uuid = :uuid;
		)QRY")
			.bind(":uuid", std::string("00112233445566778899aabbccddeeff"))
			.execute()
			;
		auto found = false;
		for (auto& r : res) {
			assert(!found);
			found = true;
			assert(r.get<std::string>(0) == "00112233445566778899aabbccddeeff");
			assert(r.get<int>(1) == 3);
			assert(r.get<bool>(2));
			assert(r.get<double>(3) == 1000.5);
			/* Text keeps values too large for a column.  */
			assert(r.get<std::string>(4) == "18446744073709551615");
			assert(r.get<long long>(5) == 9007199254740993LL);
			/* NULL text reads as empty.  */
			assert(r.get<std::string>(6) == "");
			assert(r.is_null(6));
			assert(!r.is_null(5));
		}
		assert(found);
		tx.commit();

		/* Rollback discards.  */
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query_execute("DELETE FROM \"swaps\";");
		assert(count_rows(tx) == 0);
		tx.rollback();
		assert(!tx);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(count_rows(tx) == 1);

		/* A transaction dropped without commit is rolled
		 * back.  */
		tx.query_execute("DELETE FROM \"swaps\";");
		return Ev::lift();
	}).then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(count_rows(tx) == 1);
		tx.commit();

		/* A failing continuation also rolls back.  */
		return db.transact().then([](Sqlite3::Tx tx) {
			tx.query_execute("DELETE FROM \"swaps\";");
			throw std::runtime_error("abandoned");
			return Ev::lift(false);
		}).catching<std::runtime_error>([](std::runtime_error const&) {
			return Ev::lift(true);
		});
	}).then([&](bool caught) {
		assert(caught);
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(count_rows(tx) == 1);

		/* Bad SQL throws, and the transaction is still
		 * usable.  */
		auto threw = false;
		try {
			tx.query_execute("SELEKT 1;");
		} catch (std::runtime_error const&) {
			threw = true;
		}
		assert(threw);
		assert(count_rows(tx) == 1);

		/* So does binding a name the query lacks.  */
		threw = false;
		try {
			tx.query("SELECT * FROM \"swaps\" WHERE uuid = :uuid;")
				.bind(":id", 1)
				;
		} catch (std::runtime_error const&) {
			threw = true;
		}
		assert(threw);
		tx.commit();

		/* Transactions wait for one another.  */
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto held = std::make_shared<Sqlite3::Tx>(std::move(tx));
		start_waiting(ordered_transaction(1));
		start_waiting(ordered_transaction(2));
		return Ev::yield().then([&]() {
			return Ev::yield();
		}).then([order]() {
			/* Still holding ours.  */
			assert(order->empty());
			return Ev::lift();
		}).then([held]() {
			held->commit();
			return Ev::lift();
		});
	}).then([&]() {
		return wait_for(order, 2);
	}).then([&]() {
		/* Granted in the order they asked.  */
		assert(order->size() == 2);
		assert((*order)[0] == 1);
		assert((*order)[1] == 2);

		return Ev::lift(0);
	});

	return Ev::start(code);
}
