#ifndef SQLITE3_DB_HPP
#define SQLITE3_DB_HPP

#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Db
 *
 * @brief shared handle to one SQLITE3 connection.
 *
 * @desc Copies share the connection.
 * All access goes through `transact`, which hands out
 * one `Sqlite3::Tx` at a time within this process.
 * Other processes on the same file are waited on for
 * up to the busy timeout given at open.
 */
class Db {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

	friend class Sqlite3::Result;
	friend class Sqlite3::Tx;

	void* get_connection() const;
	void transaction_finish();

public:
	/* Opens a database, creating it if absent.
	 * ":memory:" is a private in-memory db, "" a new
	 * temporary one.
	 * `busy_timeout` is in seconds; 0 fails at once
	 * when another process holds the lock.
	 */
	explicit
	Db(std::string const& filename, double busy_timeout = 0);

	/* Creates an empty/invalid db object.  */
	Db() =default;
	Db(Db const&) =default;
	Db(Db&&) =default;
	Db& operator=(Db const&) =default;
	Db& operator=(Db&&) =default;
	~Db() =default;

	/* A default-constructed Db is false and cannot
	 * transact.  */
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	/** Sqlite3::Db::transact
	 *
	 * @desc Begins a transaction once every earlier
	 * `Sqlite3::Tx` of this Db has been committed,
	 * rolled back or destroyed.
	 */
	Ev::Io<Sqlite3::Tx> transact();
};

}

#endif /* !defined(SQLITE3_DB_HPP) */
