#ifndef SQLITE3_QUERY_HPP
#define SQLITE3_QUERY_HPP

#include"Sqlite3/Detail/binds.hpp"
#include<memory>
#include<string>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Query
 *
 * @brief A prepared statement inside a `Sqlite3::Tx`.
 * Bind its named parameters, then `execute` it once.
 *
 * @desc Binding a name the statement does not have
 * throws, with the statement text in the message.
 */
class Query {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Tx;
	Query(Sqlite3::Db const&, void*);

	void* get_stmt() const;
	int get_location(char const*) const;

public:
	Query() =delete;
	Query(Query&&);
	~Query();

	/** Sqlite3::Query::bind
	 *
	 * @brief binds a named parameter of the query.
	 * Named parameters are of the form :VVV, @VVV,
	 * or $VVV, where VVV is alphanumeric.
	 */
	template<typename a>
	Query& bind(char const* field, a value) {
		Detail::Bind<a>::bind( get_stmt(), get_location(field)
				     , std::move(value)
				     );
		return *this;
	}
	template<typename a>
	Query& bind(std::string const& field, a value) {
		return bind<a>(field.c_str(), value);
	}

	/** Sqlite3::Query::bind_or_null
	 *
	 * @brief binds `value`, or NULL if `present` is
	 * false.
	 * Read it back with `Sqlite3::Row::is_null`.
	 */
	template<typename a>
	Query& bind_or_null(char const* field, bool present, a value) {
		if (!present)
			return bind(field, nullptr);
		return bind<a>(field, std::move(value));
	}

	/** Sqlite3::Query::execute
	 *
	 * @brief runs the statement up to its first row.
	 * Unbound parameters are NULL.
	 * The query is spent afterwards.
	 */
	Result execute();
};

}

#endif /* !defined(SQLITE3_QUERY_HPP) */
