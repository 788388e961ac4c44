#ifndef FAIRSWAP_MSG_DBRESOURCE_HPP
#define FAIRSWAP_MSG_DBRESOURCE_HPP

#include"Sqlite3/Db.hpp"

namespace FairSwap { namespace Msg {

/** struct FairSwap::Msg::DbResource
 *
 * @brief provides access to the db.
 *
 * @desc raised once at startup, before any command
 * runs.
 * Modules with persistent data keep the db and create
 * their tables in their handler, so a test can drive a
 * module by raising this with an in-memory db.
 */
struct DbResource {
	Sqlite3::Db db;
};

}}

#endif /* !defined(FAIRSWAP_MSG_DBRESOURCE_HPP) */
