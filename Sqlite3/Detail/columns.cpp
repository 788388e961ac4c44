#include"Sqlite3/Detail/columns.hpp"
#include<sqlite3.h>

namespace Sqlite3 { namespace Detail {

double column_d(void* stmt, int c) {
	return sqlite3_column_double((sqlite3_stmt*) stmt, c);
}
std::int64_t column_i(void* stmt, int c) {
	return sqlite3_column_int64((sqlite3_stmt*) stmt, c);
}
std::string column_s(void* stmt, int c) {
	auto ss = (sqlite3_stmt*) stmt;
	auto text = sqlite3_column_text(ss, c);
	/* NULL column.  */
	if (!text)
		return std::string();
	auto size = sqlite3_column_bytes(ss, c);
	return std::string((char const*) text, std::size_t(size));
}

}}
