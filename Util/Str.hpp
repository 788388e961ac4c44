#ifndef UTIL_STR_HPP
#define UTIL_STR_HPP

/*
 * Minor string utilities.
 */

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdarg.h>
#include<stdexcept>
#include<string>
#include<vector>

namespace Util {
namespace Str {

/* Outputs a two-digit hex string of the given byte.  */
std::string hexbyte(std::uint8_t);
/* Outputs a string of the given data.  */
std::string hexdump(void const* p, std::size_t s);

/* Creates a buffer from the given hex string.  */
struct HexParseFailure : public Util::BacktraceException<std::runtime_error> {
	HexParseFailure(std::string msg)
		: Util::BacktraceException<std::runtime_error>("hexread: " + msg) { }
};
std::vector<std::uint8_t> hexread(std::string const&);

/* Checks that the given string is a hex string with an
 * even number of digits.
 */
bool ishex(std::string const&);

/* Checks that the string is a nonempty run of decimal
 * digits.
 */
bool isdecimal(std::string const&);

/* Splits `--key=value` into key and value.
 * Returns false if `s` does not start with `--`.
 * A missing `=value` gives an empty value.
 */
bool split_option( std::string const& s
		 , std::string& key
		 , std::string& value
		 );

/* Like `sprintf`.  */
std::string fmt(char const *tpl, ...)
	__attribute__ ((format (printf, 1, 2)))
;
std::string vfmt(char const *tpl, va_list ap);

}}

#endif /* !defined(UTIL_STR_HPP) */
