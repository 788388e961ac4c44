#ifndef JSON_DETAIL_STR_HPP
#define JSON_DETAIL_STR_HPP

#include<string>

namespace Json { namespace Detail { namespace Str {

/* Escape the contents of a JSON string, without the
 * surrounding quotes.  Bytes at or above 0x80 pass
 * through unchanged, so UTF-8 input stays UTF-8.  */
std::string to_escaped(std::string const&);

/* Render a double in the C locale.  */
std::string from_double(double);

}}}

#endif /* !defined(JSON_DETAIL_STR_HPP) */
