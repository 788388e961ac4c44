#include<algorithm>
#include<cctype>
#include<iomanip>
#include<memory>
#include<sstream>
#include<stdio.h>
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"

namespace Util {
namespace Str {

std::string hexbyte(std::uint8_t v) {
	std::ostringstream os;
	os << std::hex << std::setfill('0') << std::setw(2);
	/* uint8_t might be a char, which iostreams would print
	 * as a character; cast so it prints as a number.
	 */
	os << ((unsigned int) v);
	return os.str();
}

std::string hexdump(void const* vp, std::size_t s) {
	auto os = std::ostringstream();
	auto p = (std::uint8_t const*) vp;
	for (auto i = std::size_t(0); i < s; ++p, ++i)
		os << hexbyte(*p);
	return os.str();
}

namespace {

std::uint8_t parse_hex(char c) {
	if (('0' <= c) && (c <= '9')) {
		return (std::uint8_t) (c & 0xF);
	} else if ((('a' <= c) && (c <= 'f')) ||
		   (('A' <= c) && (c <= 'F'))) {
		return (std::uint8_t) ((c + 9) & 0xF);
	} else {
		char s[2];
		s[0] = c;
		s[1] = 0;
		throw HexParseFailure("Non-hex character: " + std::string(s));
	}
}

}

std::vector<std::uint8_t> hexread(std::string const& s) {
	if ((s.length() % 2) != 0)
		throw HexParseFailure("String length must be even.");

	auto buf = std::vector<std::uint8_t>(s.length() / 2);
	for (auto i = std::size_t(0); i < buf.size(); ++i)
		buf[i] = (parse_hex(s[i * 2]) << 4)
		       | parse_hex(s[i * 2 + 1])
		       ;
	return buf;
}

bool ishex(std::string const& s) {
	if ((s.size() % 2) != 0)
		return false;
	return std::all_of(s.begin(), s.end(), [](char c) {
		return ('0' <= c && c <= '9')
		    || ('a' <= c && c <= 'f')
		    || ('A' <= c && c <= 'F')
		     ;
	});
}

bool isdecimal(std::string const& s) {
	if (s.empty())
		return false;
	return std::all_of(s.begin(), s.end(), [](char c) {
		return '0' <= c && c <= '9';
	});
}

bool split_option( std::string const& s
		 , std::string& key
		 , std::string& value
		 ) {
	if (s.size() < 3 || s[0] != '-' || s[1] != '-')
		return false;
	auto eq = s.find('=');
	if (eq == std::string::npos) {
		key = s.substr(2);
		value = "";
	} else {
		key = s.substr(2, eq - 2);
		value = s.substr(eq + 1);
	}
	return true;
}

std::string vfmt(char const* tpl, va_list ap_orig) {
	va_list ap;

	auto written = std::size_t(0);
	auto size = std::size_t(64);
	auto buf = std::unique_ptr<char[]>();
	do {
		if (size <= written)
			size = written + 1;
		buf = Util::make_unique<char[]>(size);
		va_copy(ap, ap_orig);
		written = std::size_t(vsnprintf(buf.get(), size, tpl, ap));
		va_end(ap);
	} while (size <= written);

	return std::string(buf.get());
}
std::string fmt(char const* tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto rv = vfmt(tpl, ap);
	va_end(ap);
	return rv;
}

}
}
