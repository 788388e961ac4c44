#include"Json/Detail/Str.hpp"
#include<iomanip>
#include<locale>
#include<sstream>

namespace Json { namespace Detail { namespace Str {

std::string to_escaped(std::string const& s) {
	auto os = std::ostringstream();
	for (auto c : s) {
		switch (c) {
		case '\"': os << "\\\""; break;
		case '\\': os << "\\\\"; break;
		case '\b': os << "\\b"; break;
		case '\f': os << "\\f"; break;
		case '\n': os << "\\n"; break;
		case '\r': os << "\\r"; break;
		case '\t': os << "\\t"; break;
		default:
			if ((unsigned char) c < 32) {
				os << "\\u00"
				   << std::hex << std::setfill('0')
				   << std::setw(2)
				   << ((unsigned int) (unsigned char) c)
				   << std::dec
				   ;
			} else
				os << c;
			break;
		}
	}
	return os.str();
}

std::string from_double(double d) {
	auto os = std::ostringstream();
	os.imbue(std::locale("C"));
	os << std::setprecision(17) << d;
	return os.str();
}

}}}
