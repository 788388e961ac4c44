#include"Swap/Detail/label.hpp"
#include<stdexcept>

namespace Swap { namespace Detail {

bool valid_label(std::string const& s) {
	if (s.empty() || s.size() > 128)
		return false;
	for (auto c : s) {
		if ( ('A' <= c && c <= 'Z')
		  || ('a' <= c && c <= 'z')
		  || ('0' <= c && c <= '9')
		   )
			continue;
		switch (c) {
		case '_': case '.': case ':': case '@': case '-':
			continue;
		default:
			return false;
		}
	}
	return true;
}

void check_label(char const* what, std::string const& s) {
	if (!valid_label(s))
		throw std::invalid_argument(
			std::string(what) + ": invalid label: \"" + s + "\""
		);
}

}}
