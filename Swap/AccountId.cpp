#include"Swap/AccountId.hpp"
#include"Swap/Detail/label.hpp"

namespace Swap {

AccountId::AccountId(std::string const& s) : label(s) {
	Detail::check_label("Swap::AccountId", s);
}
bool AccountId::valid_string(std::string const& s) {
	return Detail::valid_label(s);
}

std::ostream& operator<<(std::ostream& os, AccountId const& a) {
	return os << std::string(a);
}

}
