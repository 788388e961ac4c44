#include"Swap/Detail/label.hpp"
#include"Swap/PartyId.hpp"

namespace Swap {

PartyId::PartyId(std::string const& s) : label(s) {
	Detail::check_label("Swap::PartyId", s);
}
bool PartyId::valid_string(std::string const& s) {
	return Detail::valid_label(s);
}

std::ostream& operator<<(std::ostream& os, PartyId const& p) {
	return os << std::string(p);
}

}
