#include"Swap/Amount.hpp"
#include"Util/Str.hpp"
#include<limits>
#include<stdexcept>

namespace Swap {

Amount::Amount(std::string const& s) : v(0) {
	if (!valid_string(s))
		throw std::invalid_argument("Swap::Amount: not a quantity: " + s);
	for (auto c : s) {
		auto d = std::uint64_t(c - '0');
		if (v > (std::numeric_limits<std::uint64_t>::max() - d) / 10)
			throw std::out_of_range(
				"Swap::Amount: quantity too large: " + s
			);
		v = v * 10 + d;
	}
}
Amount::operator std::string() const {
	return std::to_string(v);
}
bool Amount::valid_string(std::string const& s) {
	return Util::Str::isdecimal(s);
}

Amount& Amount::operator+=(Amount const& i) {
	if (v > std::numeric_limits<std::uint64_t>::max() - i.v)
		throw std::overflow_error("Swap::Amount: overflow");
	v += i.v;
	return *this;
}
Amount& Amount::operator-=(Amount const& i) {
	if (i.v > v)
		throw std::underflow_error("Swap::Amount: underflow");
	v -= i.v;
	return *this;
}

std::ostream& operator<<(std::ostream& os, Amount const& a) {
	return os << std::string(a);
}

}
