#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include"Uuid.hpp"
#include<algorithm>
#include<basicsecure.h>
#include<stdexcept>

namespace {

std::uint8_t const zero[16] = {0};

}

Uuid Uuid::random() {
	auto rv = Uuid();
	rv.pimpl = Util::make_unique<Impl>();
	/* All-zero is reserved for "no swap".  */
	do {
		BASICSECURE_RAND(rv.pimpl->data, sizeof(rv.pimpl->data));
	} while (basicsecure_eq(rv.pimpl->data, zero, 16));
	return rv;
}

bool Uuid::operator==(Uuid const& o) const {
	auto a = pimpl ? pimpl->data : zero;
	auto b = o.pimpl ? o.pimpl->data : zero;
	return basicsecure_eq(a, b, 16);
}

Uuid::operator bool() const {
	if (!pimpl)
		return false;
	return !basicsecure_eq(pimpl->data, zero, 16);
}

Uuid::operator std::string() const {
	if (!pimpl)
		return std::string(32, '0');
	return Util::Str::hexdump(pimpl->data, 16);
}
Uuid::Uuid(std::string const& s) {
	if (!valid_string(s))
		throw std::invalid_argument("Uuid: invalid input string: " + s);
	auto buf = Util::Str::hexread(s);
	pimpl = Util::make_unique<Impl>();
	std::copy(buf.begin(), buf.end(), pimpl->data);
}
bool Uuid::valid_string(std::string const& s) {
	return s.size() == 32 && Util::Str::ishex(s);
}
