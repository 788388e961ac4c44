#undef NDEBUG
#include"Uuid.hpp"
#include<assert.h>
#include<sstream>
#include<stdexcept>
#include<unordered_map>

int main() {
	/* The null identifier.  */
	auto none = Uuid();
	assert(!none);
	assert(none == Uuid());
	assert(std::string(none) == "00000000000000000000000000000000");

	/* Random identifiers are distinct and never null.  */
	auto a = Uuid::random();
	auto b = Uuid::random();
	assert(a);
	assert(b);
	assert(a != b);
	assert(a != none);

	/* Text round trip, as stored in the database.  */
	auto s = std::string(a);
	assert(s.size() == 32);
	assert(Uuid::valid_string(s));
	assert(Uuid(s) == a);
	assert(std::hash<Uuid>()(Uuid(s)) == std::hash<Uuid>()(a));

	auto c = Uuid("00112233445566778899aabbccddeeff");
	assert(std::string(c) == "00112233445566778899aabbccddeeff");
	assert(c != Uuid("00112233445566778899aabbccddeefe"));
	auto os = std::ostringstream();
	os << c;
	assert(os.str() == "00112233445566778899aabbccddeeff");

	assert(!Uuid::valid_string(""));
	assert(!Uuid::valid_string("00112233445566778899aabbccddeef"));
	assert(!Uuid::valid_string("00112233445566778899aabbccddeeff00"));
	assert(!Uuid::valid_string("00112233445566778899aabbccddeegg"));
	auto caught = false;
	try {
		Uuid("not-a-uuid");
	} catch (std::invalid_argument const&) {
		caught = true;
	}
	assert(caught);

	/* Usable as a key.  */
	auto m = std::unordered_map<Uuid, int>();
	m[a] = 1;
	m[b] = 2;
	m[Uuid(s)] = 3;
	assert(m.size() == 2);
	assert(m[a] == 3);

	return 0;
}
