#ifndef UUID_HPP
#define UUID_HPP

#include<cstdint>
#include<cstring>
#include<iostream>
#include<memory>
#include<string>

/** class Uuid
 *
 * @brief a unique 128-bit identifier, used to name
 * swap instances.
 *
 * @desc this is ***not*** an RFC4122-standard UUID,
 * just 16 random bytes.
 * A default-constructed `Uuid` is the all-zero
 * identifier, which is false in a boolean context and
 * never names a swap.
 */
class Uuid {
private:
	struct Impl {
		std::uint8_t data[16];
	};
	std::shared_ptr<Impl> pimpl;

public:
	Uuid() =default;
	Uuid(Uuid&&) =default;
	Uuid(Uuid const&) =default;
	Uuid& operator=(Uuid&&) =default;
	Uuid& operator=(Uuid const&) =default;
	~Uuid() =default;

	/* Construct a fresh random UUID.  */
	static Uuid random();

	bool operator==(Uuid const& o) const;
	bool operator!=(Uuid const& o) const {
		return !(*this == o);
	}

	explicit operator bool() const;
	bool operator!() const {
		return !bool(*this);
	}

	/* 32 lowercase hex digits.  */
	explicit operator std::string() const;
	/* Throws std::invalid_argument if not valid_string.  */
	explicit Uuid(std::string const&);
	static
	bool valid_string(std::string const&);

	std::size_t hash() const {
		auto rv = std::size_t(0);
		if (pimpl)
			std::memcpy(&rv, pimpl->data, sizeof(rv));
		return rv;
	}
};

inline
std::ostream& operator<<(std::ostream& os, Uuid const& i) {
	return os << std::string(i);
}

namespace std {

template<>
struct hash<Uuid> {
	std::size_t operator()(Uuid const& i) const {
		return i.hash();
	}
};

}

#endif /* !defined(UUID_HPP) */
