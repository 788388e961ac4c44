#include"Swap/Override/Hold.hpp"

namespace Swap { namespace Override {

OverrideIF::Settlement
Hold::settle(Instance const&, Config const&) const {
	return Settlement{std::vector<Effect>(), false};
}

}}
