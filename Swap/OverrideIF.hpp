#ifndef SWAP_OVERRIDEIF_HPP
#define SWAP_OVERRIDEIF_HPP

#include"Swap/Effect.hpp"
#include<vector>

namespace Swap { struct Config; }
namespace Swap { struct Instance; }

namespace Swap {

/** class Swap::OverrideIF
 *
 * @brief settlement policy for an administrator's
 * manual override of a stuck swap.
 *
 * @desc `settle` is called only after the caller and
 * timing have been checked, with the instance as
 * stored.  It must not assume any transfer beyond the
 * ones it returns.
 */
class OverrideIF {
public:
	struct Settlement {
		std::vector<Effect> effects;
		/* Whether the instance is reset afterwards.  */
		bool close;
	};

	virtual ~OverrideIF() { }

	virtual
	Settlement settle(Instance const&, Config const&) const =0;
};

}

#endif /* !defined(SWAP_OVERRIDEIF_HPP) */
