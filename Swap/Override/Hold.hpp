#ifndef SWAP_OVERRIDE_HOLD_HPP
#define SWAP_OVERRIDE_HOLD_HPP

#include"Swap/OverrideIF.hpp"

namespace Swap { namespace Override {

/** class Swap::Override::Hold
 *
 * @brief the default override policy: record the
 * override and move nothing.
 *
 * @desc The instance stays open, so the parties can
 * still finish or cancel it.
 */
class Hold : public OverrideIF {
public:
	Settlement settle(Instance const&, Config const&) const override;
};

}}

#endif /* !defined(SWAP_OVERRIDE_HOLD_HPP) */
