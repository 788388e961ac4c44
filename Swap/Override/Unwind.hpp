#ifndef SWAP_OVERRIDE_UNWIND_HPP
#define SWAP_OVERRIDE_UNWIND_HPP

#include"Swap/OverrideIF.hpp"

namespace Swap { namespace Override {

/** class Swap::Override::Unwind
 *
 * @brief override policy that gives every party back
 * what the coordinator holds for it, then closes the
 * instance.
 *
 * @desc Collateral is returned to whoever has posted
 * it: at TermsSet only parties that accepted, from
 * TermsAccepted on both.
 * Deposits are returned once confirmed.
 *
 * At DepositConfirmed with one party already
 * finalized, the other party's deposit has already
 * been delivered, so instead the remaining half of the
 * exchange is completed for the other party.
 */
class Unwind : public OverrideIF {
public:
	Settlement settle(Instance const&, Config const&) const override;
};

}}

#endif /* !defined(SWAP_OVERRIDE_UNWIND_HPP) */
