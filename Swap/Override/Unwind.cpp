#include"Swap/Config.hpp"
#include"Swap/Detail/payout.hpp"
#include"Swap/Instance.hpp"
#include"Swap/Override/Unwind.hpp"
#include<initializer_list>

using Swap::Detail::pay_collateral;
using Swap::Detail::pay_deposit;

namespace Swap { namespace Override {

OverrideIF::Settlement
Unwind::settle(Instance const& inst, Config const& config) const {
	auto rv = Settlement{std::vector<Effect>(), true};
	auto& effects = rv.effects;
	auto const& tracker = inst.tracker;

	switch (inst.stage()) {
	case Started:
		break;

	case TermsSet:
		for (auto s : {SlotA, SlotB})
			if (tracker.completed(s))
				pay_collateral( effects, inst, config, s, s
					      , Effect::CollateralRefund
					      );
		break;

	case TermsAccepted:
		for (auto s : {SlotA, SlotB})
			pay_collateral( effects, inst, config, s, s
				      , Effect::CollateralRefund
				      );
		for (auto s : {SlotA, SlotB})
			if (tracker.completed(s))
				pay_deposit( effects, inst, s, s
					   , Effect::DepositReturn
					   );
		break;

	case DepositConfirmed:
		if (!tracker.completed(SlotA) && !tracker.completed(SlotB)) {
			for (auto s : {SlotA, SlotB})
				pay_collateral( effects, inst, config, s, s
					      , Effect::CollateralRefund
					      );
			for (auto s : {SlotA, SlotB})
				pay_deposit( effects, inst, s, s
					   , Effect::DepositReturn
					   );
		} else {
			/* Finish the exchange for the party that has
			 * not finalized yet.  */
			auto done = tracker.completed(SlotA) ? SlotA : SlotB;
			auto pending = other_slot(done);
			pay_deposit( effects, inst, done, pending
				   , Effect::AssetDelivery
				   );
			pay_collateral( effects, inst, config
				      , pending, pending
				      , Effect::CollateralRefund
				      );
		}
		break;

	case ReadyToStart:
	case Executed:
		/* Coordinator never asks at these stages.  */
		rv.close = false;
		break;
	}
	return rv;
}

}}
