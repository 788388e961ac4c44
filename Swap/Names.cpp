#include"Swap/Effect.hpp"
#include"Swap/Event.hpp"

namespace Swap {

char const* purpose_name(Effect::Purpose p) {
	switch (p) {
	case Effect::AssetDelivery: return "asset_delivery";
	case Effect::CollateralRefund: return "collateral_refund";
	case Effect::CollateralForfeit: return "collateral_forfeit";
	case Effect::DepositReturn: return "deposit_return";
	case Effect::ExcessReturn: return "excess_return";
	case Effect::Reclaim: return "reclaim";
	}
	return "unknown";
}

char const* event_name(Event::Kind k) {
	switch (k) {
	case Event::SwapStarted: return "swap_started";
	case Event::TermsSet: return "terms_set";
	case Event::TermsAccepted: return "terms_accepted";
	case Event::DepositConfirmed: return "deposit_confirmed";
	case Event::Executed: return "executed";
	case Event::Cancelled: return "cancelled";
	case Event::Completed: return "completed";
	case Event::Overridden: return "overridden";
	case Event::Reclaimed: return "reclaimed";
	}
	return "unknown";
}

}
