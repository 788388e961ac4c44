#include"Swap/Config.hpp"
#include<stdexcept>
#include<string>

namespace Swap {

void Config::validate() const {
	if (!(cancel_delay >= 0))
		throw std::invalid_argument(
			"cancel delay must not be negative"
		);
	if (!(override_delay > cancel_delay))
		throw std::invalid_argument(
			"override delay (" + std::to_string(override_delay) +
			") must exceed cancel delay (" +
			std::to_string(cancel_delay) + ")"
		);
	if (!collateral_account)
		throw std::invalid_argument("no collateral account");
}

}
