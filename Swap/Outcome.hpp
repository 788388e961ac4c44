#ifndef SWAP_OUTCOME_HPP
#define SWAP_OUTCOME_HPP

#include"Swap/Effect.hpp"
#include"Swap/Event.hpp"
#include<vector>

namespace Swap {

/* Result of a successful transition: the transfers to
 * make, then the notifications to raise, each in order.  */
struct Outcome {
	std::vector<Effect> effects;
	std::vector<Event> events;
};

}

#endif /* !defined(SWAP_OUTCOME_HPP) */
