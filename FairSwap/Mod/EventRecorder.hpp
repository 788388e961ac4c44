#ifndef FAIRSWAP_MOD_EVENTRECORDER_HPP
#define FAIRSWAP_MOD_EVENTRECORDER_HPP

#include"Ev/now.hpp"
#include<functional>
#include<memory>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }
class Uuid;

namespace FairSwap { namespace Mod {

/** class FairSwap::Mod::EventRecorder
 *
 * @brief keeps every swap notification in the
 * `"FairSwap_events"` table, so the history of a swap
 * survives across invocations.
 */
class EventRecorder {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	struct Entry {
		double time;
		std::string uuid;
		/* e.g. "terms_set", "transfer_failed".  */
		std::string kind;
		/* Empty for swap-wide events.  */
		std::string party;
		std::string detail;
	};

	EventRecorder() =delete;

	EventRecorder(EventRecorder&&);
	~EventRecorder();

	explicit
	EventRecorder(S::Bus& bus, std::function<double()> get_now = &Ev::now);

	/* Recorded events of one swap, oldest first.  */
	Ev::Io<std::vector<Entry>> history(Uuid const& id);
	/* Every recorded event, oldest first.  */
	Ev::Io<std::vector<Entry>> all();
};

}}

#endif /* !defined(FAIRSWAP_MOD_EVENTRECORDER_HPP) */
