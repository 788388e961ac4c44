#include"Ev/Io.hpp"
#include"FairSwap/Mod/Logger.hpp"
#include"FairSwap/Msg/Log.hpp"
#include"S/Bus.hpp"

namespace FairSwap { namespace Mod {

void Logger::start(S::Bus& bus) {
	bus.subscribe<Msg::Log>([this](Msg::Log const& l) {
		if (l.level >= min_level)
			os << "fairswap: " << log_level_name(l.level)
			   << ": " << l.message
			   << std::endl;
		return Ev::lift();
	});
}

}}
