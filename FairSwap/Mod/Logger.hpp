#ifndef FAIRSWAP_MOD_LOGGER_HPP
#define FAIRSWAP_MOD_LOGGER_HPP

#include"FairSwap/log.hpp"
#include<ostream>

namespace S { class Bus; }

namespace FairSwap { namespace Mod {

/** class FairSwap::Mod::Logger
 *
 * @brief writes `FairSwap::Msg::Log` messages at or
 * above a minimum level to a stream, one per line, as
 * `fairswap: <level>: <message>`.
 */
class Logger {
private:
	std::ostream& os;
	LogLevel min_level;

	void start(S::Bus& bus);

public:
	Logger() =delete;
	Logger(Logger const&) =delete;

	Logger( S::Bus& bus
	      , std::ostream& os_
	      , LogLevel min_level_ = Info
	      ) : os(os_), min_level(min_level_) { start(bus); }
};

}}

#endif /* !defined(FAIRSWAP_MOD_LOGGER_HPP) */
