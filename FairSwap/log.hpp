#ifndef FAIRSWAP_LOG_HPP
#define FAIRSWAP_LOG_HPP

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace FairSwap {

/* Ordered; a logger shows its level and above.  */
enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

char const* log_level_name(LogLevel);
/* Returns false if the string is not a level name.  */
bool log_level_from_string(char const*, LogLevel&);

/* printf-style; raises FairSwap::Msg::Log.  */
Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...)
	__attribute__ ((format (printf, 3, 4)))
;

}

#endif /* !defined(FAIRSWAP_LOG_HPP) */
