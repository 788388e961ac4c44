#include"Ev/Io.hpp"
#include"FairSwap/Msg/Log.hpp"
#include"FairSwap/log.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include<cstring>
#include<initializer_list>
#include<stdarg.h>

namespace FairSwap {

char const* log_level_name(LogLevel l) {
	switch (l) {
	case Trace: return "trace";
	case Debug: return "debug";
	case Info: return "info";
	case Warn: return "warn";
	case Error: return "error";
	}
	return "unknown";
}

bool log_level_from_string(char const* s, LogLevel& l) {
	for (auto c : {Trace, Debug, Info, Warn, Error}) {
		if (std::strcmp(s, log_level_name(c)) == 0) {
			l = c;
			return true;
		}
	}
	return false;
}

Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...) {
	va_list ap;

	auto msg = std::string();

	va_start(ap, fmt);
	msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	return bus.raise(Msg::Log{l, std::move(msg)});
}

}
