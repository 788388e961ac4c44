#ifndef UTIL_BACKTRACEEXCEPTION_HPP
#define UTIL_BACKTRACEEXCEPTION_HPP

#if !FAIRSWAP_EXCEPTION_BACKTRACE

#include<utility>

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief Exception E, thrown where a failure may end
 * up in front of an operator.
 * Without FAIRSWAP_EXCEPTION_BACKTRACE this only
 * forwards to E.
 */
template<typename T>
class BacktraceException : public T {
public:
	template<typename... Args>
	BacktraceException(Args&&... args)
		: T(std::forward<Args>(args)...) { }

	const char* what() const noexcept override {
		return T::what();
	}
};

}

#else /* FAIRSWAP_EXCEPTION_BACKTRACE */

#include<cstdio>
#include<cstdlib>
#include<errno.h>
#include<execinfo.h>
#include<memory>
#include<sstream>
#include<string>
#include<vector>

#define UNW_LOCAL_ONLY
#include<libunwind.h>

namespace Util {

/* Path of the running program, for addr2line.
 * Set by main; tests fall back to the libc name.  */
extern std::string program_path;

namespace Detail {

struct PcloseDeleter {
	void operator()(FILE* fp) const {
		if (fp)
			pclose(fp);
	}
};

}

/** class Util::BacktraceException<E>
 *
 * @brief Exception E that also records the stack at
 * construction, rendered lazily by `what()`.
 */
template<typename T>
class BacktraceException : public T {
private:
	static constexpr std::size_t max_frames = 64;
	mutable bool formatted;
	mutable std::string message;
	std::vector<unw_word_t> frames;

	void capture() {
		unw_cursor_t cursor;
		unw_context_t context;
		unw_getcontext(&context);
		unw_init_local(&cursor, &context);
		while ( unw_step(&cursor) > 0
		     && frames.size() < max_frames
		      ) {
			unw_word_t ip;
			unw_get_reg(&cursor, UNW_REG_IP, &ip);
			frames.push_back(ip);
		}
	}

	static
	std::string program() {
		if (!program_path.empty())
			return program_path;
		return program_invocation_name;
	}

	static
	std::string addr2line(void* addr) {
		char cmd[512];
		snprintf( cmd, sizeof(cmd), "addr2line -C -f -p -e %s %p"
			, program().c_str(), addr
			);
		auto pipe = std::unique_ptr<FILE, Detail::PcloseDeleter>(
			popen(cmd, "r")
		);
		if (!pipe)
			return " -- unable to run addr2line\n";
		auto rv = std::string();
		char buffer[128];
		while (fgets(buffer, sizeof(buffer), pipe.get()))
			rv += buffer;
		return rv;
	}

	std::string render() const {
		auto ptrs = std::vector<void*>();
		for (auto ip : frames)
			ptrs.push_back(reinterpret_cast<void*>(ip));
		auto symbols = backtrace_symbols(ptrs.data(), int(ptrs.size()));
		auto os = std::ostringstream();
		os << T::what() << "\nBacktrace:\n";
		for (auto i = std::size_t(0); i < ptrs.size(); ++i) {
			auto line = addr2line(ptrs[i]);
			os << "#" << i << " ";
			if (line.find("??") != std::string::npos && symbols)
				os << symbols[i] << "\n";
			else
				os << line;
		}
		free(symbols);
		return os.str();
	}

public:
	template<typename... Args>
	BacktraceException(Args&&... args)
		: T(std::forward<Args>(args)...)
		, formatted(false) {
		capture();
	}

	const char* what() const noexcept override {
		if (!formatted) {
			formatted = true;
			try {
				message = render();
			} catch (std::exception const&) {
				message = T::what();
			}
		}
		return message.c_str();
	}
};

}

#endif /* FAIRSWAP_EXCEPTION_BACKTRACE */

#endif /* !defined(UTIL_BACKTRACEEXCEPTION_HPP) */
