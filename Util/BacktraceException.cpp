#include"Util/BacktraceException.hpp"

#if FAIRSWAP_EXCEPTION_BACKTRACE

namespace Util {

std::string program_path;

}

#endif
