#ifndef FAIRSWAP_MSG_LOG_HPP
#define FAIRSWAP_MSG_LOG_HPP

#include"FairSwap/log.hpp"
#include<string>

namespace FairSwap { namespace Msg {

/** struct FairSwap::Msg::Log
 *
 * @brief raised by `FairSwap::log`; written out by
 * `FairSwap::Mod::Logger`.
 */
struct Log {
	LogLevel level;
	std::string message;
};

}}

#endif /* !defined(FAIRSWAP_MSG_LOG_HPP) */
