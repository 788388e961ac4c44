#ifndef FAIRSWAP_INSTANCE_JSON_HPP
#define FAIRSWAP_INSTANCE_JSON_HPP

#include"Json/Out.hpp"

namespace Swap { struct Instance; }

namespace FairSwap {

/* JSON object describing a swap instance, as printed by
 * the command line.  Amounts are decimal strings.  */
Json::Out instance_json(Swap::Instance const&);

}

#endif /* !defined(FAIRSWAP_INSTANCE_JSON_HPP) */
