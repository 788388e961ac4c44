#ifndef SWAP_DETAIL_LABEL_HPP
#define SWAP_DETAIL_LABEL_HPP

#include<string>

namespace Swap { namespace Detail {

/* Labels are 1 to 128 characters from
 * [A-Za-z0-9_.:@-].  */
bool valid_label(std::string const&);

/* Throws std::invalid_argument naming `what` if the
 * label is invalid.  */
void check_label(char const* what, std::string const&);

}}

#endif /* !defined(SWAP_DETAIL_LABEL_HPP) */
