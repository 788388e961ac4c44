#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the libev main loop with the given
 * action as the first greenthread, returning the
 * exit code the action produced once the loop has
 * nothing left to do.
 *
 * @desc If the action fails, the exception is
 * printed to stderr and 254 is returned.
 * 255 is returned if libev cannot initialize.
 */
int start(Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
