#ifndef EV_NOW_HPP
#define EV_NOW_HPP

namespace Ev {

/** Ev::now
 *
 * @brief returns the current time, in seconds
 * from the epoch.
 *
 * @desc Modules that gate behavior on elapsed time
 * take a `std::function<double()>` defaulting to
 * this, so tests can substitute a mock clock.
 */
double now();

}

#endif /* !defined(EV_NOW_HPP) */
