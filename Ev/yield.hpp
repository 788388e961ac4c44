#ifndef EV_YIELD_HPP
#define EV_YIELD_HPP

#include<cstddef>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::yield
 *
 * @brief Does nothing, but allows other Ev::Io greenthreads
 * to continue processing.
 *
 * @desc Because other greenthreads may execute while your
 * greenthread goes through this function, anything you
 * read before the yield may have changed after it.
 *
 * @param num_yields - How many times to yield.
 * Usually omitted; tests use it to let modules settle.
 */
Ev::Io<void> yield();

Ev::Io<void> yield(std::size_t num_yields);

}

#endif /* !defined(EV_YIELD_HPP) */
