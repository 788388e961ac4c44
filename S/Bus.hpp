#ifndef S_BUS_HPP
#define S_BUS_HPP

#include<S/Detail/Signal.hpp>
#include<Util/make_unique.hpp>
#include<functional>
#include<memory>
#include<typeindex>
#include<typeinfo>

namespace S {

/** class S::Bus
 *
 * @brief signal bus connecting the fairswap modules.
 *
 * @desc Messages are keyed by their exact C++ type;
 * a subscriber to a base type never sees a derived one.
 * Modules subscribe in their constructors and never
 * unsubscribe, so the bus must outlive every module
 * constructed on it.
 */
class Bus {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Bus();
	Bus(Bus&&);
	~Bus();

private:
	/* Maps message type to Signal object.
	 * If the given type has no Signal object yet,
	 * call the make function.
	 */
	S::Detail::SignalBase&
	get_signal( std::type_index type
		  , std::function< std::unique_ptr<S::Detail::SignalBase>()
				 > make
		  );
	/* Type-safe lookup of Signal object.  */
	template<typename a>
	S::Detail::Signal<a>& get_signal_ex() {
		using Signal = S::Detail::Signal<a>;
		static auto type = std::type_index(typeid(Signal));
		static auto make = []() {
			return std::unique_ptr<S::Detail::SignalBase>(
				Util::make_unique<Signal>()
			);
		};
		auto& sbase = get_signal(type, make);
		return static_cast<Signal&>(sbase);
	}
public:
	/* Handlers run in subscription order.  */
	template<typename a>
	void subscribe(std::function<Ev::Io<void>(a const&)> cb) {
		get_signal_ex<a>().subscribe(std::move(cb));
	}
	/* Completes after every handler for `a` has run.
	 * A failing handler does not stop the later ones;
	 * the first failure is rethrown to the raiser at
	 * the end.  */
	template<typename a>
	Ev::Io<void> raise(a value) {
		return get_signal_ex<a>().raise(std::move(value));
	}
};

}

#endif /* !defined(S_BUS_HPP) */
