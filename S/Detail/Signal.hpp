#ifndef S_DETAIL_SIGNAL_HPP
#define S_DETAIL_SIGNAL_HPP

#include<Ev/Io.hpp>
#include<S/Detail/SignalBase.hpp>
#include<functional>
#include<memory>

namespace S { namespace Detail {

/* Registers callbacks for a particular type a, and
 * broadcasts to all callbacks.
 *
 * Callbacks run one after the other, in the order they
 * subscribed; a later callback sees everything an
 * earlier one did.
 * If callbacks fail, the remaining callbacks still run
 * and the first failure is re-raised at the end.
 */
template<typename a>
class Signal : public SignalBase {
private:
	/* Singly-linked list, so that subscribing from inside
	 * a callback does not disturb an ongoing raise.  */
	struct Node {
		std::function<Ev::Io<void>(a const&)> callback;
		std::shared_ptr<Node> next;
	};
	std::shared_ptr<Node> first;
	Node* last;

	struct RaiseData {
		a value;
		std::exception_ptr exc;
		explicit
		RaiseData(a value_) : value(std::move(value_)), exc(nullptr) { }
	};

	static
	Ev::Io<void> raise_loop( std::shared_ptr<RaiseData> pdata
			       , std::shared_ptr<Node> it
			       ) {
		if (!it)
			return Ev::Io<void>([pdata]( std::function<void()> pass
						   , std::function<void(std::exception_ptr)> fail
						   ) {
				if (pdata->exc)
					fail(pdata->exc);
				else
					pass();
			});

		return Ev::Io<void>([pdata, it]( std::function<void()> pass
					       , std::function<void(std::exception_ptr)>
					       ) {
			auto record = [pdata, pass](std::exception_ptr e) {
				if (!pdata->exc)
					pdata->exc = e;
				pass();
			};
			try {
				it->callback(pdata->value).run(pass, record);
			} catch (...) {
				record(std::current_exception());
			}
		}).then([pdata, it]() {
			return raise_loop(pdata, it->next);
		});
	}

public:
	Signal() : first(), last(nullptr) { }

	/* `a` must be at least movable.
	 * The general expected use-case is that `a` is a
	 * very dumb data-only structure.
	 */
	Ev::Io<void> raise(a value) {
		auto pdata = std::make_shared<RaiseData>(std::move(value));
		return raise_loop(std::move(pdata), first);
	}

	void subscribe(std::function<Ev::Io<void>(a const&)> callback) {
		if (!callback)
			return;
		auto nnode = std::make_shared<Node>();
		nnode->callback = std::move(callback);
		if (last) {
			last->next = std::move(nnode);
			last = last->next.get();
		} else {
			first = std::move(nnode);
			last = first.get();
		}
	}
};

}}

#endif /* !defined(S_DETAIL_SIGNAL_HPP) */
