#ifndef EV_IO_HPP
#define EV_IO_HPP

#include<exception>
#include<functional>
#include<memory>
#include<utility>

namespace Ev {

/* Pre-declare for Detail::IoInner.  */
template<typename a>
class Io;

namespace Detail {

/* Given an Io<a>, extract the type a.  */
template<typename t>
struct IoInner;
template<typename a>
struct IoInner<Io<a>> {
	using type = a;
};

/* Given a type a, give the std::function that accepts that type.  */
template<typename a>
struct PassFunc {
	using type = std::function<void(a)>;
};
template<>
struct PassFunc<void> {
	using type = std::function<void()>;
};

typedef std::function<void (std::exception_ptr)> FailFunc;

/* Type of the action returned by calling f with arguments as.  */
template<typename f, typename... as>
struct ThenResult {
	using io = decltype(std::declval<f&>()(std::declval<as>()...));
	using type = typename IoInner<io>::type;
};

}

/** class Ev::Io<a>
 *
 * @brief An action that, when run, eventually either
 * passes a value of type `a` or fails with an exception.
 *
 * @desc Continuation monad.
 * Nothing happens until the action is `run`, which is
 * normally done by `Ev::start`.
 * Exceptions thrown inside `then` continuations are
 * routed to the failure path and can be handled with
 * `catching`.
 */
template<typename a>
class Io {
public:
	typedef std::function<void ( typename Detail::PassFunc<a>::type
				   , Detail::FailFunc
				   )> CoreFunc;

private:
	CoreFunc core;

	template<typename b>
	friend class Io;

public:
	Io(CoreFunc core_) : core(std::move(core_)) { }

	/* (>>=) :: IO a -> (a -> IO b) -> IO b */
	template<typename f>
	Io<typename Detail::ThenResult<f, a>::type>
	then(f func) const {
		using b = typename Detail::ThenResult<f, a>::type;
		auto core_copy = core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , Detail::FailFunc fail
			      ) {
			auto sub_pass = [func, pass, fail](a value) {
				auto next = typename Io<b>::CoreFunc();
				try {
					next = func(std::move(value)).core;
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				try {
					next(pass, fail);
				} catch (...) {
					fail(std::current_exception());
				}
			};
			try {
				core_copy(sub_pass, fail);
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}

	/* Handle failures of exception type e (or derived).
	 * Other exceptions propagate unchanged.  */
	template<typename e>
	Io<a> catching(std::function<Io<a>(e const&)> handler) const {
		auto core_copy = core;
		return Io<a>([ core_copy
			     , handler
			     ]( typename Detail::PassFunc<a>::type pass
			      , Detail::FailFunc fail
			      ) {
			auto sub_fail = [pass, fail, handler](std::exception_ptr err) {
				auto next = CoreFunc();
				try {
					std::rethrow_exception(err);
				} catch (e const& ex) {
					try {
						next = handler(ex).core;
					} catch (...) {
						fail(std::current_exception());
						return;
					}
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				next(pass, fail);
			};
			try {
				core_copy(pass, sub_fail);
			} catch (...) {
				sub_fail(std::current_exception());
			}
		});
	}

	/* Execute the action.
	 * Exactly one of pass or fail is called, exactly once.  */
	void run( typename Detail::PassFunc<a>::type pass
		, Detail::FailFunc fail
		) const noexcept {
		auto completed = std::make_shared<bool>(false);
		auto sub_pass = [completed, pass](a value) {
			if (!*completed) {
				*completed = true;
				pass(std::move(value));
			}
		};
		auto sub_fail = [completed, fail](std::exception_ptr e) {
			if (!*completed) {
				*completed = true;
				fail(std::move(e));
			}
		};
		try {
			core(sub_pass, sub_fail);
		} catch (...) {
			sub_fail(std::current_exception());
		}
	}
};

/* Separate implementation for Io<void>, whose
 * continuations take no argument.  */
template<>
class Io<void> {
public:
	typedef std::function<void ( std::function<void()>
				   , Detail::FailFunc
				   )> CoreFunc;

private:
	CoreFunc core;

	template<typename b>
	friend class Io;

public:
	Io(CoreFunc core_) : core(std::move(core_)) { }

	/* (>>=) :: IO () -> (() -> IO b) -> IO b */
	template<typename f>
	Io<typename Detail::ThenResult<f>::type>
	then(f func) const {
		using b = typename Detail::ThenResult<f>::type;
		auto core_copy = core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , Detail::FailFunc fail
			      ) {
			auto sub_pass = [func, pass, fail]() {
				auto next = typename Io<b>::CoreFunc();
				try {
					next = func().core;
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				try {
					next(pass, fail);
				} catch (...) {
					fail(std::current_exception());
				}
			};
			try {
				core_copy(sub_pass, fail);
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}

	template<typename e>
	Io<void> catching(std::function<Io<void>(e const&)> handler) const {
		auto core_copy = core;
		return Io<void>([ core_copy
				, handler
				]( std::function<void()> pass
				 , Detail::FailFunc fail
				 ) {
			auto sub_fail = [pass, fail, handler](std::exception_ptr err) {
				auto next = CoreFunc();
				try {
					std::rethrow_exception(err);
				} catch (e const& ex) {
					try {
						next = handler(ex).core;
					} catch (...) {
						fail(std::current_exception());
						return;
					}
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				next(pass, fail);
			};
			try {
				core_copy(pass, sub_fail);
			} catch (...) {
				sub_fail(std::current_exception());
			}
		});
	}

	void run( std::function<void()> pass
		, Detail::FailFunc fail
		) const noexcept {
		auto completed = std::make_shared<bool>(false);
		auto sub_pass = [completed, pass]() {
			if (!*completed) {
				*completed = true;
				pass();
			}
		};
		auto sub_fail = [completed, fail](std::exception_ptr e) {
			if (!*completed) {
				*completed = true;
				fail(std::move(e));
			}
		};
		try {
			core(sub_pass, sub_fail);
		} catch (...) {
			sub_fail(std::current_exception());
		}
	}
};

template<typename a>
Io<a> lift(a val) {
	auto container = std::make_shared<a>(std::move(val));
	return Io<a>([container]( std::function<void(a)> pass
				, Detail::FailFunc
				) {
		pass(std::move(*container));
	});
}
inline
Io<void> lift() {
	return Io<void>([]( std::function<void()> pass
			  , Detail::FailFunc
			  ) {
		pass();
	});
}

/* An action that fails with the given exception.  */
template<typename a, typename e>
Io<a> fail(e err) {
	auto ptr = std::make_exception_ptr(std::move(err));
	return Io<a>([ptr]( typename Detail::PassFunc<a>::type
			  , Detail::FailFunc fail
			  ) {
		fail(ptr);
	});
}

}

#endif /* !defined(EV_IO_HPP) */
