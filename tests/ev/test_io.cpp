#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Swap/Error.hpp"
#include<assert.h>
#include<exception>
#include<memory>
#include<stdexcept>
#include<string>

namespace {

Ev::Io<std::string> refuse() {
	return Ev::fail<std::string>(Swap::CancelBlocked("bob confirmed"));
}

}

int main() {
	auto ran = std::make_shared<int>(0);

	auto code = Ev::yield().then([]() {
		/* A throw inside a continuation skips the rest of
		 * the chain up to the matching handler.  */
		throw Swap::TimingViolation("too early");
		return Ev::lift(std::string("unreachable"));
	}).then([](std::string) {
		assert(false);
		return Ev::lift(std::string("unreachable"));
	}).catching<Swap::Error>([](Swap::Error const& e) {
		return Ev::lift(e.code());
	}).then([](std::string code) {
		assert(code == "timing_violation");

		/* Handlers for other types let it through.  */
		return refuse().catching<std::invalid_argument>([](std::invalid_argument const&) {
			return Ev::lift(std::string("wrong handler"));
		}).catching<Swap::CancelBlocked>([](Swap::CancelBlocked const& e) {
			return Ev::lift(e.code());
		});
	}).then([](std::string code) {
		assert(code == "cancel_blocked");

		/* A handler that throws replaces the failure.  */
		return refuse().catching<Swap::Error>([](Swap::Error const&) {
			throw std::out_of_range("rethrown");
			return Ev::lift(std::string());
		}).catching<std::out_of_range>([](std::out_of_range const& e) {
			return Ev::lift(std::string(e.what()));
		});
	}).then([ran](std::string what) {
		assert(what == "rethrown");

		/* An action that yields lets this one continue and
		 * resumes later from the main loop.  */
		auto other = Ev::yield().then([ran]() {
			++*ran;
			return Ev::lift();
		});
		other.run([]() { }, [](std::exception_ptr) {
			assert(false);
		});
		assert(*ran == 0);
		return Ev::yield(2);
	}).then([ran]() {
		assert(*ran == 1);
		assert(Ev::now() > 0);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
