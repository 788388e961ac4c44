#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"FairSwap/Main.hpp"
#include"Util/BacktraceException.hpp"
#include<iostream>
#include<memory>

namespace {

Ev::Io<int> io_main(int argc, char **argv) {
	auto arg_vec = std::vector<std::string>();
	for (int i = 0; i < argc; ++i)
		arg_vec.push_back(std::string(argv[i]));
	auto main_obj = std::make_shared<FairSwap::Main>(
		arg_vec, std::cout, std::cerr
	);
	return main_obj->run().then([main_obj](int ec) {
		/* Keeps main_obj alive until the command is done.  */
		return Ev::lift(ec);
	});
}

}

int main(int argc, char **argv) {
#if FAIRSWAP_EXCEPTION_BACKTRACE
	Util::program_path = argv[0];
#endif
	return Ev::start(io_main(argc, argv));
}
