#ifndef FAIRSWAP_MAIN_HPP
#define FAIRSWAP_MAIN_HPP

#include"Ev/now.hpp"
#include<functional>
#include<memory>
#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }

namespace FairSwap {

/** class FairSwap::Main
 *
 * @brief the `fairswap` command line: parses options,
 * opens the database, runs one command and prints its
 * result as JSON.
 *
 * @desc `run` passes the process exit code:
 * 0 on success, 1 for bad usage, 2 when the swap
 * protocol refuses the command.
 */
class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Main() = delete;
	Main( std::vector<std::string> argv
	    , std::ostream& cout
	    , std::ostream& cerr
	    , std::function<double()> get_now = &Ev::now
	    );
	Main(Main&&);
	~Main();

	Ev::Io<int> run();
};

}

#endif /* !defined(FAIRSWAP_MAIN_HPP) */
