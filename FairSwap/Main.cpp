#include"Ev/Io.hpp"
#include"FairSwap/DbLedger.hpp"
#include"FairSwap/Main.hpp"
#include"FairSwap/Mod/EventRecorder.hpp"
#include"FairSwap/Mod/Logger.hpp"
#include"FairSwap/Mod/SwapCoordinator.hpp"
#include"FairSwap/Msg/DbResource.hpp"
#include"FairSwap/instance_json.hpp"
#include"FairSwap/log.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Sqlite3/Db.hpp"
#include"Swap/Coordinator.hpp"
#include"Swap/Error.hpp"
#include"Swap/Instance.hpp"
#include"Swap/Override/Hold.hpp"
#include"Swap/Override/Unwind.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include"Uuid.hpp"
#include<map>
#include<stdexcept>

#ifndef PACKAGE_STRING
# define PACKAGE_STRING "fairswap"
#endif

namespace {

/* Seconds to wait on another fairswap process holding
 * the database.  */
auto constexpr db_busy_timeout = double(10);

/* Thrown for bad command lines; exit code 1.  */
struct UsageError : public std::invalid_argument {
	explicit
	UsageError(std::string const& msg) : std::invalid_argument(msg) { }
};

double parse_seconds(std::string const& key, std::string const& value) {
	if (!Util::Str::isdecimal(value))
		throw UsageError( "--" + key + " needs a whole number of "
				  "seconds, not \"" + value + "\""
				);
	try {
		return std::stod(value);
	} catch (std::out_of_range const&) {
		throw UsageError( "--" + key + " is too large: " + value
				);
	}
}

}

namespace FairSwap {

class Main::Impl {
private:
	std::ostream& cout;
	std::ostream& cerr;
	std::function<double()> get_now;

	std::string argv0;
	bool is_version;
	bool is_help;
	std::string usage_error;

	std::string db_path;
	Swap::PartyId caller;
	Swap::Config config;
	std::string override_policy;
	LogLevel log_level;
	std::vector<std::string> args;

	std::unique_ptr<S::Bus> bus;
	std::unique_ptr<Mod::Logger> logger;
	std::unique_ptr<DbLedger> ledger;
	std::unique_ptr<Mod::EventRecorder> recorder;
	std::unique_ptr<Mod::SwapCoordinator> coordinator;

	typedef std::function<Ev::Io<Json::Out>()> Action;
	struct Command {
		/* Number of arguments after the command name.  */
		std::size_t min_args;
		std::size_t max_args;
		bool needs_caller;
		Action action;
	};
	std::map<std::string, Command> commands;

	void parse_option(std::string const& key, std::string const& value) {
		if (key == "version")
			is_version = true;
		else if (key == "help")
			is_help = true;
		else if (key == "db")
			db_path = value;
		else if (key == "as")
			caller = Swap::PartyId(value);
		else if (key == "admin")
			config.admin = Swap::PartyId(value);
		else if (key == "cancel-delay")
			config.cancel_delay = parse_seconds(key, value);
		else if (key == "override-delay")
			config.override_delay = parse_seconds(key, value);
		else if (key == "collateral-account")
			config.collateral_account = Swap::AccountId(value);
		else if (key == "override-policy") {
			if (value != "hold" && value != "unwind")
				throw UsageError( "--override-policy must be "
						  "hold or unwind"
						);
			override_policy = value;
		} else if (key == "log-level") {
			if (!log_level_from_string(value.c_str(), log_level))
				throw UsageError("unknown log level: " + value);
		} else
			throw UsageError("Unrecognized option: --" + key);
	}

	void parse(std::vector<std::string> const& argv) {
		auto i = std::size_t(1);
		for (; i < argv.size(); ++i) {
			auto key = std::string();
			auto value = std::string();
			if (!Util::Str::split_option(argv[i], key, value))
				break;
			parse_option(key, value);
		}
		for (; i < argv.size(); ++i)
			args.push_back(argv[i]);
		config.validate();
		if (!is_version && !is_help && args.empty())
			throw UsageError("No command given.");
	}

	void usage(std::ostream& os) {
		os << "Usage: " << argv0 << " [options] <command> [args...]" << std::endl
		   << std::endl
		   << "Options:" << std::endl
		   << " --db=FILE                  Database (default fairswap.sqlite3)." << std::endl
		   << " --as=PARTY                 Identity making the call." << std::endl
		   << " --admin=PARTY              Administrator allowed to override." << std::endl
		   << " --cancel-delay=SECONDS     Delay before cancel (default 86400)." << std::endl
		   << " --override-delay=SECONDS   Delay before override (default 604800)." << std::endl
		   << " --collateral-account=ACCT  Collateral account (default collateral)." << std::endl
		   << " --override-policy=POLICY   hold (default) or unwind." << std::endl
		   << " --log-level=LEVEL          trace, debug, info, warn or error." << std::endl
		   << " --version                  Show version." << std::endl
		   << " --help                     Show this help." << std::endl
		   << std::endl
		   << "Commands:" << std::endl
		   << " create COUNTERPARTY COLLATERAL" << std::endl
		   << " set-terms ID ACCOUNT QUANTITY" << std::endl
		   << " accept ID | confirm ID | finalize ID | cancel ID | override ID" << std::endl
		   << " reclaim ID ACCOUNT" << std::endl
		   << " review ID | stage ID | other-party ID PARTY | list | events [ID]" << std::endl
		   << " ledger-credit ACCOUNT HOLDER AMOUNT" << std::endl
		   << " ledger-transfer ACCOUNT TO AMOUNT" << std::endl
		   << " ledger-balance ACCOUNT HOLDER" << std::endl
		   ;
	}

	void build() {
		bus = Util::make_unique<S::Bus>();
		logger = Util::make_unique<Mod::Logger>(*bus, cerr, log_level);
		ledger = Util::make_unique<DbLedger>(*bus);
		recorder = Util::make_unique<Mod::EventRecorder>(*bus, get_now);
		auto policy = std::shared_ptr<Swap::OverrideIF const>();
		if (override_policy == "unwind")
			policy = std::make_shared<Swap::Override::Unwind>();
		else
			policy = std::make_shared<Swap::Override::Hold>();
		coordinator = Util::make_unique<Mod::SwapCoordinator>(
			*bus, *ledger, config, policy, get_now
		);
		register_commands();
	}

	static
	Json::Out instance_result(Swap::Instance const& inst) {
		return instance_json(inst);
	}
	Action instance_action(std::function<Ev::Io<Swap::Instance>()> f) {
		return [f]() {
			return f().then([](Swap::Instance inst) {
				return Ev::lift(instance_result(inst));
			});
		};
	}

	void register_commands() {
		commands["create"] = Command{2, 2, true, instance_action([this]() {
			return coordinator->create_swap( caller
						       , Swap::PartyId(args[1])
						       , Swap::Amount(args[2])
						       );
		})};
		commands["set-terms"] = Command{3, 3, true, instance_action([this]() {
			return coordinator->set_terms( Uuid(args[1]), caller
						     , Swap::AccountId(args[2])
						     , Swap::Amount(args[3])
						     );
		})};
		commands["accept"] = Command{1, 1, true, instance_action([this]() {
			return coordinator->accept_terms(Uuid(args[1]), caller);
		})};
		commands["confirm"] = Command{1, 1, true, instance_action([this]() {
			return coordinator->confirm_deposit(Uuid(args[1]), caller);
		})};
		commands["finalize"] = Command{1, 1, true, instance_action([this]() {
			return coordinator->request_final_transfer(Uuid(args[1]), caller);
		})};
		commands["cancel"] = Command{1, 1, true, instance_action([this]() {
			return coordinator->cancel(Uuid(args[1]), caller);
		})};
		commands["override"] = Command{1, 1, true, instance_action([this]() {
			return coordinator->manual_override(Uuid(args[1]), caller);
		})};
		commands["review"] = Command{1, 1, false, instance_action([this]() {
			return coordinator->review(Uuid(args[1]));
		})};

		commands["reclaim"] = Command{2, 2, true, [this]() {
			return coordinator->reclaim( Uuid(args[1]), caller
						   , Swap::AccountId(args[2])
						   ).then([](Swap::Amount amount) {
				return Ev::lift(Json::Out()
					.start_object()
						.field("reclaimed", std::string(amount))
					.end_object()
				);
			});
		}};
		commands["stage"] = Command{1, 1, false, [this]() {
			return coordinator->review(Uuid(args[1])).then([](Swap::Instance inst) {
				return Ev::lift(Json::Out()
					.start_object()
						.field("stage", std::string(Swap::stage_name(inst.stage())))
					.end_object()
				);
			});
		}};
		commands["other-party"] = Command{2, 2, false, [this]() {
			auto party = Swap::PartyId(args[2]);
			return coordinator->review(Uuid(args[1])).then([party](Swap::Instance inst) {
				auto other = Swap::Coordinator::other_party(inst, party);
				return Ev::lift(Json::Out()
					.start_object()
						.field("other_party", std::string(other))
					.end_object()
				);
			});
		}};
		commands["list"] = Command{0, 0, false, [this]() {
			return coordinator->list().then([](std::vector<Swap::Instance> insts) {
				auto js = Json::Out();
				auto arr = js.start_array();
				for (auto const& inst : insts)
					arr.entry(instance_json(inst));
				arr.end_array();
				return Ev::lift(js);
			});
		}};
		commands["events"] = Command{0, 1, false, [this]() {
			auto io = (args.size() > 1) ? recorder->history(Uuid(args[1]))
						 : recorder->all()
						 ;
			return io.then([](std::vector<Mod::EventRecorder::Entry> es) {
				auto js = Json::Out();
				auto arr = js.start_array();
				for (auto const& e : es)
					arr.start_object()
						.field("time", e.time)
						.field("id", e.uuid)
						.field("kind", e.kind)
						.field("party", e.party)
						.field("detail", e.detail)
					.end_object();
				arr.end_array();
				return Ev::lift(js);
			});
		}};

		commands["ledger-credit"] = Command{3, 3, false, [this]() {
			auto account = Swap::AccountId(args[1]);
			auto holder = Swap::PartyId(args[2]);
			auto amount = Swap::Amount(args[3]);
			return ledger->credit(account, holder, amount)
				.then([this, account, holder]() {
				return ledger->balance(account, holder);
			}).then([](Swap::Amount balance) {
				return Ev::lift(Json::Out()
					.start_object()
						.field("balance", std::string(balance))
					.end_object()
				);
			});
		}};
		commands["ledger-transfer"] = Command{3, 3, true, [this]() {
			return ledger->transfer( Swap::AccountId(args[1])
					       , caller
					       , Swap::PartyId(args[2])
					       , Swap::Amount(args[3])
					       ).then([](bool ok) {
				return Ev::lift(Json::Out()
					.start_object()
						.field("transferred", ok)
					.end_object()
				);
			});
		}};
		commands["ledger-balance"] = Command{2, 2, false, [this]() {
			return ledger->balance( Swap::AccountId(args[1])
					      , Swap::PartyId(args[2])
					      ).then([](Swap::Amount balance) {
				return Ev::lift(Json::Out()
					.start_object()
						.field("balance", std::string(balance))
					.end_object()
				);
			});
		}};
	}

	Ev::Io<Json::Out> dispatch() {
		auto it = commands.find(args[0]);
		if (it == commands.end())
			throw UsageError("Unknown command: " + args[0]);
		auto const& cmd = it->second;
		auto n = args.size() - 1;
		if (n < cmd.min_args || n > cmd.max_args)
			throw UsageError("Wrong number of arguments to " + args[0]);
		if (cmd.needs_caller && !caller)
			throw UsageError(args[0] + " needs --as=PARTY");
		return cmd.action();
	}

	Ev::Io<int> report_error(Swap::Error const& e) {
		cout << Json::Out()
			.start_object()
				.start_object("error")
					.field("code", e.code())
					.field("message", std::string(e.what()))
				.end_object()
			.end_object()
			.output()
		     << std::endl
		     ;
		return log(*bus, Warn, "%s: %s", e.code().c_str(), e.what())
			.then([]() {
			return Ev::lift(2);
		});
	}
	Ev::Io<int> report_usage(std::string const& msg) {
		cerr << argv0 << ": " << msg << std::endl;
		usage(cerr);
		return Ev::lift(1);
	}

public:
	Impl( std::vector<std::string> argv
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    , std::function<double()> get_now_
	    ) : cout(cout_)
	      , cerr(cerr_)
	      , get_now(std::move(get_now_))
	      , argv0(argv.empty() ? "fairswap" : argv[0])
	      , is_version(false)
	      , is_help(false)
	      , db_path("fairswap.sqlite3")
	      , override_policy("hold")
	      , log_level(Info)
	      {
		try {
			parse(argv);
		} catch (std::invalid_argument const& e) {
			usage_error = e.what();
		}
	}

	Ev::Io<int> run() {
		if (!usage_error.empty())
			return report_usage(usage_error);
		if (is_version) {
			cout << PACKAGE_STRING << std::endl;
			return Ev::lift(0);
		}
		if (is_help) {
			usage(cout);
			return Ev::lift(0);
		}

		return Ev::lift().then([this]() {
			build();
			auto db = Sqlite3::Db(db_path, db_busy_timeout);
			return bus->raise(Msg::DbResource{db});
		}).then([this]() {
			return dispatch();
		}).then([this](Json::Out js) {
			cout << js.output() << std::endl;
			return Ev::lift(0);
		}).catching<Swap::Error>([this](Swap::Error const& e) {
			return report_error(e);
		}).catching<std::invalid_argument>([this](std::invalid_argument const& e) {
			return report_usage(e.what());
		}).catching<std::out_of_range>([this](std::out_of_range const& e) {
			return report_usage(e.what());
		});
	}
};

Main::Main( std::vector<std::string> argv
	  , std::ostream& cout
	  , std::ostream& cerr
	  , std::function<double()> get_now
	  ) : pimpl(Util::make_unique<Impl>( std::move(argv)
					   , cout
					   , cerr
					   , std::move(get_now)
					   ))
	    { }
Main::Main(Main&& o) : pimpl(std::move(o.pimpl)) { }
Main::~Main() { }

Ev::Io<int> Main::run() {
	return pimpl->run();
}

}
