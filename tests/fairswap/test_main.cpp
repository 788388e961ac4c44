#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"FairSwap/Main.hpp"
#include<assert.h>
#include<memory>
#include<sstream>
#include<stdlib.h>
#include<string>
#include<unistd.h>
#include<vector>

namespace {

double mock_now = 0;
double mock_get_now() { return mock_now; }

std::string db_path;

struct Result {
	int code;
	std::string out;
	std::string err;
};

/* Run one `fairswap` invocation against the test db.  */
Ev::Io<Result> fairswap(std::vector<std::string> args) {
	auto cout = std::make_shared<std::ostringstream>();
	auto cerr = std::make_shared<std::ostringstream>();
	auto argv = std::vector<std::string>{"fairswap", "--db=" + db_path};
	argv.insert(argv.end(), args.begin(), args.end());
	auto main = std::make_shared<FairSwap::Main>( argv, *cout, *cerr
						    , &mock_get_now
						    );
	return main->run().then([main, cout, cerr](int code) {
		return Ev::lift(Result{code, cout->str(), cerr->str()});
	});
}

/* Value of the first string field with the given name.  */
std::string field(std::string const& js, std::string const& name) {
	auto key = "\"" + name + "\": \"";
	auto b = js.find(key);
	assert(b != std::string::npos);
	b += key.size();
	auto e = js.find('"', b);
	assert(e != std::string::npos);
	return js.substr(b, e - b);
}

bool contains(std::string const& s, std::string const& part) {
	return s.find(part) != std::string::npos;
}

}

int main() {
	char tpl[] = "/tmp/fairswap-test-XXXXXX";
	auto fd = mkstemp(tpl);
	assert(fd >= 0);
	close(fd);
	db_path = tpl;

	auto id = std::string();
	auto id2 = std::string();

	auto code = Ev::lift().then([&]() {
		return fairswap({"--version"});
	}).then([&](Result r) {
		assert(r.code == 0);
		assert(!r.out.empty());

		return fairswap({"--help"});
	}).then([&](Result r) {
		assert(r.code == 0);
		assert(contains(r.out, "Usage:"));

		/* Usage errors.  */
		return fairswap({});
	}).then([&](Result r) {
		assert(r.code == 1);
		assert(contains(r.err, "No command given."));
		return fairswap({"--frobnicate", "list"});
	}).then([&](Result r) {
		assert(r.code == 1);
		return fairswap({"--cancel-delay=soon", "list"});
	}).then([&](Result r) {
		assert(r.code == 1);
		/* Digits only, but beyond any double.  */
		return fairswap({"--cancel-delay=" + std::string(400, '9'), "list"});
	}).then([&](Result r) {
		assert(r.code == 1);
		assert(contains(r.err, "--cancel-delay is too large"));
		return fairswap({"--override-delay=" + std::string(400, '9'), "list"});
	}).then([&](Result r) {
		assert(r.code == 1);
		return fairswap({"--cancel-delay=900", "--override-delay=600", "list"});
	}).then([&](Result r) {
		assert(r.code == 1);
		return fairswap({"--as=not a party", "list"});
	}).then([&](Result r) {
		assert(r.code == 1);
		return fairswap({"dance"});
	}).then([&](Result r) {
		assert(r.code == 1);
		assert(contains(r.err, "Unknown command: dance"));
		/* Needs a caller.  */
		return fairswap({"create", "bob", "10"});
	}).then([&](Result r) {
		assert(r.code == 1);
		return fairswap({"--as=alice", "create", "bob"});
	}).then([&](Result r) {
		assert(r.code == 1);
		return fairswap({"--as=alice", "create", "bob", "ten"});
	}).then([&](Result r) {
		assert(r.code == 1);

		return fairswap({"list"});
	}).then([&](Result r) {
		assert(r.code == 0);
		assert(r.out == "[]\n");

		mock_now = 1000;
		return fairswap({"--as=alice", "create", "bob", "10"});
	}).then([&](Result r) {
		assert(r.code == 0);
		id = field(r.out, "id");
		assert(id.size() == 32);
		assert(field(r.out, "stage") == "started");
		assert(field(r.out, "initiator") == "alice");
		assert(field(r.out, "counterparty") == "bob");
		assert(field(r.out, "collateral") == "10");
		assert(contains(r.err, "swap_started by alice"));

		return fairswap({"stage", id});
	}).then([&](Result r) {
		assert(r.code == 0);
		assert(r.out == "{\"stage\": \"started\"}\n");

		return fairswap({"other-party", id, "alice"});
	}).then([&](Result r) {
		assert(r.out == "{\"other_party\": \"bob\"}\n");
		return fairswap({"other-party", id, "carol"});
	}).then([&](Result r) {
		assert(r.code == 0);
		assert(r.out == "{\"other_party\": \"\"}\n");

		return fairswap({"--as=alice", "set-terms", id, "gold", "5"});
	}).then([&](Result r) {
		assert(r.code == 0);
		return fairswap({"--as=alice", "set-terms", id, "silver", "9"});
	}).then([&](Result r) {
		/* Protocol errors are printed as JSON.  */
		assert(r.code == 2);
		assert(field(r.out, "code") == "terms_already_set");
		return fairswap({"--as=carol", "set-terms", id, "silver", "9"});
	}).then([&](Result r) {
		assert(r.code == 2);
		assert(field(r.out, "code") == "unauthorized");
		return fairswap({"--as=bob", "set-terms", id, "silver", "7"});
	}).then([&](Result r) {
		assert(r.code == 0);
		assert(field(r.out, "stage") == "terms_set");

		return fairswap({"--as=alice", "accept", id});
	}).then([&](Result r) {
		assert(r.code == 2);
		assert(field(r.out, "code") == "collateral_mismatch");

		return fairswap({"ledger-credit", "collateral", "escrow:" + id + ":a", "10"});
	}).then([&](Result r) {
		assert(r.code == 0);
		assert(r.out == "{\"balance\": \"10\"}\n");
		return fairswap({"ledger-credit", "collateral", "escrow:" + id + ":b", "10"});
	}).then([&](Result r) {
		assert(r.code == 0);
		return fairswap({"--as=alice", "accept", id});
	}).then([&](Result r) {
		assert(r.code == 0);
		mock_now = 1050;
		return fairswap({"--as=bob", "accept", id});
	}).then([&](Result r) {
		assert(r.code == 0);
		assert(field(r.out, "stage") == "terms_accepted");
		assert(contains(r.out, "\"accepted_time\": 1050"));

		return fairswap({"--as=alice", "confirm", id});
	}).then([&](Result r) {
		assert(r.code == 2);
		assert(field(r.out, "code") == "insufficient_deposit");

		/* Deposits go to the escrow holders; alice sends
		 * hers from her own funds.  */
		return fairswap({"ledger-credit", "gold", "alice", "6"});
	}).then([&](Result r) {
		assert(r.code == 0);
		return fairswap({"--as=alice", "ledger-transfer", "gold", "escrow:" + id + ":a", "6"});
	}).then([&](Result r) {
		assert(r.code == 0);
		assert(r.out == "{\"transferred\": true}\n");
		return fairswap({"--as=alice", "ledger-transfer", "gold", "bob", "1"});
	}).then([&](Result r) {
		/* Nothing left.  */
		assert(r.out == "{\"transferred\": false}\n");
		return fairswap({"ledger-credit", "silver", "escrow:" + id + ":b", "7"});
	}).then([&](Result r) {
		assert(r.code == 0);
		return fairswap({"--as=alice", "confirm", id});
	}).then([&](Result r) {
		assert(r.code == 0);
		return fairswap({"ledger-balance", "gold", "alice"});
	}).then([&](Result r) {
		/* One unit of excess came back.  */
		assert(r.out == "{\"balance\": \"1\"}\n");
		return fairswap({"--as=bob", "confirm", id});
	}).then([&](Result r) {
		assert(r.code == 0);
		assert(field(r.out, "stage") == "deposit_confirmed");

		return fairswap({"--as=alice", "cancel", id});
	}).then([&](Result r) {
		assert(r.code == 2);
		assert(field(r.out, "code") == "precondition_violation");

		return fairswap({"--as=alice", "finalize", id});
	}).then([&](Result r) {
		assert(r.code == 0);
		return fairswap({"--as=alice", "finalize", id});
	}).then([&](Result r) {
		assert(r.code == 2);
		assert(field(r.out, "code") == "already_executed");
		return fairswap({"--as=bob", "finalize", id});
	}).then([&](Result r) {
		assert(r.code == 0);
		assert(field(r.out, "stage") == "ready_to_start");
		assert(field(r.out, "closed") == "executed");

		return fairswap({"ledger-balance", "silver", "alice"});
	}).then([&](Result r) {
		assert(r.out == "{\"balance\": \"7\"}\n");
		return fairswap({"ledger-balance", "gold", "bob"});
	}).then([&](Result r) {
		assert(r.out == "{\"balance\": \"5\"}\n");
		return fairswap({"ledger-balance", "collateral", "bob"});
	}).then([&](Result r) {
		assert(r.out == "{\"balance\": \"10\"}\n");

		return fairswap({"events", id});
	}).then([&](Result r) {
		assert(r.code == 0);
		assert(contains(r.out, "\"kind\": \"swap_started\""));
		assert(contains(r.out, "\"kind\": \"completed\""));

		/* A swap that is cancelled.  */
		mock_now = 2000;
		return fairswap({"--as=carol", "create", "dave", "3"});
	}).then([&](Result r) {
		assert(r.code == 0);
		id2 = field(r.out, "id");
		return fairswap({"--as=dave", "cancel", id2});
	}).then([&](Result r) {
		assert(r.code == 2);
		assert(field(r.out, "code") == "timing_violation");
		return fairswap({"--cancel-delay=0", "--as=dave", "cancel", id2});
	}).then([&](Result r) {
		assert(r.code == 0);
		assert(field(r.out, "closed") == "cancelled");

		/* Collateral posted before the cancel is swept back
		 * by its owner.  */
		return fairswap({"ledger-credit", "collateral", "escrow:" + id2 + ":a", "3"});
	}).then([&](Result r) {
		assert(r.code == 0);
		return fairswap({"--as=dave", "reclaim", id2, "collateral"});
	}).then([&](Result r) {
		/* Dave's own escrow is empty.  */
		assert(r.code == 0);
		assert(field(r.out, "reclaimed") == "0");
		return fairswap({"--as=carol", "reclaim", id2, "collateral"});
	}).then([&](Result r) {
		assert(r.code == 0);
		assert(field(r.out, "reclaimed") == "3");
		return fairswap({"ledger-balance", "collateral", "carol"});
	}).then([&](Result r) {
		assert(r.out == "{\"balance\": \"3\"}\n");

		/* Only the configured administrator overrides.  */
		return fairswap({"--as=carol", "override", id2});
	}).then([&](Result r) {
		assert(r.code == 2);
		assert(field(r.out, "code") == "unauthorized");

		return fairswap({"list"});
	}).then([&](Result r) {
		assert(r.code == 0);
		assert(r.out.find(id) < r.out.find(id2));

		return fairswap({"review", "00112233445566778899aabbccddeeff"});
	}).then([&](Result r) {
		assert(r.code == 2);
		assert(field(r.out, "code") == "unknown_swap");
		return fairswap({"review", "not-a-uuid"});
	}).then([&](Result r) {
		assert(r.code == 1);

		unlink(db_path.c_str());
		return Ev::lift(0);
	});

	return Ev::start(code);
}
