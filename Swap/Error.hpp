#ifndef SWAP_ERROR_HPP
#define SWAP_ERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Swap {

/** class Swap::Error
 *
 * @brief base of every protocol failure the coordinator
 * reports to a caller.
 *
 * @desc `code()` is a stable machine-readable name,
 * printed by the command line as `error.code`.
 * An operation that throws one of these has changed
 * nothing.
 */
class Error : public Util::BacktraceException<std::runtime_error> {
private:
	std::string c;

public:
	Error( std::string code_
	     , std::string const& msg
	     ) : Util::BacktraceException<std::runtime_error>(msg)
	       , c(std::move(code_))
	       { }

	std::string const& code() const { return c; }
};

/* Wrong stage or bad argument.  */
struct PreconditionViolation : public Error {
	explicit
	PreconditionViolation( std::string const& msg
			     ) : Error("precondition_violation", msg) { }
protected:
	PreconditionViolation( std::string code_
			     , std::string const& msg
			     ) : Error(std::move(code_), msg) { }
};
struct InvalidParty : public PreconditionViolation {
	explicit
	InvalidParty( std::string const& msg
		    ) : PreconditionViolation("invalid_party", msg) { }
};
struct CollateralMismatch : public PreconditionViolation {
	explicit
	CollateralMismatch( std::string const& msg
			  ) : PreconditionViolation("collateral_mismatch", msg) { }
};

/* The state the caller asks for was already reached.  */
struct InvalidState : public Error {
protected:
	InvalidState( std::string code_
		    , std::string const& msg
		    ) : Error(std::move(code_), msg) { }
};
struct TermsAlreadySet : public InvalidState {
	explicit
	TermsAlreadySet( std::string const& msg
		       ) : InvalidState("terms_already_set", msg) { }
};
struct StageAlreadyCompleted : public InvalidState {
	explicit
	StageAlreadyCompleted( std::string const& msg
			     ) : InvalidState("stage_already_completed", msg) { }
};
struct AlreadyExecuted : public InvalidState {
	explicit
	AlreadyExecuted( std::string const& msg
		       ) : InvalidState("already_executed", msg) { }
};

struct InsufficientDeposit : public Error {
	explicit
	InsufficientDeposit( std::string const& msg
			   ) : Error("insufficient_deposit", msg) { }
};
struct CancelBlocked : public Error {
	explicit
	CancelBlocked( std::string const& msg
		     ) : Error("cancel_blocked", msg) { }
};
struct Unauthorized : public Error {
	explicit
	Unauthorized( std::string const& msg
		    ) : Error("unauthorized", msg) { }
};
struct TimingViolation : public Error {
	explicit
	TimingViolation( std::string const& msg
		       ) : Error("timing_violation", msg) { }
};
struct UnknownSwap : public Error {
	explicit
	UnknownSwap( std::string const& msg
		   ) : Error("unknown_swap", msg) { }
};

}

#endif /* !defined(SWAP_ERROR_HPP) */
