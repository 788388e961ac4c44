#include"FairSwap/instance_json.hpp"
#include"Swap/Instance.hpp"

namespace {

Json::Out terms_json(Swap::Terms const& t) {
	return Json::Out()
		.start_object()
			.field("account", std::string(t.account))
			.field("quantity", std::string(t.quantity))
		.end_object()
		;
}

}

namespace FairSwap {

Json::Out instance_json(Swap::Instance const& inst) {
	auto const& tracker = inst.tracker;
	return Json::Out()
		.start_object()
			.field("id", std::string(inst.id))
			.field("stage", std::string(Swap::stage_name(inst.stage())))
			.field("closed", std::string(Swap::close_reason_name(inst.closed)))
			.field("initiator", std::string(inst.parties.initiator()))
			.field("counterparty", std::string(inst.parties.counterparty()))
			.field("collateral", std::string(inst.collateral))
			.field("start_time", inst.start_time)
			.field("accepted_time", inst.accepted_time)
			.start_object("completed")
				.field("initiator", tracker.completed(Swap::SlotA))
				.field("counterparty", tracker.completed(Swap::SlotB))
			.end_object()
			.start_object("terms")
				.field("initiator", terms_json(inst.terms[Swap::SlotA]))
				.field("counterparty", terms_json(inst.terms[Swap::SlotB]))
			.end_object()
			.start_object("escrow")
				.field( "initiator"
				      , std::string(Swap::escrow_holder(inst.id, Swap::SlotA))
				      )
				.field( "counterparty"
				      , std::string(Swap::escrow_holder(inst.id, Swap::SlotB))
				      )
			.end_object()
		.end_object()
		;
}

}
