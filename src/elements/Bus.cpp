//
//  Bus.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "Bus.hpp"
#include "Flow.hpp"
#include "../effects/Effect.hpp"
#include "../misc.hpp"

Bus::Bus (const string &label, const boost::optional<TimeSeries> &excessPenaltyPerFlowHour) :
	Element(label), excessPenaltyPerFlowHour(excessPenaltyPerFlowHour) {}

void Bus::transformData (int nrOfTimeSteps, const ModelingConfig &config, Diagnostics &diagnostics) {
	if (!excessPenaltyPerFlowHour) return;

	excessPenaltyPerFlowHour->checkLength(nrOfTimeSteps, labelFull() + ": excess_penalty_per_flow_hour");
	if (excessPenaltyPerFlowHour->maximum() == 0 && excessPenaltyPerFlowHour->minimum() == 0) {
		diagnostics.warning(Diagnostics::ZERO_EXCESS_PENALTY, labelFull(),
							"the excess_penalty_per_flow_hour is 0. Use none or a value > 0.");
	}
}

BusModel::BusModel (Bus &bus) :
	ElementModel(bus), busBalance(NULL), excessInput(NULL), excessOutput(NULL), bus(bus) {}

void BusModel::doModeling (SystemModel &system) {
	// eq: sum(inputs(t)) - sum(outputs(t)) [+ excess_input(t) - excess_output(t)] = 0
	busBalance = system.createEquation("busBalance", *this);
	for (unsigned int i=0; i<bus.inputs.size(); i++) {
		if (bus.inputs[i]->model == NULL) {
			throw ModelingException(labelFull() + ": flow " + bus.inputs[i]->labelFull() + " has to be modeled before the bus");
		}
		busBalance->addSummand(bus.inputs[i]->model->flowRate, 1);
	}
	for (unsigned int i=0; i<bus.outputs.size(); i++) {
		if (bus.outputs[i]->model == NULL) {
			throw ModelingException(labelFull() + ": flow " + bus.outputs[i]->labelFull() + " has to be modeled before the bus");
		}
		busBalance->addSummand(bus.outputs[i]->model->flowRate, -1);
	}

	if (!bus.withExcess()) return;

	vector<double> excessPenalty = multiply(system.dtInHours, system.activeData(*bus.excessPenaltyPerFlowHour));

	excessInput	 = system.createVariable("excess_input", *this, system.nrOfTimeSteps, toVector(0.0));
	excessOutput = system.createVariable("excess_output", *this, system.nrOfTimeSteps, toVector(0.0));

	busBalance->addSummand(excessOutput, -1);
	busBalance->addSummand(excessInput, 1);

	if (system.effectCollectionModel == NULL) {
		throw ModelingException(labelFull() + ": the excess penalty needs an effect collection model");
	}
	system.effectCollectionModel->addShareToPenalty(system, bus.labelFull() + "__excess_input", excessInput, excessPenalty);
	system.effectCollectionModel->addShareToPenalty(system, bus.labelFull() + "__excess_output", excessOutput, excessPenalty);
}
