//
//  FlowSystem.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "FlowSystem.hpp"
#include "misc.hpp"

FlowSystem::FlowSystem (const vector<double> &dtInHours) : dtInHours(dtInHours), dataTransformed(false) {
	if (dtInHours.empty()) {
		throw ModelingException("A flow system needs at least one time step");
	}
}

Effect* FlowSystem::addEffect (Effect *effect) {
	return effects.addEffect(effect);
}

Bus* FlowSystem::addBus (Bus *bus) {
	unique_ptr<Bus> owned (bus);
	if (getBus(bus->label) != NULL) {
		throw ModelingException("Bus " + bus->label + " already exists");
	}
	buses.push_back(move(owned));
	return bus;
}

Component* FlowSystem::addComponent (Component *component) {
	unique_ptr<Component> owned (component);
	if (getComponent(component->label) != NULL) {
		throw ModelingException("Component " + component->label + " already exists");
	}
	components.push_back(move(owned));
	return component;
}

Bus* FlowSystem::getBus (const string &label) const {
	for (unsigned int i=0; i<buses.size(); i++) {
		if (buses[i]->label == label) return buses[i].get();
	}
	return NULL;
}

Component* FlowSystem::getComponent (const string &label) const {
	for (unsigned int i=0; i<components.size(); i++) {
		if (components[i]->label == label) return components[i].get();
	}
	return NULL;
}

/****************************************************************************
 * transformData
 * - Checks that every flow is connected to a bus of this system and that
 * every series matches the horizon. Fills in default sizes.
 ****************************************************************************/
void FlowSystem::transformData (const ModelingConfig &config, Diagnostics &diagnostics) {
	if (dataTransformed) return;

	for (unsigned int c=0; c<components.size(); c++) {
		vector<Flow*> flows = components[c]->getFlows();
		for (unsigned int f=0; f<flows.size(); f++) {
			if (getBus(flows[f]->bus->label) != flows[f]->bus) {
				throw ModelingException("The bus " + flows[f]->bus->label + " of flow " + flows[f]->labelFull()
										+ " is not part of the flow system");
			}
		}
	}

	effects.transformData(nrOfTimeSteps(), config, diagnostics);
	for (unsigned int b=0; b<buses.size(); b++) {
		buses[b]->transformData(nrOfTimeSteps(), config, diagnostics);
	}
	for (unsigned int c=0; c<components.size(); c++) {
		components[c]->transformData(nrOfTimeSteps(), config, diagnostics);
	}

	dataTransformed = true;
}

SystemModel* FlowSystem::createSystemModel (int firstTimeIndex, int nrOfSteps, const ModelingConfig &config,
											Diagnostics &diagnostics) const
{
	if (firstTimeIndex < 0 || nrOfSteps <= 0 || firstTimeIndex + nrOfSteps > nrOfTimeSteps()) {
		throw ModelingException("The window [" + numToStr(firstTimeIndex) + ", " + numToStr(firstTimeIndex + nrOfSteps)
								+ ") is not part of the horizon of " + numToStr(nrOfTimeSteps()) + " time steps");
	}

	vector<double> windowDt		= slice(dtInHours, firstTimeIndex, firstTimeIndex + nrOfSteps);
	vector<double> previousDt	= slice(dtInHours, 0, firstTimeIndex);
	if (firstTimeIndex == 0) previousDt.clear();

	return new SystemModel(windowDt, config, diagnostics, firstTimeIndex, previousDt);
}

/****************************************************************************
 * doModeling
 * - Builds the window in dependency order:
 *		effects (share ledger) -> components (flows first) -> buses -> objective
 ****************************************************************************/
void FlowSystem::doModeling (SystemModel &system) {
	if (!dataTransformed) {
		throw ModelingException("The data of the flow system has to be transformed before modeling");
	}

	EffectCollectionModel *effectCollectionModel = new EffectCollectionModel(effects);
	system.addElementModel(effectCollectionModel);
	effectCollectionModel->doModeling(system);

	for (unsigned int c=0; c<components.size(); c++) {
		ElementModel *model = system.addElementModel(new ComponentModel(*components[c]));
		model->doModeling(system);
	}

	for (unsigned int b=0; b<buses.size(); b++) {
		ElementModel *model = system.addElementModel(new BusModel(*buses[b]));
		model->doModeling(system);
	}

	effectCollectionModel->addObjective(system);
}

void FlowSystem::updatePreviousValues (const Solution &solution, const SystemModel &system) {
	for (unsigned int c=0; c<components.size(); c++) {
		vector<Flow*> flows = components[c]->getFlows();
		for (unsigned int f=0; f<flows.size(); f++) {
			const Variable *flowRate = system.getVariable(flows[f]->labelFull() + "__flow_rate");
			flows[f]->previousFlowRate = solution.get(flowRate->label);
		}
	}
}
