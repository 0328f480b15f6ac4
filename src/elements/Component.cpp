//
//  Component.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "Component.hpp"
#include "Bus.hpp"
#include "../features/OnOffModel.hpp"
#include "../features/PreventSimultaneousUsageModel.hpp"
#include "../misc.hpp"

Component::Component (const string &label, const vector<Flow*> &inputs, const vector<Flow*> &outputs,
					  const boost::optional<OnOffParameters> &onOffParameters, const vector<string> &preventSimultaneousFlows) :
	Element(label), inputs(inputs), outputs(outputs), onOffParameters(onOffParameters),
	preventSimultaneousFlows(preventSimultaneousFlows)
{
	vector<Flow*> allFlows = getFlows();

	/* the component owns its flows from here on, except those owned elsewhere */
	for (unsigned int i=0; i<allFlows.size(); i++) {
		if (allFlows[i] == NULL || allFlows[i]->comp != NULL) continue;
		bool owned = false;
		for (unsigned int j=0; j<flows.size(); j++) {
			if (flows[j].get() == allFlows[i]) owned = true;
		}
		if (!owned) flows.push_back(unique_ptr<Flow>(allFlows[i]));
	}

	for (unsigned int i=0; i<allFlows.size(); i++) {
		if (allFlows[i] == NULL) {
			throw ModelingException("Component " + label + " got an empty flow");
		}
		if (allFlows[i]->comp != NULL) {
			throw ModelingException("Flow " + allFlows[i]->label + " already belongs to component "
									+ allFlows[i]->comp->label);
		}
	}

	for (unsigned int i=0; i<allFlows.size(); i++) {
		for (unsigned int j=0; j<i; j++) {
			if (allFlows[i]->label == allFlows[j]->label) {
				throw ModelingException("Component " + label + " has two flows labeled " + allFlows[i]->label);
			}
		}
	}

	for (unsigned int i=0; i<preventSimultaneousFlows.size(); i++) {
		if (getFlow(preventSimultaneousFlows[i]) == NULL) {
			throw ModelingException("Component " + label + " has no flow " + preventSimultaneousFlows[i]
									+ " to prevent simultaneous usage of");
		}
	}

	registerComponentInFlows();
	registerFlowsInBus();
}

vector<Flow*> Component::getFlows () const {
	vector<Flow*> allFlows (inputs);
	allFlows.insert(allFlows.end(), outputs.begin(), outputs.end());
	return allFlows;
}

Flow* Component::getFlow (const string &label) const {
	vector<Flow*> allFlows = getFlows();
	for (unsigned int i=0; i<allFlows.size(); i++) {
		if (allFlows[i]->label == label) return allFlows[i];
	}
	return NULL;
}

void Component::transformData (int nrOfTimeSteps, const ModelingConfig &config, Diagnostics &diagnostics) {
	if (onOffParameters) onOffParameters->transformData(nrOfTimeSteps, labelFull());

	for (unsigned int i=0; i<flows.size(); i++) {
		flows[i]->transformData(nrOfTimeSteps, config, diagnostics);
	}
}

void Component::registerComponentInFlows () {
	for (unsigned int i=0; i<flows.size(); i++) flows[i]->comp = this;
}

void Component::registerFlowsInBus () {
	for (unsigned int i=0; i<inputs.size(); i++)  inputs[i]->bus->addOutput(inputs[i]);
	for (unsigned int i=0; i<outputs.size(); i++) outputs[i]->bus->addInput(outputs[i]);
}

ComponentModel::ComponentModel (Component &component) : ElementModel(component), component(component) {}

ComponentModel::~ComponentModel () {}

void ComponentModel::doModeling (SystemModel &system) {
	vector<Flow*> allFlows = component.getFlows();

	/* every flow of a switched component and of the exclusive group needs its own on variable */
	if (component.onOffParameters) {
		for (unsigned int i=0; i<allFlows.size(); i++) {
			if (!allFlows[i]->onOffParameters) allFlows[i]->onOffParameters = OnOffParameters();
		}
	}
	for (unsigned int i=0; i<component.preventSimultaneousFlows.size(); i++) {
		Flow *flow = component.getFlow(component.preventSimultaneousFlows[i]);
		if (!flow->onOffParameters) flow->onOffParameters = OnOffParameters();
	}

	for (unsigned int i=0; i<allFlows.size(); i++) {
		unique_ptr<FlowModel> flowModel (new FlowModel(*allFlows[i]));
		flowModel->doModeling(system);
		flowModels.push_back(move(flowModel));
	}

	if (component.onOffParameters) {
		vector<Variable*>		flowRates;
		vector<NumericBounds>	bounds;
		for (unsigned int i=0; i<flowModels.size(); i++) {
			flowRates.push_back(flowModels[i]->flowRate);
			bounds.push_back(flowModels[i]->absoluteFlowRateBounds(system));
		}
		onOff.reset(new OnOffModel(component, *component.onOffParameters, flowRates, bounds));
		onOff->doModeling(system);
	}

	if (!component.preventSimultaneousFlows.empty()) {
		vector<Variable*> onVariables;
		for (unsigned int i=0; i<component.preventSimultaneousFlows.size(); i++) {
			Flow *flow = component.getFlow(component.preventSimultaneousFlows[i]);
			onVariables.push_back(flow->model->getOnOff()->on);
		}
		preventSimultaneousUsage.reset(new PreventSimultaneousUsageModel(component, onVariables));
		preventSimultaneousUsage->doModeling(system);
	}
}
