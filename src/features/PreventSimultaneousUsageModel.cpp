//
//  PreventSimultaneousUsageModel.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "PreventSimultaneousUsageModel.hpp"
#include "../misc.hpp"

PreventSimultaneousUsageModel::PreventSimultaneousUsageModel (Element &element, const vector<Variable*> &variables,
															  const string &label) :
	ElementModel(element, label), variables(variables)
{
	if (variables.size() < 2) {
		throw ModelingException(labelFull() + ": at least two variables are needed, got " + numToStr(variables.size()));
	}
	for (unsigned int i=0; i<variables.size(); i++) {
		if (variables[i] == NULL || !variables[i]->isBinary) {
			throw ModelingException(labelFull() + ": "
									+ (variables[i] == NULL ? string("missing variable") : variables[i]->label)
									+ " must be binary");
		}
	}
}

void PreventSimultaneousUsageModel::doModeling (SystemModel &system) {
	// eq: sum(binary_i(t)) <= 1 + slack
	Equation *eq = system.createEquation("prevent_simultaneous_use", *this, Equation::INEQUALITY);
	for (unsigned int i=0; i<variables.size(); i++) {
		eq->addSummand(variables[i], 1);
	}
	eq->addConstant(1 + system.config.binarySlack);
}
