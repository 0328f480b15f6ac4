//
//  SystemModel.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "SystemModel.hpp"
#include "misc.hpp"

SystemModel::SystemModel (const vector<double> &dtInHours, const ModelingConfig &config, Diagnostics &diagnostics,
						  int firstTimeIndex, const vector<double> &previousDtInHours) :
	nrOfTimeSteps((int) dtInHours.size()), firstTimeIndex(firstTimeIndex), dtInHours(dtInHours),
	config(config), diagnostics(diagnostics), effectCollectionModel(NULL)
{
	if (nrOfTimeSteps == 0) {
		throw ModelingException("A horizon needs at least one time step");
	}
	for (int t=0; t<nrOfTimeSteps; t++) {
		if (dtInHours[t] <= 0) {
			throw ModelingException("Time step " + numToStr(t) + " has a non-positive duration");
		}
	}

	indices		   = indexRange(0, nrOfTimeSteps);
	dtInHoursTotal = sum(dtInHours);

	// without history, earlier steps are assumed to be as long as the first one
	this->previousDtInHours = previousDtInHours.empty() ? toVector(dtInHours[0]) : previousDtInHours;
}

/****************************************************************************
 * createVariable
 * - Creates a variable labeled "<owner>__<label>" and registers it in the
 * owning model. Unset bounds are unbounded.
 ****************************************************************************/
Variable* SystemModel::createVariable (const string &label, ElementModel &owner, int length,
									   const OptionalNumeric &lowerBound, const OptionalNumeric &upperBound,
									   bool isBinary, const OptionalNumeric &fixedValue, const OptionalNumeric &previousValues)
{
	string fullLabel = owner.labelFull() + "__" + label;
	if (variableMap.count(fullLabel)) {
		throw ModelingException("Variable " + fullLabel + " already exists");
	}

	variables.push_back(unique_ptr<Variable>(new Variable(fullLabel, label, length,
								 lowerBound ? *lowerBound : vector<double>(),
								 upperBound ? *upperBound : vector<double>(),
								 isBinary,
								 fixedValue ? *fixedValue : vector<double>(),
								 previousValues ? *previousValues : vector<double>())));

	Variable *var = variables.back().get();
	variableList.push_back(var);
	variableMap[fullLabel] = var;
	owner.variables.push_back(var);
	return var;
}

Equation* SystemModel::createEquation (const string &label, ElementModel &owner, Equation::EquationType type) {
	string fullLabel = owner.labelFull() + "__" + label;
	if (equationMap.count(fullLabel)) {
		throw ModelingException("Equation " + fullLabel + " already exists");
	}

	equations.push_back(unique_ptr<Equation>(new Equation(fullLabel, label, type)));

	Equation *eq = equations.back().get();
	equationList.push_back(eq);
	equationMap[fullLabel] = eq;
	owner.equations.push_back(eq);
	return eq;
}

ElementModel* SystemModel::addElementModel (ElementModel *model) {
	elementModels.push_back(unique_ptr<ElementModel>(model));
	return model;
}

vector<double> SystemModel::activeData (const TimeSeries &ts) const {
	return ts.activeData(firstTimeIndex, nrOfTimeSteps);
}

void SystemModel::addObjectiveTerm (Variable *variable, double coefficient) {
	for (int i=0; i<variable->length; i++) {
		Equation::Term term = {variable, i, coefficient};
		objective.push_back(term);
	}
}

Variable* SystemModel::getVariable (const string &label) const {
	map<string, Variable*>::const_iterator it = variableMap.find(label);
	if (it == variableMap.end()) {
		throw ModelingException("Unknown variable " + label);
	}
	return it->second;
}

Equation* SystemModel::getEquation (const string &label) const {
	map<string, Equation*>::const_iterator it = equationMap.find(label);
	if (it == equationMap.end()) {
		throw ModelingException("Unknown equation " + label);
	}
	return it->second;
}

/****************************************************************************
 * checkSolution
 * - Evaluates an assignment of all variables against bounds, integrality
 * and every equation row.
 * - Returns "<label>[index]" for each violation; empty if feasible.
 ****************************************************************************/
vector<string> SystemModel::checkSolution (const Solution &solution, double tolerance) const {
	vector<string> violations;

	for (unsigned int v=0; v<variableList.size(); v++) {
		const Variable *var = variableList[v];
		const vector<double> &vals = solution.get(var->label);
		if ((int) vals.size() != var->length) {
			violations.push_back(var->label);
			continue;
		}
		for (int i=0; i<var->length; i++) {
			if (vals[i] < var->lb(i) - tolerance || vals[i] > var->ub(i) + tolerance
				|| (var->isBinary && isFractional(vals[i], tolerance))) {
				violations.push_back(var->label + "[" + numToStr(i) + "]");
			}
		}
	}

	for (unsigned int e=0; e<equationList.size(); e++) {
		const Equation *eq = equationList[e];
		for (int r=0; r<eq->nrOfRows(); r++) {
			if (!eq->isSatisfied(r, solution, tolerance)) {
				violations.push_back(eq->label + "[" + numToStr(r) + "]");
			}
		}
	}

	return violations;
}
