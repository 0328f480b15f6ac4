//
//  OnOffModel.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "OnOffModel.hpp"
#include "../effects/Effect.hpp"
#include "../misc.hpp"

OnOffModel::OnOffModel (Element &element, const OnOffParameters &parameters,
						const vector<Variable*> &definingVariables, const vector<NumericBounds> &definingBounds,
						const string &label) :
	ElementModel(element, label), on(NULL), totalOnHours(NULL), off(NULL), consecutiveOnHours(NULL),
	consecutiveOffHours(NULL), switchOn(NULL), switchOff(NULL), nrSwitchOn(NULL),
	parameters(parameters), definingVariables(definingVariables), definingBounds(definingBounds)
{
	if (definingVariables.empty()) {
		throw ModelingException(labelFull() + ": on/off needs at least one defining variable");
	}
	if (definingVariables.size() != definingBounds.size()) {
		throw ModelingException(labelFull() + ": every defining variable needs bounds");
	}
}

void OnOffModel::doModeling (SystemModel &system) {
	double epsilon = system.config.epsilon;

	/* no lower bound below epsilon */
	for (unsigned int i=0; i<definingBounds.size(); i++) {
		definingBounds[i].first = elementMax(definingBounds[i].first, epsilon);
	}

	vector<double> previousOn = previousOnValues(epsilon);

	on = system.createVariable("on", *this, system.nrOfTimeSteps, boost::none, boost::none, true,
							   boost::none, previousOn);

	totalOnHours = system.createVariable("totalOnHours", *this, 1,
										 toVector(parameters.onHoursTotalMin ? *parameters.onHoursTotalMin : 0.0),
										 parameters.onHoursTotalMax ? OptionalNumeric(toVector(*parameters.onHoursTotalMax)) : boost::none);

	// eq: totalOnHours = sum(on(t) * dt(t))
	Equation *eqTotalOn = system.createEquation("totalOnHours", *this);
	eqTotalOn->addSummand(on, system.dtInHours, vector<int>(), true);
	eqTotalOn->addSummand(totalOnHours, -1);

	addOnConstraints(system);

	if (parameters.useOff()) {
		vector<double> previousOff (previousOn.size());
		for (unsigned int i=0; i<previousOn.size(); i++) previousOff[i] = 1 - previousOn[i];

		off = system.createVariable("off", *this, system.nrOfTimeSteps, boost::none, boost::none, true,
									boost::none, previousOff);
		addOffConstraints(system);
	}

	if (parameters.useConsecutiveOnHours()) {
		consecutiveOnHours = getDurationInHours(system, "consecutiveOnHours", on,
												parameters.consecutiveOnHoursMin, parameters.consecutiveOnHoursMax);
	}

	if (parameters.useConsecutiveOffHours()) {
		consecutiveOffHours = getDurationInHours(system, "consecutiveOffHours", off,
												 parameters.consecutiveOffHoursMin, parameters.consecutiveOffHoursMax);
	}

	if (parameters.useSwitchOn()) {
		switchOn  = system.createVariable("switchOn", *this, system.nrOfTimeSteps, boost::none, boost::none, true);
		switchOff = system.createVariable("switchOff", *this, system.nrOfTimeSteps, boost::none, boost::none, true);
		nrSwitchOn = system.createVariable("nrSwitchOn", *this, 1, toVector(0.0),
										   parameters.switchOnTotalMax ? OptionalNumeric(toVector(*parameters.switchOnTotalMax)) : boost::none);
		addSwitchConstraints(system);
	}

	createShares(system);
}

/****************************************************************************
 * addOnConstraints
 * - One defining variable:
 *		on(t) * max(epsilon, lower(t)) <= var(t) <= on(t) * upper(t)
 * - Several defining variables:
 *		epsilon * on(t) <= sum(var_i(t))
 *		sum(var_i(t) / n) <= on(t) * sum(upper_i(t)) / n
 * the division by n keeps the coefficients small.
 ****************************************************************************/
void OnOffModel::addOnConstraints (SystemModel &system) {
	double epsilon = system.config.epsilon;
	int nrOfDefiningVariables = (int) definingVariables.size();

	Equation *eqOn1 = system.createEquation("On_Constraint_1", *this, Equation::INEQUALITY);
	Equation *eqOn2 = system.createEquation("On_Constraint_2", *this, Equation::INEQUALITY);

	vector<double> upperBound;
	if (nrOfDefiningVariables == 1) {
		Variable *variable = definingVariables[0];

		// eq: on(t) * max(epsilon, lower(t)) - var(t) <= 0
		eqOn1->addSummand(variable, -1);
		eqOn1->addSummand(on, elementMax(definingBounds[0].first, epsilon));

		// eq: var(t) - on(t) * upper(t) <= 0
		upperBound = definingBounds[0].second;
		eqOn2->addSummand(variable, 1);
		eqOn2->addSummand(on, multiply(upperBound, -1));
	}
	else {
		// eq: - sum(var_i(t)) + epsilon * on(t) <= 0
		for (int i=0; i<nrOfDefiningVariables; i++) {
			eqOn1->addSummand(definingVariables[i], -1);
		}
		eqOn1->addSummand(on, epsilon);

		// eq: sum(var_i(t) / n) - on(t) * sum(upper_i(t)) / n <= 0
		vector<double> absoluteMaximum = toVector(0.0);
		for (int i=0; i<nrOfDefiningVariables; i++) {
			eqOn2->addSummand(definingVariables[i], 1.0 / nrOfDefiningVariables);
			absoluteMaximum = add(absoluteMaximum, definingBounds[i].second);
		}
		upperBound = multiply(absoluteMaximum, 1.0 / nrOfDefiningVariables);
		eqOn2->addSummand(on, multiply(upperBound, -1));
	}

	if (maximum(upperBound) > system.config.bigBinaryBound) {
		system.diagnostics.warning(Diagnostics::BIG_BINARY_BOUND, element.labelFull(),
								   "a binary definition was created with a big upper bound (" + numToStr(maximum(upperBound))
								   + "). This can lead to wrong results regarding the on and off variables. "
								   "Reduce the size (or the maximum invest size) of " + element.labelFull() + ".");
	}
}

void OnOffModel::addOffConstraints (SystemModel &system) {
	// eq: on(t) + off(t) = 1
	Equation *eqOff = system.createEquation("var_off", *this);
	eqOff->addSummand(off, 1);
	eqOff->addSummand(on, 1);
	eqOff->addConstant(1);
}

/****************************************************************************
 * getDurationInHours
 * - Counter of the consecutive hours in which binaryVariable is 1:
 *		binary:		[0, 0, 1, 1, 1, 1, 0, 1, 1, 1, 0]
 *		duration:	[0, 0, 1, 2, 3, 4, 0, 1, 2, 3, 0]	(dt = 1h)
 * - The minimum duration is not checked in the last time step; a run may
 * be cut short by the end of the horizon.
 * - The duration carried over from the previous horizon enters the first
 * time step only.
 ****************************************************************************/
Variable* OnOffModel::getDurationInHours (SystemModel &system, const string &variableLabel, Variable *binaryVariable,
										  const boost::optional<TimeSeries> &minimumDuration,
										  const boost::optional<TimeSeries> &maximumDuration)
{
	int T = system.nrOfTimeSteps;
	vector<int> current  = indexRange(1, T);		// t
	vector<int> previous = indexRange(0, T-1);		// t-1

	double previousDuration;
	try {
		previousDuration = getConsecutiveDuration(binaryVariable->previousValues, system.previousDtInHours,
												  system.config.epsilon);
	}
	catch (ModelingException &e) {
		throw ModelingException("The consecutive duration of " + labelFull() + "__" + variableLabel
								+ " could not be calculated. " + e.what());
	}
	double mega = system.dtInHoursTotal + previousDuration;

	OptionalNumeric upperBound = toVector(mega);
	if (maximumDuration) {
		upperBound = system.activeData(*maximumDuration);
		double firstStepMax = upperBound->front();
		if (previousDuration + system.dtInHours[0] > firstStepMax) {
			system.diagnostics.warning(Diagnostics::MAXIMUM_DURATION, labelFull() + "__" + variableLabel,
									   "the maximum duration is " + numToStr(firstStepMax) + "h, but the consecutive duration "
									   "before this horizon is " + numToStr(previousDuration) + "h. This forces "
									   + binaryVariable->label + " = 0 in the first time step (dt="
									   + numToStr(system.dtInHours[0]) + "h)!");
		}
	}

	Variable *durationInHours = system.createVariable(variableLabel, *this, T, toVector(0.0), upperBound,
													  false, boost::none, toVector(previousDuration));
	const string &prefix = variableLabel;

	// 1) eq: duration(t) - binary(t) * mega <= 0
	Equation *constraint1 = system.createEquation(prefix + "_constraint_1", *this, Equation::INEQUALITY);
	constraint1->addSummand(durationInHours, 1);
	constraint1->addSummand(binaryVariable, -1 * mega);

	if (T > 1) {
		vector<double> dtCurrent = slice(system.dtInHours, 1, T);

		// 2a) eq: duration(t) - duration(t-1) <= dt(t)
		Equation *constraint2a = system.createEquation(prefix + "_constraint_2a", *this, Equation::INEQUALITY);
		constraint2a->addSummand(durationInHours, 1, current);
		constraint2a->addSummand(durationInHours, -1, previous);
		constraint2a->addConstant(dtCurrent);

		// 2b) eq: dt(t) - mega * (1 - binary(t)) <= duration(t) - duration(t-1)
		//	   eq: -duration(t) + duration(t-1) + binary(t) * mega <= -dt(t) + mega
		Equation *constraint2b = system.createEquation(prefix + "_constraint_2b", *this, Equation::INEQUALITY);
		constraint2b->addSummand(durationInHours, -1, current);
		constraint2b->addSummand(durationInHours, 1, previous);
		constraint2b->addSummand(binaryVariable, mega, current);
		constraint2b->addConstant(add(multiply(dtCurrent, -1), mega));
	}

	// 3) minimum duration before the switch-off step, i.e. binary(t) - binary(t+1) = 1
	if (minimumDuration) {
		vector<double> minimumDurationUsed = system.activeData(*minimumDuration);

		if (T > 1) {
			if (!minimumDuration->isScalar()) minimumDurationUsed = slice(minimumDurationUsed, 0, T-1);

			// eq: -duration(t) + minimum(t) * binary(t) - minimum(t) * binary(t+1) <= 0	for t = 0..T-2
			Equation *eqMinDuration = system.createEquation(prefix + "_minimum_duration", *this, Equation::INEQUALITY);
			eqMinDuration->addSummand(durationInHours, -1, previous);
			eqMinDuration->addSummand(binaryVariable, multiply(minimumDurationUsed, -1), current);
			eqMinDuration->addSummand(binaryVariable, minimumDurationUsed, previous);
		}

		// a run carried over that is still too short has to be continued
		double firstStepMin = minimumDurationUsed.front();
		if (0 < previousDuration && previousDuration < firstStepMin) {
			// eq: binary(0) = 1
			Equation *eqMinDurationInitial = system.createEquation(prefix + "_minimum_duration_inital", *this);
			eqMinDurationInitial->addSummand(binaryVariable, 1, vector<int>(1, 0));
			eqMinDurationInitial->addConstant(1);
		}
	}

	// 4) eq: duration(0) = binary(0) * (dt(0) + previous duration)
	Equation *eqFirst = system.createEquation(prefix + "_initial", *this);
	eqFirst->addSummand(durationInHours, 1, vector<int>(1, 0));
	eqFirst->addSummand(binaryVariable, -1 * (system.dtInHours[0] + previousDuration), vector<int>(1, 0));

	return durationInHours;
}

void OnOffModel::addSwitchConstraints (SystemModel &system) {
	int T = system.nrOfTimeSteps;

	// eq: switchOn(t) - switchOff(t) = on(t) - on(t-1)
	if (T > 1) {
		vector<int> current  = indexRange(1, T);
		vector<int> previous = indexRange(0, T-1);

		Equation *eqSwitch = system.createEquation("Switch", *this);
		eqSwitch->addSummand(switchOn, 1, current);
		eqSwitch->addSummand(switchOff, -1, current);
		eqSwitch->addSummand(on, -1, current);
		eqSwitch->addSummand(on, 1, previous);
	}

	// eq: switchOn(0) - switchOff(0) - on(0) = -on(-1)
	Equation *eqInitialSwitch = system.createEquation("Initial_Switch", *this);
	eqInitialSwitch->addSummand(switchOn, 1, vector<int>(1, 0));
	eqInitialSwitch->addSummand(switchOff, -1, vector<int>(1, 0));
	eqInitialSwitch->addSummand(on, -1, vector<int>(1, 0));
	eqInitialSwitch->addConstant(-1 * on->previousValues.back());

	// eq: switchOn(t) + switchOff(t) <= 1 + slack
	Equation *eqSwitchOnOrOff = system.createEquation("Switch_On_or_Off", *this, Equation::INEQUALITY);
	eqSwitchOnOrOff->addSummand(switchOn, 1);
	eqSwitchOnOrOff->addSummand(switchOff, 1);
	eqSwitchOnOrOff->addConstant(1 + system.config.binarySlack);

	// eq: nrSwitchOn = sum(switchOn(t))
	Equation *eqNrSwitchOn = system.createEquation("NrSwitchOn", *this);
	eqNrSwitchOn->addSummand(nrSwitchOn, 1);
	eqNrSwitchOn->addSummand(switchOn, -1, vector<int>(), true);
}

void OnOffModel::createShares (SystemModel &system) {
	EffectCollectionModel *effectCollection = system.effectCollectionModel;
	if (effectCollection == NULL) {
		if (parameters.effectsPerSwitchOn.empty() && parameters.effectsPerRunningHour.empty()) return;
		throw ModelingException(labelFull() + ": shares need an effect collection model");
	}

	// start up effects
	if (!parameters.effectsPerSwitchOn.empty()) {
		effectCollection->addShareToOperation(system, "switch_on_effects", element, parameters.effectsPerSwitchOn,
											  toVector(1.0), switchOn);
	}

	// running effects
	if (!parameters.effectsPerRunningHour.empty()) {
		effectCollection->addShareToOperation(system, "running_hour_effects", element, parameters.effectsPerRunningHour,
											  system.dtInHours, on);
	}
}

vector<double> OnOffModel::previousOnValues (double epsilon) const {
	vector<double> values;
	int length = 0;

	for (unsigned int i=0; i<definingVariables.size(); i++) {
		const Variable *var = definingVariables[i];
		if (!var->hasPreviousValues()) continue;

		if (length == 0) {
			length = (int) var->previousValues.size();
			values = vector<double> (length, 0.0);
		}
		else if ((int) var->previousValues.size() != length) {
			throw ModelingException(labelFull() + ": previous values of the defining variables differ in length");
		}
		for (int t=0; t<length; t++) {
			if (fabs(var->previousValues[t]) > epsilon) values[t] = 1;
		}
	}

	if (values.empty()) return toVector(0.0);
	return values;
}

/****************************************************************************
 * getConsecutiveDuration
 * - Sums the durations of the trailing ones of binaryValues. A single
 * duration is used for every step; otherwise the durations are aligned
 * to the end of binaryValues and have to cover the whole run.
 ****************************************************************************/
double OnOffModel::getConsecutiveDuration (const vector<double> &binaryValues, const vector<double> &dtInHours, double epsilon) {
	if (binaryValues.empty()) return 0.0;
	if (dtInHours.empty()) {
		throw ModelingException("No step durations given for the consecutive duration");
	}

	int nrOfValues = (int) binaryValues.size();
	int lengthOfLastDuration = 0;
	while (lengthOfLastDuration < nrOfValues && fabs(binaryValues[nrOfValues - 1 - lengthOfLastDuration]) > epsilon) {
		lengthOfLastDuration++;
	}

	if (dtInHours.size() == 1) {
		double duration = 0.0;
		for (int k=0; k<lengthOfLastDuration; k++) duration += binaryValues[nrOfValues - 1 - k] * dtInHours[0];
		return duration;
	}

	int nrOfDurations = (int) dtInHours.size();
	if (lengthOfLastDuration > nrOfDurations) {
		throw ModelingException("The last consecutive run (" + numToStr(lengthOfLastDuration)
								+ " steps) is longer than the known step durations (" + numToStr(nrOfDurations) + ")");
	}

	double duration = 0.0;
	for (int k=0; k<lengthOfLastDuration; k++) {
		duration += binaryValues[nrOfValues - 1 - k] * dtInHours[nrOfDurations - 1 - k];
	}
	return duration;
}
