//
//  Flow.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "Flow.hpp"
#include "Bus.hpp"
#include "Component.hpp"
#include "../features/OnOffModel.hpp"
#include "../features/InvestmentModel.hpp"
#include "../effects/Effect.hpp"
#include "../misc.hpp"

Flow::Flow (const string &label, Bus &bus, const TimeSeries &relativeMinimum, const TimeSeries &relativeMaximum) :
	Element(label), bus(&bus), comp(NULL), model(NULL), relativeMinimum(relativeMinimum), relativeMaximum(relativeMaximum)
{
	if (!relativeMinimum.isScalar() && !relativeMaximum.isScalar() && relativeMinimum.size() != relativeMaximum.size()) {
		throw ModelingException(labelFull() + ": relative_minimum and relative_maximum differ in length");
	}
	int n = max(relativeMinimum.size(), relativeMaximum.size());
	for (int t=0; t<n; t++) {
		if (relativeMinimum.at(t) > relativeMaximum.at(t)) {
			throw ModelingException(labelFull() + ": Take care, that relative_minimum <= relative_maximum! (time step "
									+ numToStr(t) + ")");
		}
	}
}

string Flow::labelFull () const {
	string compLabel = comp == NULL ? "unknownComp" : comp->label;
	return compLabel + "__" + label;
}

void Flow::transformData (int nrOfTimeSteps, const ModelingConfig &config, Diagnostics &diagnostics) {
	relativeMinimum.checkLength(nrOfTimeSteps, labelFull() + ": relative_minimum");
	relativeMaximum.checkLength(nrOfTimeSteps, labelFull() + ": relative_maximum");
	if (fixedRelativeProfile) fixedRelativeProfile->checkLength(nrOfTimeSteps, labelFull() + ": fixed_relative_profile");

	for (EffectValues::const_iterator it = effectsPerFlowHour.begin(); it != effectsPerFlowHour.end(); ++it) {
		it->second.checkLength(nrOfTimeSteps, labelFull() + ": effects per flow hour");
	}
	if (onOffParameters) onOffParameters->transformData(nrOfTimeSteps, labelFull());

	if (investParameters) {
		investParameters->transformData(config, labelFull());
	}
	else if (!size) {
		size = config.big;
		if (fixedRelativeProfile) {
			diagnostics.warning(Diagnostics::DEFAULT_SIZE_WITH_PROFILE, labelFull(),
								"no size assigned, but a fixed_relative_profile. The default size is " + numToStr(config.big)
								+ ". As flow_rate = size * fixed_relative_profile, the resulting flow rate will be very high.");
		}
	}
	else if (*size < 0) {
		throw ModelingException(labelFull() + ": the size must not be negative");
	}
}

bool Flow::isInputInComp () const {
	if (comp == NULL) {
		throw ModelingException(labelFull() + " is not attached to a component");
	}
	for (unsigned int i=0; i<comp->inputs.size(); i++) {
		if (comp->inputs[i] == this) return true;
	}
	return false;
}

bool Flow::sizeIsFixed () const {
	return !investParameters || investParameters->fixedSize;
}

bool Flow::investIsOptional () const {
	return !investParameters || investParameters->isOptional;
}

FlowModel::FlowModel (Flow &flow) :
	ElementModel(flow), flowRate(NULL), sumFlowHours(NULL), flow(flow)
{
	flow.model = this;
}

FlowModel::~FlowModel () {
	if (flow.model == this) flow.model = NULL;
}

void FlowModel::doModeling (SystemModel &system) {
	NumericBounds absoluteBounds = absoluteFlowRateBounds(system);

	// eq: relmin(t) * size <= flow_rate(t) <= relmax(t) * size
	OptionalNumeric lowerBound, upperBound;
	if (flow.onOffParameters) {
		lowerBound = toVector(0.0);
	}
	else {
		lowerBound = absoluteBounds.first;
		upperBound = absoluteBounds.second;
		if (flow.withInvestment() && flow.investIsOptional()) lowerBound = toVector(0.0);
	}

	flowRate = system.createVariable("flow_rate", *this, system.nrOfTimeSteps, lowerBound, upperBound, false,
									 boost::none, flow.previousFlowRate.empty() ? OptionalNumeric() : OptionalNumeric(flow.previousFlowRate));

	/* on/off */
	if (flow.onOffParameters) {
		onOff.reset(new OnOffModel(flow, *flow.onOffParameters, vector<Variable*>(1, flowRate),
								   vector<NumericBounds>(1, absoluteBounds)));
		onOff->doModeling(system);
	}

	/* investment */
	if (flow.withInvestment()) {
		OptionalNumeric fixedProfile;
		if (flow.fixedRelativeProfile) fixedProfile = system.activeData(*flow.fixedRelativeProfile);

		investment.reset(new InvestmentModel(flow, *flow.investParameters, flowRate, relativeFlowRateBounds(system),
											 fixedProfile, onOff ? onOff->on : NULL));
		investment->doModeling(system);
	}

	/* flow hours */
	sumFlowHours = system.createVariable("sumFlowHours", *this, 1,
										 flow.flowHoursTotalMin ? OptionalNumeric(toVector(*flow.flowHoursTotalMin)) : boost::none,
										 flow.flowHoursTotalMax ? OptionalNumeric(toVector(*flow.flowHoursTotalMax)) : boost::none);

	// eq: sumFlowHours = sum(flow_rate(t) * dt(t))
	Equation *eqSumFlowHours = system.createEquation("sumFlowHours", *this);
	eqSumFlowHours->addSummand(flowRate, system.dtInHours, vector<int>(), true);
	eqSumFlowHours->addSummand(sumFlowHours, -1);

	createBoundsForLoadFactor(system);

	createShares(system);
}

void FlowModel::createBoundsForLoadFactor (SystemModel &system) {
	// eq: sumFlowHours <= size * dt_total * load_factor_max
	if (flow.loadFactorMax) {
		double flowHoursPerSizeMax = system.dtInHoursTotal * *flow.loadFactorMax;
		Equation *eqLoadFactorMax = system.createEquation("load_factor_max", *this, Equation::INEQUALITY);
		eqLoadFactorMax->addSummand(sumFlowHours, 1);
		if (investment) eqLoadFactorMax->addSummand(investment->size, -1 * flowHoursPerSizeMax);
		else			eqLoadFactorMax->addConstant(*flow.size * flowHoursPerSizeMax);
	}

	// eq: size * dt_total * load_factor_min <= sumFlowHours
	if (flow.loadFactorMin) {
		double flowHoursPerSizeMin = system.dtInHoursTotal * *flow.loadFactorMin;
		Equation *eqLoadFactorMin = system.createEquation("load_factor_min", *this, Equation::INEQUALITY);
		eqLoadFactorMin->addSummand(sumFlowHours, -1);
		if (investment) eqLoadFactorMin->addSummand(investment->size, flowHoursPerSizeMin);
		else			eqLoadFactorMin->addConstant(-1 * *flow.size * flowHoursPerSizeMin);
	}
}

void FlowModel::createShares (SystemModel &system) {
	if (flow.effectsPerFlowHour.empty()) return;

	if (system.effectCollectionModel == NULL) {
		throw ModelingException(labelFull() + ": shares need an effect collection model");
	}
	system.effectCollectionModel->addShareToOperation(system, "effects_per_flow_hour", flow, flow.effectsPerFlowHour,
													  system.dtInHours, flowRate);
}

/****************************************************************************
 * absoluteFlowRateBounds
 * - relative bounds times the size; an investment contributes its minimum
 * and maximum size (or its fixed size).
 ****************************************************************************/
NumericBounds FlowModel::absoluteFlowRateBounds (const SystemModel &system) const {
	NumericBounds relative = relativeFlowRateBounds(system);

	if (!flow.withInvestment()) {
		if (!flow.size) {
			throw ModelingException(labelFull() + ": the size is unknown before the data is transformed");
		}
		return NumericBounds(multiply(relative.first, *flow.size), multiply(relative.second, *flow.size));
	}
	const InvestParameters &invest = *flow.investParameters;
	return NumericBounds(multiply(relative.first, invest.minimum()), multiply(relative.second, invest.maximum()));
}

NumericBounds FlowModel::relativeFlowRateBounds (const SystemModel &system) const {
	if (flow.fixedRelativeProfile) {
		vector<double> profile = system.activeData(*flow.fixedRelativeProfile);
		return NumericBounds(profile, profile);
	}
	return NumericBounds(system.activeData(flow.relativeMinimum), system.activeData(flow.relativeMaximum));
}
