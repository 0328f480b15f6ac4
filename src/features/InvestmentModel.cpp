//
//  InvestmentModel.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "InvestmentModel.hpp"
#include "../effects/Effect.hpp"
#include "../misc.hpp"

InvestmentModel::InvestmentModel (Element &element, const InvestParameters &parameters, Variable *definingVariable,
								  const NumericBounds &relativeBounds, const OptionalNumeric &fixedRelativeProfile,
								  Variable *onVariable, const string &label) :
	ElementModel(element, label), size(NULL), isInvested(NULL), parameters(parameters),
	definingVariable(definingVariable), relativeBounds(relativeBounds),
	fixedRelativeProfile(fixedRelativeProfile), onVariable(onVariable)
{
	if (definingVariable == NULL) {
		throw ModelingException(labelFull() + ": an investment needs a defining variable");
	}
}

void InvestmentModel::doModeling (SystemModel &system) {
	if (parameters.fixedSize && !parameters.isOptional) {
		size = system.createVariable("size", *this, 1, boost::none, boost::none, false, toVector(*parameters.fixedSize));
	}
	else {
		double lowerBound = parameters.isOptional ? 0.0 : parameters.minimum();
		size = system.createVariable("size", *this, 1, toVector(lowerBound), toVector(parameters.maximum()));
	}

	if (parameters.isOptional) {
		isInvested = system.createVariable("isInvested", *this, 1, boost::none, boost::none, true);
		createBoundsForOptionalInvestment(system);
	}

	createBoundsForDefiningVariable(system);

	createShares(system);
}

void InvestmentModel::createBoundsForOptionalInvestment (SystemModel &system) {
	if (parameters.fixedSize) {
		// eq: size = isInvested * fixed size
		Equation *eqIsInvested = system.createEquation("is_invested", *this);
		eqIsInvested->addSummand(size, -1);
		eqIsInvested->addSummand(isInvested, *parameters.fixedSize);
	}
	else {
		// eq: size <= isInvested * maximum size
		Equation *eqIsInvestedUb = system.createEquation("is_invested_ub", *this, Equation::INEQUALITY);
		eqIsInvestedUb->addSummand(size, 1);
		eqIsInvestedUb->addSummand(isInvested, -1 * parameters.maximum());

		// eq: size >= isInvested * max(epsilon, minimum size)
		Equation *eqIsInvestedLb = system.createEquation("is_invested_lb", *this, Equation::INEQUALITY);
		eqIsInvestedLb->addSummand(size, -1);
		eqIsInvestedLb->addSummand(isInvested, max(system.config.epsilon, parameters.minimum()));
	}
}

void InvestmentModel::createBoundsForDefiningVariable (SystemModel &system) {
	const string &label = definingVariable->labelShort;

	// the on variable does not relax a fixed profile
	if (fixedRelativeProfile) {
		// eq: var(t) = size * profile(t)
		Equation *eqFixed = system.createEquation("fixed_" + label, *this);
		eqFixed->addSummand(definingVariable, 1);
		eqFixed->addSummand(size, multiply(*fixedRelativeProfile, -1));
		return;
	}

	const vector<double> &relativeMinimum = relativeBounds.first;
	const vector<double> &relativeMaximum = relativeBounds.second;

	// eq: var(t) <= size * relmax(t)
	Equation *eqUpper = system.createEquation("ub_" + label, *this, Equation::INEQUALITY);
	eqUpper->addSummand(definingVariable, 1);
	eqUpper->addSummand(size, multiply(relativeMaximum, -1));

	Equation *eqLower = system.createEquation("lb_" + label, *this, Equation::INEQUALITY);
	if (onVariable == NULL) {
		// eq: var(t) >= size * relmin(t)
		eqLower->addSummand(definingVariable, -1);
		eqLower->addSummand(size, relativeMinimum);
	}
	else {
		// eq: var(t) >= mega * (on(t) - 1) + size * relmin(t)		with mega = relmax(t) * maximum size
		//	   -var(t) + mega * on(t) + size * relmin(t) <= mega
		vector<double> mega = multiply(relativeMaximum, parameters.maximum());
		eqLower->addSummand(definingVariable, -1);
		eqLower->addSummand(onVariable, mega);
		eqLower->addSummand(size, relativeMinimum);
		eqLower->addConstant(mega);
	}
}

void InvestmentModel::createShares (SystemModel &system) {
	EffectCollectionModel *effectCollection = system.effectCollectionModel;
	if (effectCollection == NULL) {
		if (parameters.fixEffects.empty() && parameters.divestEffects.empty()
			&& parameters.specificEffects.empty() && !parameters.effectsInSegments) return;
		throw ModelingException(labelFull() + ": shares need an effect collection model");
	}

	// fix effects: + isInvested * fix effects
	if (!parameters.fixEffects.empty()) {
		Variable *variableIsInvested = parameters.isOptional ? isInvested : NULL;
		effectCollection->addShareToInvest(system, "fix_effects", element, parameters.fixEffects, 1, variableIsInvested);
	}

	// divest effects: divest effects - isInvested * divest effects
	if (!parameters.divestEffects.empty() && parameters.isOptional) {
		effectCollection->addShareToInvest(system, "divest_effects", element, parameters.divestEffects, 1, NULL);
		effectCollection->addShareToInvest(system, "divest_cancellation_effects", element, parameters.divestEffects, -1, isInvested);
	}

	// specific effects: + size * specific effects
	if (!parameters.specificEffects.empty()) {
		effectCollection->addShareToInvest(system, "specific_effects", element, parameters.specificEffects, 1, size);
	}

	if (parameters.effectsInSegments) {
		const SegmentedEffects &effectsInSegments = *parameters.effectsInSegments;
		segments.reset(new SegmentedSharesModel(element, SegmentedVariable(size, effectsInSegments.sizeSegments),
												effectsInSegments.effectSegments, false, isInvested,
												label + "__SegmentedShares"));
		segments->doModeling(system);
	}
}
