//
//  Effect.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "Effect.hpp"
#include "../misc.hpp"

Effect::Effect (const string &label, const string &unit, const string &description, bool isStandard, bool isObjective) :
	Element(label), unit(unit), description(description), isStandard(isStandard), isObjective(isObjective) {}

void Effect::transformData (int nrOfTimeSteps, const ModelingConfig &config, Diagnostics &diagnostics) {
	if (minimumOperationPerHour) minimumOperationPerHour->checkLength(nrOfTimeSteps, label + ": minimum operation per hour");
	if (maximumOperationPerHour) maximumOperationPerHour->checkLength(nrOfTimeSteps, label + ": maximum operation per hour");
}

EffectModel::EffectModel (Effect &effect) : ElementModel(effect), total(NULL), effect(effect) {}

void EffectModel::doModeling (SystemModel &system) {
	operation.reset(new ShareAllocationModel(effect, "operation", true,
											 effect.maximumOperation, effect.minimumOperation,
											 effect.maximumOperationPerHour, effect.minimumOperationPerHour));
	invest.reset(new ShareAllocationModel(effect, "invest", false, effect.maximumInvest, effect.minimumInvest));

	operation->doModeling(system);
	invest->doModeling(system);

	total = system.createVariable("total", *this, 1,
								  effect.minimumTotal ? OptionalNumeric(toVector(*effect.minimumTotal)) : boost::none,
								  effect.maximumTotal ? OptionalNumeric(toVector(*effect.maximumTotal)) : boost::none);

	// eq: total = operation.sum + invest.sum
	Equation *eqTotal = system.createEquation("total", *this);
	eqTotal->addSummand(total, 1);
	eqTotal->addSummand(operation->sum, -1);
	eqTotal->addSummand(invest->sum, -1);
}

EffectCollection::EffectCollection () : Element("Effects") {}

Effect* EffectCollection::addEffect (Effect *effect) {
	unique_ptr<Effect> owned (effect);
	if (effect->isStandard && standardEffect() != NULL) {
		throw ModelingException("Effect " + effect->label + " cannot be the standard effect, "
								+ standardEffect()->label + " already is");
	}
	if (effect->isObjective && objectiveEffect() != NULL) {
		throw ModelingException("Effect " + effect->label + " cannot be the objective, "
								+ objectiveEffect()->label + " already is");
	}
	for (unsigned int i=0; i<effects.size(); i++) {
		if (effects[i]->label == effect->label) {
			throw ModelingException("Effect " + effect->label + " already exists");
		}
	}
	effects.push_back(move(owned));
	return effect;
}

Effect* EffectCollection::getEffect (const string &label) const {
	if (label.empty()) {
		Effect *standard = standardEffect();
		if (standard == NULL) {
			throw ModelingException("Effect values without a label need a standard effect");
		}
		return standard;
	}
	for (unsigned int i=0; i<effects.size(); i++) {
		if (effects[i]->label == label) return effects[i].get();
	}
	throw ModelingException("Unknown effect " + label);
}

Effect* EffectCollection::standardEffect () const {
	for (unsigned int i=0; i<effects.size(); i++) {
		if (effects[i]->isStandard) return effects[i].get();
	}
	return NULL;
}

Effect* EffectCollection::objectiveEffect () const {
	for (unsigned int i=0; i<effects.size(); i++) {
		if (effects[i]->isObjective) return effects[i].get();
	}
	return NULL;
}

void EffectCollection::transformData (int nrOfTimeSteps, const ModelingConfig &config, Diagnostics &diagnostics) {
	if (objectiveEffect() == NULL) {
		throw ModelingException("One effect must be the objective");
	}
	for (unsigned int i=0; i<effects.size(); i++) {
		effects[i]->transformData(nrOfTimeSteps, config, diagnostics);
	}
}

EffectCollectionModel::EffectCollectionModel (EffectCollection &collection) : ElementModel(collection), collection(collection) {}

void EffectCollectionModel::doModeling (SystemModel &system) {
	const vector< unique_ptr<Effect> > &effects = collection.getEffects();
	for (unsigned int i=0; i<effects.size(); i++) {
		unique_ptr<EffectModel> model (new EffectModel(*effects[i]));
		model->doModeling(system);
		effectModels[effects[i]->label] = move(model);
	}

	penalty.reset(new ShareAllocationModel(collection, "penalty", true));
	penalty->doModeling(system);

	system.effectCollectionModel = this;
}

/****************************************************************************
 * addShareToOperation
 * - Books variable * effect value(t) * factor(t) on the operation ledger of
 * every effect named in effectValues.
 ****************************************************************************/
void EffectCollectionModel::addShareToOperation (SystemModel &system, const string &name, const Element &element,
												 const EffectValues &effectValues, const vector<double> &factor, Variable *variable)
{
	for (EffectValues::const_iterator it = effectValues.begin(); it != effectValues.end(); ++it) {
		Effect *effect = collection.getEffect(it->first);
		vector<double> totalFactor = multiply(system.activeData(it->second), factor);
		effectModels[effect->label]->operation->addShare(system, element.labelFull() + "__" + name, variable, totalFactor);
	}
}

void EffectCollectionModel::addShareToInvest (SystemModel &system, const string &name, const Element &element,
											  const EffectValues &effectValues, double factor, Variable *variable)
{
	for (EffectValues::const_iterator it = effectValues.begin(); it != effectValues.end(); ++it) {
		Effect *effect = collection.getEffect(it->first);
		if (!it->second.isScalar()) {
			throw ModelingException(element.labelFull() + ": invest effects on " + effect->label + " must be scalar");
		}
		effectModels[effect->label]->invest->addShare(system, element.labelFull() + "__" + name, variable,
													  toVector(it->second.first() * factor));
	}
}

void EffectCollectionModel::addShareToPenalty (SystemModel &system, const string &name, Variable *variable, const vector<double> &factor) {
	penalty->addShare(system, name, variable, factor);
}

void EffectCollectionModel::addObjective (SystemModel &system) {
	Effect *objectiveEffect = collection.objectiveEffect();
	if (objectiveEffect == NULL) {
		throw ModelingException("One effect must be the objective");
	}
	system.addObjectiveTerm(effectModels[objectiveEffect->label]->total, 1.0);
	system.addObjectiveTerm(penalty->sum, 1.0);
}

EffectModel* EffectCollectionModel::getEffectModel (const string &label) const {
	map<string, unique_ptr<EffectModel> >::const_iterator it = effectModels.find(label);
	if (it == effectModels.end()) {
		throw ModelingException("Unknown effect " + label);
	}
	return it->second.get();
}
