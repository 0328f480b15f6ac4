//
//  Effect.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef Effect_hpp
#define Effect_hpp

#include <string>
#include <vector>
#include <memory>

#include <boost/optional.hpp>

#include "../elements/Element.hpp"
#include "../math/TimeSeries.hpp"
#include "../features/ShareAllocationModel.hpp"

using namespace std;

/****************************************************************************
 * Effect
 * - A quantity that shares are booked on (costs, CO2, primary energy...).
 * - Exactly one effect of a system is the standard effect (the target of
 * EffectValues without a label) and exactly one is minimized.
 ****************************************************************************/
class Effect : public Element {

public:
	Effect (const string &label, const string &unit, const string &description,
			bool isStandard = false, bool isObjective = false);

	string	unit;
	string	description;
	bool	isStandard;
	bool	isObjective;

	boost::optional<double>		minimumOperation;
	boost::optional<double>		maximumOperation;
	boost::optional<double>		minimumInvest;
	boost::optional<double>		maximumInvest;
	boost::optional<double>		minimumTotal;
	boost::optional<double>		maximumTotal;
	boost::optional<TimeSeries>	minimumOperationPerHour;
	boost::optional<TimeSeries>	maximumOperationPerHour;

	void transformData (int nrOfTimeSteps, const ModelingConfig &config, Diagnostics &diagnostics);
};

/* Operation ledger (time-indexed), invest ledger (scalar) and their total */
class EffectModel : public ElementModel {

public:
	EffectModel (Effect &effect);

	void doModeling (SystemModel &system);

	unique_ptr<ShareAllocationModel> operation;
	unique_ptr<ShareAllocationModel> invest;
	Variable *total;

private:
	Effect &effect;
};

class EffectCollection : public Element {

public:
	EffectCollection ();

	Effect* addEffect (Effect *effect);		// takes ownership

	Effect* getEffect (const string &label) const;		// empty label: standard effect
	Effect* standardEffect () const;
	Effect* objectiveEffect () const;

	const vector< unique_ptr<Effect> >& getEffects () const { return effects; }

	void transformData (int nrOfTimeSteps, const ModelingConfig &config, Diagnostics &diagnostics);

private:
	vector< unique_ptr<Effect> > effects;
};

/****************************************************************************
 * EffectCollectionModel
 * - The share ledger handed to every element model: registers operation,
 * invest and penalty shares and builds the objective
 *		minimize  total(objective effect) + penalty
 ****************************************************************************/
class EffectCollectionModel : public ElementModel {

public:
	EffectCollectionModel (EffectCollection &collection);

	void doModeling (SystemModel &system);

	void addShareToOperation (SystemModel &system, const string &name, const Element &element,
							  const EffectValues &effectValues, const vector<double> &factor, Variable *variable);
	void addShareToInvest (SystemModel &system, const string &name, const Element &element,
						   const EffectValues &effectValues, double factor, Variable *variable);
	void addShareToPenalty (SystemModel &system, const string &name, Variable *variable, const vector<double> &factor);

	void addObjective (SystemModel &system);

	EffectModel*			getEffectModel (const string &label) const;
	ShareAllocationModel*	getPenalty () const { return penalty.get(); }

private:
	EffectCollection &collection;

	map<string, unique_ptr<EffectModel> >	effectModels;
	unique_ptr<ShareAllocationModel>		penalty;
};

#endif /* Effect_hpp */
