//
//  SystemModel.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef SystemModel_hpp
#define SystemModel_hpp

#include <string>
#include <vector>
#include <map>
#include <memory>

#include <boost/optional.hpp>

#include "config.hpp"
#include "Diagnostics.hpp"
#include "solution.hpp"
#include "math/Variable.hpp"
#include "math/Equation.hpp"
#include "math/TimeSeries.hpp"
#include "elements/Element.hpp"

using namespace std;

class EffectCollectionModel;

typedef boost::optional< vector<double> > OptionalNumeric;

/* Absolute (lower, upper) bounds of a variable; vectors of length 1 are broadcast */
typedef pair< vector<double>, vector<double> > NumericBounds;

/****************************************************************************
 * SystemModel
 * - The horizon context: time steps and their durations, the durations of
 * the steps before the window, the modeling configuration and the
 * diagnostics channel.
 * - Owns every variable, equation and top-level element model built for
 * the horizon. It is rebuilt for every horizon window.
 ****************************************************************************/
class SystemModel {

public:
	SystemModel (const vector<double> &dtInHours, const ModelingConfig &config, Diagnostics &diagnostics,
				 int firstTimeIndex = 0, const vector<double> &previousDtInHours = vector<double>());

	/* horizon */
	int				nrOfTimeSteps;
	int				firstTimeIndex;			// position of the window in the full series
	vector<int>		indices;
	vector<double>	dtInHours;
	double			dtInHoursTotal;
	vector<double>	previousDtInHours;		// a single value is used for every earlier step

	ModelingConfig	config;
	Diagnostics		&diagnostics;

	/* share ledger, created by the effect collection */
	EffectCollectionModel *effectCollectionModel;

	Variable* createVariable (const string &label, ElementModel &owner, int length,
							  const OptionalNumeric &lowerBound = boost::none,
							  const OptionalNumeric &upperBound = boost::none,
							  bool isBinary = false,
							  const OptionalNumeric &fixedValue = boost::none,
							  const OptionalNumeric &previousValues = boost::none);

	Equation* createEquation (const string &label, ElementModel &owner, Equation::EquationType type = Equation::EQUALITY);

	// takes ownership of a top-level element model
	ElementModel* addElementModel (ElementModel *model);

	vector<double> activeData (const TimeSeries &ts) const;

	/* objective: minimize sum(coefficient * variable[index]) */
	void addObjectiveTerm (Variable *variable, double coefficient);
	const vector<Equation::Term>& getObjective () const { return objective; }

	const vector<Variable*>& getVariables () const { return variableList; }
	const vector<Equation*>& getEquations () const { return equationList; }
	Variable*	getVariable (const string &label) const;
	Equation*	getEquation (const string &label) const;

	// labels of violated bounds, integrality requirements and equation rows
	vector<string> checkSolution (const Solution &solution, double tolerance) const;

private:
	/* owners; element models are released before the variables and equations they reference */
	vector< unique_ptr<Variable> >		variables;
	vector< unique_ptr<Equation> >		equations;
	vector< unique_ptr<ElementModel> >	elementModels;

	vector<Variable*>	variableList;
	vector<Equation*>	equationList;

	map<string, Variable*> variableMap;
	map<string, Equation*> equationMap;

	vector<Equation::Term> objective;

	SystemModel (const SystemModel &);
	SystemModel& operator= (const SystemModel &);
};

#endif /* SystemModel_hpp */
