//
//  OnOffModel.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef OnOffModel_hpp
#define OnOffModel_hpp

#include <vector>

#include <boost/optional.hpp>

#include "../SystemModel.hpp"
#include "../elements/Parameters.hpp"

using namespace std;

/****************************************************************************
 * OnOffModel
 * - Binary activation state of one or more defining variables:
 *		on(t) = 0  ->  every defining variable is within [0, epsilon]
 *		on(t) = 1  ->  the defining variables keep their absolute bounds
 * - Depending on the parameters also an explicit off state, the counters
 * of consecutive on/off hours and the switch events.
 * - The previous horizon enters through the previous values of the
 * defining variables and the previous step durations.
 ****************************************************************************/
class OnOffModel : public ElementModel {

public:
	OnOffModel (Element &element, const OnOffParameters &parameters,
				const vector<Variable*> &definingVariables, const vector<NumericBounds> &definingBounds,
				const string &label = "OnOff");

	void doModeling (SystemModel &system);

	Variable *on;
	Variable *totalOnHours;
	Variable *off;
	Variable *consecutiveOnHours;
	Variable *consecutiveOffHours;
	Variable *switchOn;
	Variable *switchOff;
	Variable *nrSwitchOn;

	// element-wise: 1 if any defining variable was outside [-epsilon, epsilon]; [0] without history
	vector<double> previousOnValues (double epsilon) const;

	// hours of the trailing run of ones in binaryValues
	static double getConsecutiveDuration (const vector<double> &binaryValues, const vector<double> &dtInHours, double epsilon);

private:
	OnOffParameters			parameters;
	vector<Variable*>		definingVariables;
	vector<NumericBounds>	definingBounds;

	void addOnConstraints (SystemModel &system);
	void addOffConstraints (SystemModel &system);
	void addSwitchConstraints (SystemModel &system);
	void createShares (SystemModel &system);

	Variable* getDurationInHours (SystemModel &system, const string &variableLabel, Variable *binaryVariable,
								  const boost::optional<TimeSeries> &minimumDuration,
								  const boost::optional<TimeSeries> &maximumDuration);
};

#endif /* OnOffModel_hpp */
