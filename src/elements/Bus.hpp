//
//  Bus.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef Bus_hpp
#define Bus_hpp

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "Element.hpp"
#include "../SystemModel.hpp"

using namespace std;

class Flow;

/****************************************************************************
 * Bus
 * - Balance node of the flows attached to it. Inputs and outputs are
 * added when a component is attached, never by the bus itself.
 * - Imbalance is possible through excess variables, penalized per flow
 * hour; without a penalty there is no excess.
 ****************************************************************************/
class Bus : public Element {

public:
	Bus (const string &label, const boost::optional<TimeSeries> &excessPenaltyPerFlowHour = TimeSeries(1e5));

	boost::optional<TimeSeries> excessPenaltyPerFlowHour;

	vector<Flow*> inputs;
	vector<Flow*> outputs;

	void addInput (Flow *flow) { inputs.push_back(flow); }
	void addOutput (Flow *flow) { outputs.push_back(flow); }

	bool withExcess () const { return (bool) excessPenaltyPerFlowHour; }

	void transformData (int nrOfTimeSteps, const ModelingConfig &config, Diagnostics &diagnostics);
};

class BusModel : public ElementModel {

public:
	BusModel (Bus &bus);

	void doModeling (SystemModel &system);

	Equation *busBalance;
	Variable *excessInput;
	Variable *excessOutput;

private:
	Bus &bus;
};

#endif /* Bus_hpp */
