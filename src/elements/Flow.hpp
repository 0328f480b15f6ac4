//
//  Flow.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef Flow_hpp
#define Flow_hpp

#include <string>
#include <vector>
#include <memory>

#include <boost/optional.hpp>

#include "Element.hpp"
#include "Parameters.hpp"
#include "../SystemModel.hpp"

using namespace std;

class Bus;
class Component;
class FlowModel;
class OnOffModel;
class InvestmentModel;

/****************************************************************************
 * Flow
 * - A directed quantity between a bus and a component. Its rate is bounded
 * by size * relative bounds, or fixed to size * fixed relative profile.
 * - The size is either a number (config.big if not given) or decided by
 * an investment.
 ****************************************************************************/
class Flow : public Element {

public:
	Flow (const string &label, Bus &bus,
		  const TimeSeries &relativeMinimum = TimeSeries(0.0), const TimeSeries &relativeMaximum = TimeSeries(1.0));

	Bus			*bus;
	Component	*comp;			// set when the flow is attached to a component
	FlowModel	*model;			// model of the horizon currently being built

	boost::optional<double>				size;
	boost::optional<InvestParameters>	investParameters;

	TimeSeries							relativeMinimum;
	TimeSeries							relativeMaximum;
	boost::optional<TimeSeries>			fixedRelativeProfile;
	EffectValues						effectsPerFlowHour;
	boost::optional<OnOffParameters>	onOffParameters;

	boost::optional<double>	flowHoursTotalMin;
	boost::optional<double>	flowHoursTotalMax;
	boost::optional<double>	loadFactorMin;
	boost::optional<double>	loadFactorMax;

	vector<double>	previousFlowRate;		// empty without history

	string	labelFull () const;
	void	transformData (int nrOfTimeSteps, const ModelingConfig &config, Diagnostics &diagnostics);

	bool	withInvestment () const { return (bool) investParameters; }
	bool	isInputInComp () const;
	bool	sizeIsFixed () const;
	bool	investIsOptional () const;
};

/****************************************************************************
 * FlowModel
 * - flow_rate with its bounds, on/off and investment sub-models, the flow
 * hours sum, load factor bounds and the costs per flow hour.
 ****************************************************************************/
class FlowModel : public ElementModel {

public:
	FlowModel (Flow &flow);
	~FlowModel ();

	void doModeling (SystemModel &system);

	Variable *flowRate;
	Variable *sumFlowHours;

	OnOffModel*			getOnOff () const { return onOff.get(); }
	InvestmentModel*	getInvestment () const { return investment.get(); }

	NumericBounds absoluteFlowRateBounds (const SystemModel &system) const;
	NumericBounds relativeFlowRateBounds (const SystemModel &system) const;

private:
	Flow &flow;

	unique_ptr<OnOffModel>		onOff;
	unique_ptr<InvestmentModel>	investment;

	void createBoundsForLoadFactor (SystemModel &system);
	void createShares (SystemModel &system);
};

#endif /* Flow_hpp */
