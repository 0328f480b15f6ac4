//
//  Component.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef Component_hpp
#define Component_hpp

#include <string>
#include <vector>
#include <memory>

#include <boost/optional.hpp>

#include "Element.hpp"
#include "Flow.hpp"
#include "../SystemModel.hpp"

using namespace std;

class OnOffModel;
class PreventSimultaneousUsageModel;

/****************************************************************************
 * Component
 * - Owns its input and output flows. On construction it registers itself
 * in the flows and the flows in their buses: an input of the component is
 * an output of its bus and vice versa.
 * - Optional on/off state shared by all flows and an optional group of
 * flows (by label) of which only one may be on at a time.
 ****************************************************************************/
class Component : public Element {

public:
	Component (const string &label, const vector<Flow*> &inputs, const vector<Flow*> &outputs,
			   const boost::optional<OnOffParameters> &onOffParameters = boost::none,
			   const vector<string> &preventSimultaneousFlows = vector<string>());

	vector<Flow*> inputs;
	vector<Flow*> outputs;

	boost::optional<OnOffParameters>	onOffParameters;
	vector<string>						preventSimultaneousFlows;

	vector<Flow*>	getFlows () const;		// inputs first
	Flow*			getFlow (const string &label) const;

	void transformData (int nrOfTimeSteps, const ModelingConfig &config, Diagnostics &diagnostics);

private:
	vector< unique_ptr<Flow> > flows;

	void registerComponentInFlows ();
	void registerFlowsInBus ();
};

/****************************************************************************
 * ComponentModel
 * - Models the flows first, then the component on/off over all flow rates
 * and the mutual exclusion of the grouped flows.
 ****************************************************************************/
class ComponentModel : public ElementModel {

public:
	ComponentModel (Component &component);
	~ComponentModel ();

	void doModeling (SystemModel &system);

	const vector< unique_ptr<FlowModel> >& getFlowModels () const { return flowModels; }
	OnOffModel* getOnOff () const { return onOff.get(); }

private:
	Component &component;

	vector< unique_ptr<FlowModel> >				flowModels;
	unique_ptr<OnOffModel>						onOff;
	unique_ptr<PreventSimultaneousUsageModel>	preventSimultaneousUsage;
};

#endif /* Component_hpp */
