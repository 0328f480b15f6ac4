//
//  FlowSystem.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef FlowSystem_hpp
#define FlowSystem_hpp

#include <string>
#include <vector>
#include <memory>

#include "config.hpp"
#include "Diagnostics.hpp"
#include "solution.hpp"
#include "SystemModel.hpp"
#include "effects/Effect.hpp"
#include "elements/Bus.hpp"
#include "elements/Component.hpp"

using namespace std;

/****************************************************************************
 * FlowSystem
 * - The declared energy network over the whole problem horizon: step
 * durations, effects, buses and components (which own their flows).
 * - A horizon window is modeled into a SystemModel created by
 * createSystemModel(); successive windows are linked by
 * updatePreviousValues().
 ****************************************************************************/
class FlowSystem {

public:
	FlowSystem (const vector<double> &dtInHours);

	vector<double>		dtInHours;		// all time steps of the problem
	EffectCollection	effects;

	Effect*		addEffect (Effect *effect);				// takes ownership
	Bus*		addBus (Bus *bus);						// ..
	Component*	addComponent (Component *component);	// ..

	const vector< unique_ptr<Bus> >&		getBuses () const { return buses; }
	const vector< unique_ptr<Component> >&	getComponents () const { return components; }
	Bus*		getBus (const string &label) const;
	Component*	getComponent (const string &label) const;

	int nrOfTimeSteps () const { return (int) dtInHours.size(); }

	// validates every input against the horizon; done once
	void transformData (const ModelingConfig &config, Diagnostics &diagnostics);

	// context of the window [firstTimeIndex, firstTimeIndex + nrOfSteps); the caller owns it
	SystemModel* createSystemModel (int firstTimeIndex, int nrOfSteps, const ModelingConfig &config, Diagnostics &diagnostics) const;

	void doModeling (SystemModel &system);

	// flow rates of a solved window become the previous flow rates of the next one
	void updatePreviousValues (const Solution &solution, const SystemModel &system);

private:
	vector< unique_ptr<Bus> >		buses;
	vector< unique_ptr<Component> >	components;

	bool dataTransformed;

	FlowSystem (const FlowSystem &);
	FlowSystem& operator= (const FlowSystem &);
};

#endif /* FlowSystem_hpp */
