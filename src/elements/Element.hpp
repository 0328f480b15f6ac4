//
//  Element.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef Element_hpp
#define Element_hpp

#include <string>
#include <vector>

#include "../math/Variable.hpp"
#include "../math/Equation.hpp"

using namespace std;

class SystemModel;
class Diagnostics;
struct ModelingConfig;

/* Base of everything that is declared once per problem definition */
class Element {

public:
	Element (const string &label);
	virtual ~Element () {}

	string label;

	virtual string labelFull () const { return label; }

	// validates the raw inputs against the horizon; called exactly once before any modeling
	virtual void transformData (int nrOfTimeSteps, const ModelingConfig &config, Diagnostics &diagnostics) {}
};

/****************************************************************************
 * ElementModel
 * - The symbolic representation of an element (or of a feature of it) for
 * one horizon. Variables and equations are owned by the SystemModel; the
 * model keeps pointers to the ones it created for inspection.
 ****************************************************************************/
class ElementModel {

public:
	ElementModel (Element &element, const string &label = "");
	virtual ~ElementModel () {}

	virtual void doModeling (SystemModel &system) = 0;

	string labelFull () const;

	Element	&element;
	string	label;

	vector<Variable*> variables;
	vector<Equation*> equations;

	Variable* getVariable (const string &labelShort) const;
};

#endif /* Element_hpp */
