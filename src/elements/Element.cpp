//
//  Element.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "Element.hpp"
#include "../misc.hpp"

Element::Element (const string &label) : label(label) {
	if (label.empty()) {
		throw ModelingException("Elements need a label");
	}
	if (label.find("__") != string::npos) {
		throw ModelingException("Label " + label + " must not contain \"__\"");
	}
}

ElementModel::ElementModel (Element &element, const string &label) : element(element), label(label) {}

string ElementModel::labelFull () const {
	if (label.empty()) return element.labelFull();
	return element.labelFull() + "__" + label;
}

Variable* ElementModel::getVariable (const string &labelShort) const {
	for (unsigned int i=0; i<variables.size(); i++) {
		if (variables[i]->labelShort == labelShort) return variables[i];
	}
	return NULL;
}
