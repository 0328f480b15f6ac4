//
//  Variable.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "Variable.hpp"
#include "../misc.hpp"
#include "../config.hpp"

Variable::Variable (const string &label, const string &labelShort, int length,
					const vector<double> &lowerBound, const vector<double> &upperBound,
					bool isBinary, const vector<double> &fixedValue, const vector<double> &previousValues) :
	label(label), labelShort(labelShort), length(length), isBinary(isBinary),
	lowerBound(lowerBound), upperBound(upperBound), fixedValue(fixedValue), previousValues(previousValues)
{
	if (length < 1) {
		throw ModelingException("Variable " + label + " must have a length of at least 1");
	}

	const vector<double>* series[3] = {&this->lowerBound, &this->upperBound, &this->fixedValue};
	for (int i=0; i<3; i++) {
		if (series[i]->size() > 1 && (int) series[i]->size() != length) {
			throw ModelingException("Bounds of variable " + label + " do not match its length " + numToStr(length));
		}
	}

	if (this->lowerBound.empty()) this->lowerBound = toVector(-INF);
	if (this->upperBound.empty()) this->upperBound = toVector(INF);

	if (isBinary) {
		this->lowerBound = elementMax(this->lowerBound, 0.0);
		for (unsigned int i=0; i<this->upperBound.size(); i++) {
			this->upperBound[i] = min(this->upperBound[i], 1.0);
		}
	}

	// a fixed value collapses the bounds to a point
	if (isFixed()) {
		this->lowerBound = this->fixedValue;
		this->upperBound = this->fixedValue;
	}
}

double Variable::lb (int i) const {
	return lowerBound[lowerBound.size() == 1 ? 0 : i];
}

double Variable::ub (int i) const {
	return upperBound[upperBound.size() == 1 ? 0 : i];
}

vector<int> Variable::indices () const {
	return indexRange(0, length);
}
