//
//  Variable.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef Variable_hpp
#define Variable_hpp

#include <string>
#include <vector>

using namespace std;

/****************************************************************************
 * Variable
 * - A scalar (length 1) or time-indexed (length T) decision variable.
 * - Bounds are stored per index; a bound vector of length 1 is broadcast.
 * - A fixed value collapses both bounds to that point.
 * - Previous values are the continuity seed carried over from the previous
 * horizon and never become part of the optimization.
 ****************************************************************************/
class Variable {

public:
	Variable (const string &label, const string &labelShort, int length,
			  const vector<double> &lowerBound, const vector<double> &upperBound,
			  bool isBinary, const vector<double> &fixedValue, const vector<double> &previousValues);

	string	label;			// full label, unique within a SystemModel
	string	labelShort;		// label within the owning model
	int		length;
	bool	isBinary;

	vector<double> lowerBound;
	vector<double> upperBound;
	vector<double> fixedValue;		// empty if the variable is free
	vector<double> previousValues;	// empty if there is no history

	double	lb (int i) const;
	double	ub (int i) const;
	bool	isFixed () const { return !fixedValue.empty(); }
	bool	hasPreviousValues () const { return !previousValues.empty(); }

	vector<int> indices () const;
};

#endif /* Variable_hpp */
