//
//  solution.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef solution_hpp
#define solution_hpp

#include <stdio.h>
#include <vector>
#include <map>
#include <string>

#include "misc.hpp"

/* Values of a (partial) assignment, keyed by the full variable label */
struct Solution {

	Solution () : objValue(0.0) {}

	void set (const string &label, const vector<double> &values) {
		vals[label] = values;
	}

	bool has (const string &label) const {
		return vals.find(label) != vals.end();
	}

	const vector<double>& get (const string &label) const {
		map<string, vector<double> >::const_iterator it = vals.find(label);
		if (it == vals.end()) {
			throw ModelingException("No value recorded for variable " + label);
		}
		return it->second;
	}

	map<string, vector<double> > vals;
	double objValue;
};

#endif /* solution_hpp */
