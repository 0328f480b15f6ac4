//
//  Equation.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef Equation_hpp
#define Equation_hpp

#include <string>
#include <vector>

#include "Variable.hpp"
#include "../solution.hpp"

using namespace std;

/****************************************************************************
 * Equation
 * - Canonical one-sided affine relation:
 *		sum(coefficient * variable[index]) == rhs	(EQUALITY)
 *		sum(coefficient * variable[index]) <= rhs	(INEQUALITY)
 * - Every summand contributes one row per selected index, or a single row
 * summing over all its indices (asSum). Summands and constants of length 1
 * are broadcast to the row count of the equation.
 ****************************************************************************/
class Equation {

public:
	enum EquationType {
		EQUALITY,
		INEQUALITY
	};

	struct Summand {
		Variable		*variable;
		vector<double>	coefficients;
		vector<int>		indices;
		bool			asSum;

		int nrOfRows () const;
	};

	struct Term {
		const Variable	*variable;
		int				index;
		double			coefficient;
	};

	Equation (const string &label, const string &labelShort, EquationType type);

	void addSummand (Variable *variable, double coefficient, const vector<int> &indices = vector<int>(), bool asSum = false);
	void addSummand (Variable *variable, const vector<double> &coefficients, const vector<int> &indices = vector<int>(), bool asSum = false);
	void addConstant (double value);
	void addConstant (const vector<double> &values);

	string			label;
	string			labelShort;
	EquationType	type;

	int				nrOfRows () const { return rows; }
	vector<Term>	row (int r) const;
	double			rhs (int r) const;

	const vector<Summand>& getSummands () const { return summands; }

	// left-hand side minus right-hand side of row r for the given values
	double residual (int r, const Solution &solution) const;
	bool   isSatisfied (int r, const Solution &solution, double tolerance) const;

private:
	vector<Summand>	summands;
	vector<double>	constant;
	int				rows;

	void updateRows (int n);
};

#endif /* Equation_hpp */
