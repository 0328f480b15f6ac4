//
//  Equation.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "Equation.hpp"
#include "../misc.hpp"

int Equation::Summand::nrOfRows () const {
	if (asSum) return 1;
	return (int) max(indices.size(), coefficients.size());
}

Equation::Equation (const string &label, const string &labelShort, EquationType type) :
	label(label), labelShort(labelShort), type(type), constant(1, 0.0), rows(0) {}

void Equation::addSummand (Variable *variable, double coefficient, const vector<int> &indices, bool asSum) {
	addSummand(variable, toVector(coefficient), indices, asSum);
}

/****************************************************************************
 * addSummand
 * - Adds coefficient(s) * variable[indices] to the left-hand side. Without
 * an index subset all indices of the variable are used.
 * - With asSum, the summand is a single row summing over the indices.
 ****************************************************************************/
void Equation::addSummand (Variable *variable, const vector<double> &coefficients, const vector<int> &indices, bool asSum) {
	if (variable == NULL) {
		throw ModelingException("Equation " + label + ": summand without a variable");
	}
	if (coefficients.empty()) {
		throw ModelingException("Equation " + label + ": summand of " + variable->label + " has no coefficients");
	}

	Summand s;
	s.variable	   = variable;
	s.coefficients = coefficients;
	s.indices	   = indices.empty() ? variable->indices() : indices;
	s.asSum		   = asSum;

	for (unsigned int i=0; i<s.indices.size(); i++) {
		if (s.indices[i] < 0 || s.indices[i] >= variable->length) {
			throw ModelingException("Equation " + label + ": index " + numToStr(s.indices[i])
									+ " is out of range for " + variable->label);
		}
	}
	if (s.coefficients.size() > 1 && s.indices.size() > 1 && s.coefficients.size() != s.indices.size()) {
		throw ModelingException("Equation " + label + ": " + numToStr(s.coefficients.size()) + " coefficients for "
								+ numToStr(s.indices.size()) + " indices of " + variable->label);
	}
	if (asSum && s.coefficients.size() > 1 && s.indices.size() == 1) {
		throw ModelingException("Equation " + label + ": cannot sum a single index of " + variable->label
								+ " with several coefficients");
	}

	updateRows(s.nrOfRows());
	summands.push_back(s);
}

void Equation::addConstant (double value) {
	addConstant(toVector(value));
}

void Equation::addConstant (const vector<double> &values) {
	if (values.empty()) return;

	if (values.size() > 1) {
		updateRows((int) values.size());
		if (constant.size() == 1) {
			constant = vector<double> (values.size(), constant[0]);
		}
	}
	for (unsigned int i=0; i<constant.size(); i++) {
		constant[i] += values[values.size() == 1 ? 0 : i];
	}
}

void Equation::updateRows (int n) {
	if (n > 1 && rows > 1 && n != rows) {
		throw ModelingException("Equation " + label + ": a part with " + numToStr(n)
								+ " rows does not match the other parts with " + numToStr(rows) + " rows");
	}
	rows = max(rows, n);
}

vector<Equation::Term> Equation::row (int r) const {
	vector<Term> terms;

	for (unsigned int s=0; s<summands.size(); s++) {
		const Summand &summand = summands[s];
		const vector<double> &coef = summand.coefficients;
		const vector<int> &idx	   = summand.indices;

		if (summand.asSum) {
			for (unsigned int i=0; i<idx.size(); i++) {
				Term term = {summand.variable, idx[i], coef[coef.size() == 1 ? 0 : i]};
				terms.push_back(term);
			}
		}
		else {
			Term term = {summand.variable, idx[idx.size() == 1 ? 0 : r], coef[coef.size() == 1 ? 0 : r]};
			terms.push_back(term);
		}
	}
	return terms;
}

double Equation::rhs (int r) const {
	return constant[constant.size() == 1 ? 0 : r];
}

double Equation::residual (int r, const Solution &solution) const {
	double lhs = 0.0;
	vector<Term> terms = row(r);
	for (unsigned int i=0; i<terms.size(); i++) {
		lhs += terms[i].coefficient * solution.get(terms[i].variable->label).at(terms[i].index);
	}
	return lhs - rhs(r);
}

bool Equation::isSatisfied (int r, const Solution &solution, double tolerance) const {
	double res = residual(r, solution);
	if (type == EQUALITY) return fabs(res) <= tolerance;
	return res <= tolerance;
}
