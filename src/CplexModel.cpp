//
//  CplexModel.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "CplexModel.hpp"

static double cplexBound (double bound) {
	if (bound == INF)	return IloInfinity;
	if (bound == -INF)	return -IloInfinity;
	return bound;
}

CplexModel::CplexModel () : system(NULL) {
	model = IloModel(env);
	cplex = IloCplex(env);
}

CplexModel::~CplexModel () {
	env.end();
}

/****************************************************************************
 * formulate
 * - Builds the CPLEX model of a completely modeled SystemModel and sets
 * the solver parameters of its configuration.
 ****************************************************************************/
void CplexModel::formulate (SystemModel &system) {
	this->system = &system;

	initializeVariables();
	addEquations();
	addObjective();

	cplex.extract(model);
	cplex.setParam(IloCplex::EpGap, system.config.mipGap);
	cplex.setParam(IloCplex::Threads, system.config.threads);
	cplex.setOut(system.diagnostics.out());
	cplex.setWarning(system.diagnostics.out());
}

void CplexModel::initializeVariables () {
	const vector<Variable*> &variables = system->getVariables();

	vars = IloArray<IloNumVarArray> (env, (IloInt) variables.size());
	for (unsigned int v=0; v<variables.size(); v++) {
		const Variable *var = variables[v];

		vars[v] = IloNumVarArray(env);
		for (int i=0; i<var->length; i++) {
			string name = (var->length == 1) ? var->label : var->label + "[" + numToStr(i) + "]";
			vars[v].add(IloNumVar(env, cplexBound(var->lb(i)), cplexBound(var->ub(i)),
								  var->isBinary ? ILOBOOL : ILOFLOAT, name.c_str()));
		}
		model.add(vars[v]);
		varIndex[var] = v;
	}
}

void CplexModel::addEquations () {
	const vector<Equation*> &equations = system->getEquations();

	for (unsigned int e=0; e<equations.size(); e++) {
		const Equation *eq = equations[e];

		for (int r=0; r<eq->nrOfRows(); r++) {
			IloExpr expr (env);
			vector<Equation::Term> terms = eq->row(r);
			for (unsigned int k=0; k<terms.size(); k++) {
				expr += terms[k].coefficient * getVar(terms[k].variable, terms[k].index);
			}

			double rhs = eq->rhs(r);
			IloRange c (env, (eq->type == Equation::EQUALITY) ? rhs : -IloInfinity, expr, rhs);
			string name = (eq->nrOfRows() == 1) ? eq->label : eq->label + "[" + numToStr(r) + "]";
			c.setName(name.c_str());
			model.add(c);
			expr.end();
		}
	}
}

void CplexModel::addObjective () {
	IloExpr obj (env);
	const vector<Equation::Term> &objective = system->getObjective();
	for (unsigned int k=0; k<objective.size(); k++) {
		obj += objective[k].coefficient * getVar(objective[k].variable, objective[k].index);
	}
	model.add( IloMinimize(env, obj) );
	obj.end();
}

IloNumVar& CplexModel::getVar (const Variable *variable, int index) {
	map<const Variable*, int>::const_iterator it = varIndex.find(variable);
	if (it == varIndex.end()) {
		throw ModelingException("Variable " + variable->label + " is not part of the formulated model");
	}
	return vars[it->second][index];
}

void CplexModel::saveSolution () {
	const vector<Variable*> &variables = system->getVariables();

	solution = Solution();
	for (unsigned int v=0; v<variables.size(); v++) {
		vector<double> values (variables[v]->length);
		for (int i=0; i<variables[v]->length; i++) {
			values[i] = cplex.getValue(vars[v][i]);
		}
		solution.set(variables[v]->label, values);
	}
	solution.objValue = cplex.getObjValue();
}

/****************************************************************************
 * solve
 * - Solves the model and records the solution depending on the flag.
 * - An infeasible model is exported for inspection and reported.
 ****************************************************************************/
bool CplexModel::solve (bool saveSol) {
	if (system == NULL) {
		throw ModelingException("The model has to be formulated before it is solved");
	}

	bool status = false;
	try {
		status = cplex.solve();

		// record the solution
		if (status && saveSol) {
			saveSolution();
		}

		if (!status) {
			cplex.exportModel("infeasible_flowSys.lp");
			system->diagnostics.warning(Diagnostics::SOLVER, "CplexModel",
										"no solution found, the model was exported to infeasible_flowSys.lp");
		}
	}
	catch (IloException &e) {
		system->diagnostics.out() << e << endl;
		system->diagnostics.warning(Diagnostics::SOLVER, "CplexModel", e.getMessage());
		status = false;
	}

	return status;
}

bool CplexModel::solve () {
	return solve(true);
}

/****************************************************************************
 * getObjValue
 * - Returns the objective value of the last optimization.
 ****************************************************************************/
double CplexModel::getObjValue () {
	return cplex.getObjValue();
}
