//
//  CplexModel.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef CplexModel_hpp
#define CplexModel_hpp

#include <ilcplex/ilocplex.h>

#include <map>

#include "misc.hpp"
#include "config.hpp"
#include "solution.hpp"
#include "SystemModel.hpp"

/****************************************************************************
 * CplexModel
 * - Hands a symbolic SystemModel to CPLEX: one variable array per
 * variable, one named range per equation row, and the objective.
 ****************************************************************************/
class CplexModel {

public:
	CplexModel ();
	~CplexModel ();

	void	formulate (SystemModel &system);
	bool	solve ();
	bool	solve (bool saveSolution);
	double	getObjValue ();

	const Solution& getSolution () const { return solution; }

private:
	/* cplex objects */
	IloEnv		env;
	IloModel	model;
	IloCplex	cplex;

	IloArray<IloNumVarArray> vars;
	map<const Variable*, int> varIndex;

	/* data */
	SystemModel	*system;
	Solution	solution;

	void	initializeVariables ();
	void	addEquations ();
	void	addObjective ();
	void	saveSolution ();

	IloNumVar&	getVar (const Variable *variable, int index);
};

#endif /* CplexModel_hpp */
