//
//  ShareAllocationModel.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "ShareAllocationModel.hpp"
#include "../misc.hpp"

SingleShareModel::SingleShareModel (Element &element, const string &name, Variable *variable,
									const vector<double> &factor, bool shareAsSum) :
	ElementModel(element, name), singleShare(NULL), singleEquation(NULL),
	variable(variable), factor(factor), shareAsSum(shareAsSum)
{
	if (variable != NULL && variable->length == 1 && shareAsSum) {
		throw ModelingException(labelFull() + ": a variable of length 1 cannot be summed up");
	}
	if (factor.empty()) {
		throw ModelingException(labelFull() + ": share without a factor");
	}
}

void SingleShareModel::doModeling (SystemModel &system) {
	int length;
	if (shareAsSum || (variable != NULL && variable->length == 1) || (variable == NULL && factor.size() == 1)) {
		length = 1;
	}
	else if (variable != NULL) {
		length = variable->length;
	}
	else {
		length = (int) factor.size();	// constant time-indexed contribution
	}

	singleShare = system.createVariable("share", *this, length);

	// eq: share = variable * factor  |  share = factor
	singleEquation = system.createEquation("share", *this);
	singleEquation->addSummand(singleShare, -1);

	if (variable == NULL) {
		if (shareAsSum)	singleEquation->addConstant(-1 * ::sum(factor));
		else			singleEquation->addConstant(multiply(factor, -1));
	}
	else {
		singleEquation->addSummand(variable, factor, vector<int>(), shareAsSum);
	}
}

ShareAllocationModel::ShareAllocationModel (Element &element, const string &label, bool sharesAreTimeSeries,
											boost::optional<double> totalMax, boost::optional<double> totalMin,
											boost::optional<TimeSeries> maxPerHour, boost::optional<TimeSeries> minPerHour) :
	ElementModel(element, label), sum(NULL), sumTS(NULL), eqSum(NULL), eqTimeSeries(NULL),
	sharesAreTimeSeries(sharesAreTimeSeries), totalMax(totalMax), totalMin(totalMin),
	maxPerHour(maxPerHour), minPerHour(minPerHour)
{
	if (!sharesAreTimeSeries && (maxPerHour || minPerHour)) {
		throw ModelingException(labelFull() + ": bounds per hour need time-indexed shares");
	}
}

void ShareAllocationModel::doModeling (SystemModel &system) {
	sum = system.createVariable("sum", *this, 1,
								totalMin ? OptionalNumeric(toVector(*totalMin)) : boost::none,
								totalMax ? OptionalNumeric(toVector(*totalMax)) : boost::none);

	// eq: sum = sum(share_i)
	eqSum = system.createEquation("sum", *this);
	eqSum->addSummand(sum, -1);

	if (sharesAreTimeSeries) {
		OptionalNumeric lbTS, ubTS;
		if (minPerHour) lbTS = multiply(system.activeData(*minPerHour), system.dtInHours);
		if (maxPerHour) ubTS = multiply(system.activeData(*maxPerHour), system.dtInHours);

		sumTS = system.createVariable("sum_TS", *this, system.nrOfTimeSteps, lbTS, ubTS);

		// eq: sum_TS(t) = sum(share_TS_i)(t)
		eqTimeSeries = system.createEquation("time_series", *this);
		eqTimeSeries->addSummand(sumTS, -1);

		// eq: sum = ... + sum_t(sum_TS(t))
		eqSum->addSummand(sumTS, 1, vector<int>(), true);
	}
}

/****************************************************************************
 * addShare
 * - Adds a share to the time series equation if the ledger is a time
 * series and the contribution spans the horizon without being summed up,
 * to the scalar ledger equation otherwise.
 * - Share names are unique per ledger.
 ****************************************************************************/
void ShareAllocationModel::addShare (SystemModel &system, const string &nameOfShare, Variable *variable,
									 const vector<double> &factor, bool shareAsSum)
{
	if (eqSum == NULL) {
		throw ModelingException(labelFull() + ": shares can only be added after modeling the ledger");
	}

	if (shareMap.count(nameOfShare)) {
		throw ModelingException("A share with the label " + nameOfShare + " was already present in " + labelFull());
	}

	unique_ptr<SingleShareModel> newShare (new SingleShareModel(element, label + "__" + nameOfShare, variable, factor, shareAsSum));
	newShare->doModeling(system);

	// a contribution over the horizon is time-indexed, also if the horizon has a single step
	int contributionLength = (variable != NULL) ? variable->length : (int) factor.size();

	Equation *targetEq = eqSum;
	if (sharesAreTimeSeries && !shareAsSum && contributionLength == system.nrOfTimeSteps) {
		targetEq = eqTimeSeries;
	}
	targetEq->addSummand(newShare->singleShare, 1);

	shareMap[nameOfShare] = newShare->singleShare;
	shareModels.push_back(move(newShare));
}
