//
//  ShareAllocationModel.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef ShareAllocationModel_hpp
#define ShareAllocationModel_hpp

#include <map>
#include <memory>

#include <boost/optional.hpp>

#include "../SystemModel.hpp"

using namespace std;

/****************************************************************************
 * SingleShareModel
 * - One named contribution: a fresh variable bound by one equation to
 *		share = variable * factor		(or share = factor without variable)
 * - The share is scalar if the contribution is scalar or summed over time,
 * time-indexed otherwise.
 ****************************************************************************/
class SingleShareModel : public ElementModel {

public:
	SingleShareModel (Element &element, const string &name, Variable *variable, const vector<double> &factor, bool shareAsSum);

	void doModeling (SystemModel &system);

	Variable *singleShare;
	Equation *singleEquation;

private:
	Variable		*variable;
	vector<double>	factor;
	bool			shareAsSum;
};

/****************************************************************************
 * ShareAllocationModel
 * - Collects named shares and forces
 *		sum = sum(scalar shares) + sum_t sumTS(t)
 *		sumTS(t) = sum(time-indexed shares)(t)		(time series ledgers only)
 * - Optional bounds on the total and, for time series ledgers, on the rate
 * per hour.
 ****************************************************************************/
class ShareAllocationModel : public ElementModel {

public:
	ShareAllocationModel (Element &element, const string &label, bool sharesAreTimeSeries,
						  boost::optional<double> totalMax = boost::none,
						  boost::optional<double> totalMin = boost::none,
						  boost::optional<TimeSeries> maxPerHour = boost::none,
						  boost::optional<TimeSeries> minPerHour = boost::none);

	void doModeling (SystemModel &system);

	void addShare (SystemModel &system, const string &nameOfShare, Variable *variable,
				   const vector<double> &factor, bool shareAsSum = false);

	Variable *sum;
	Variable *sumTS;

	const map<string, Variable*>& shares () const { return shareMap; }

private:
	Equation *eqSum;
	Equation *eqTimeSeries;

	map<string, Variable*> shareMap;
	vector< unique_ptr<SingleShareModel> > shareModels;

	bool						sharesAreTimeSeries;
	boost::optional<double>		totalMax;
	boost::optional<double>		totalMin;
	boost::optional<TimeSeries>	maxPerHour;
	boost::optional<TimeSeries>	minPerHour;
};

#endif /* ShareAllocationModel_hpp */
