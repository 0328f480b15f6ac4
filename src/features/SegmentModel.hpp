//
//  SegmentModel.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef SegmentModel_hpp
#define SegmentModel_hpp

#include <vector>
#include <map>
#include <memory>

#include "../SystemModel.hpp"
#include "../elements/Parameters.hpp"

using namespace std;

/* One variable of a piecewise relation together with its segments */
typedef pair<Variable*, Segments> SegmentedVariable;

/****************************************************************************
 * SegmentModel
 * - One linear piece shared by several variables: a binary "in segment"
 * flag and two weights with inSegment = lambda0 + lambda1.
 ****************************************************************************/
class SegmentModel : public ElementModel {

public:
	SegmentModel (Element &element, const string &label, int segmentIndex,
				  const map<Variable*, Segment> &samplePoints, bool asTimeSeries);

	void doModeling (SystemModel &system);

	Variable *inSegment;
	Variable *lambda0;
	Variable *lambda1;

	map<Variable*, Segment> samplePoints;

private:
	int		segmentIndex;
	bool	asTimeSeries;
};

/****************************************************************************
 * MultipleSegmentsModel
 * - For every participating variable:
 *		variable = sum_segments(lambda0 * value0 + lambda1 * value1)
 * - Exactly one segment is active:
 *		sum(inSegment) = 1				(outside not allowed)
 *		sum(inSegment) = outside		(outside variable created or supplied)
 ****************************************************************************/
class MultipleSegmentsModel : public ElementModel {

public:
	MultipleSegmentsModel (Element &element, const vector<SegmentedVariable> &samplePoints,
						   bool canBeOutsideSegments, Variable *outsideSegments = NULL,
						   bool asTimeSeries = true, const string &label = "MultipleSegments");

	void doModeling (SystemModel &system);

	Variable *outsideSegments;

	const vector< unique_ptr<SegmentModel> >& getSegmentModels () const { return segmentModels; }

private:
	vector<SegmentedVariable>			samplePoints;
	bool								canBeOutsideSegments;
	bool								asTimeSeries;
	vector< unique_ptr<SegmentModel> >	segmentModels;

	int nrOfSegments () const { return (int) samplePoints.front().second.size(); }
};

/****************************************************************************
 * SegmentedSharesModel
 * - Piecewise-linear effects of one variable. A helper variable per effect
 * is tied to the curve and booked on the ledger: time-indexed curves as
 * operation shares, scalar curves as invest shares.
 ****************************************************************************/
class SegmentedSharesModel : public ElementModel {

public:
	SegmentedSharesModel (Element &element, const SegmentedVariable &variableSegments,
						  const map<string, Segments> &shareSegments,
						  bool canBeOutsideSegments, Variable *outsideSegments = NULL,
						  const string &label = "SegmentedShares");

	void doModeling (SystemModel &system);

	map<string, Variable*> shares;

	MultipleSegmentsModel* getSegmentsModel () const { return segmentsModel.get(); }

private:
	SegmentedVariable					variableSegments;
	map<string, Segments>				shareSegments;
	bool								canBeOutsideSegments;
	Variable							*outsideVariable;
	bool								asTimeSeries;
	unique_ptr<MultipleSegmentsModel>	segmentsModel;
};

#endif /* SegmentModel_hpp */
