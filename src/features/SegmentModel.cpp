//
//  SegmentModel.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "SegmentModel.hpp"
#include "../effects/Effect.hpp"
#include "../misc.hpp"

SegmentModel::SegmentModel (Element &element, const string &label, int segmentIndex,
							const map<Variable*, Segment> &samplePoints, bool asTimeSeries) :
	ElementModel(element, label), inSegment(NULL), lambda0(NULL), lambda1(NULL),
	samplePoints(samplePoints), segmentIndex(segmentIndex), asTimeSeries(asTimeSeries) {}

void SegmentModel::doModeling (SystemModel &system) {
	int length = asTimeSeries ? system.nrOfTimeSteps : 1;

	inSegment = system.createVariable("inSegment", *this, length, boost::none, boost::none, true);
	lambda0	  = system.createVariable("lambda0", *this, length, toVector(0.0), toVector(1.0));
	lambda1	  = system.createVariable("lambda1", *this, length, toVector(0.0), toVector(1.0));

	// eq: -inSegment(t) + lambda0(t) + lambda1(t) = 0
	Equation *eq = system.createEquation("inSegment", *this);
	eq->addSummand(inSegment, -1);
	eq->addSummand(lambda0, 1);
	eq->addSummand(lambda1, 1);
}

MultipleSegmentsModel::MultipleSegmentsModel (Element &element, const vector<SegmentedVariable> &samplePoints,
											  bool canBeOutsideSegments, Variable *outsideSegments,
											  bool asTimeSeries, const string &label) :
	ElementModel(element, label), outsideSegments(outsideSegments), samplePoints(samplePoints),
	canBeOutsideSegments(canBeOutsideSegments), asTimeSeries(asTimeSeries)
{
	if (samplePoints.empty() || samplePoints.front().second.empty()) {
		throw ModelingException(labelFull() + ": a piecewise relation needs at least one variable and one segment");
	}
	for (unsigned int i=0; i<samplePoints.size(); i++) {
		if (samplePoints[i].first == NULL) {
			throw ModelingException(labelFull() + ": segments without a variable");
		}
		if ((int) samplePoints[i].second.size() != nrOfSegments()) {
			throw ModelingException(labelFull() + ": " + samplePoints[i].first->label + " has "
									+ numToStr(samplePoints[i].second.size()) + " segments, expected "
									+ numToStr(nrOfSegments()));
		}
	}
	if (outsideSegments != NULL && !outsideSegments->isBinary) {
		throw ModelingException(labelFull() + ": the outside variable " + outsideSegments->label + " must be binary");
	}
}

void MultipleSegmentsModel::doModeling (SystemModel &system) {
	/* one model per segment, holding the sample points of every variable */
	for (int i=0; i<nrOfSegments(); i++) {
		map<Variable*, Segment> points;
		for (unsigned int v=0; v<samplePoints.size(); v++) {
			points[samplePoints[v].first] = samplePoints[v].second[i];
		}
		unique_ptr<SegmentModel> segment (new SegmentModel(element, label + "__Segment_" + numToStr(i), i, points, asTimeSeries));
		segment->doModeling(system);
		segmentModels.push_back(move(segment));
	}

	// eq: -v(t) + sum_i(v_i_0 * lambda0_i(t) + v_i_1 * lambda1_i(t)) = 0
	for (unsigned int v=0; v<samplePoints.size(); v++) {
		Variable *var = samplePoints[v].first;

		Equation *lambdaEq = system.createEquation("lambda_" + var->labelShort, *this);
		lambdaEq->addSummand(var, -1);
		for (unsigned int i=0; i<segmentModels.size(); i++) {
			const Segment &points = segmentModels[i]->samplePoints[var];
			lambdaEq->addSummand(segmentModels[i]->lambda0, points.first);
			lambdaEq->addSummand(segmentModels[i]->lambda1, points.second);
		}
	}

	// a) eq: sum(inSegment(t)) = 1				only inside segments
	// b) eq: sum(inSegment(t)) - outside(t) = 0	everything may also be zero
	Equation *inSingleSegment = system.createEquation("in_single_Segment", *this);
	for (unsigned int i=0; i<segmentModels.size(); i++) {
		inSingleSegment->addSummand(segmentModels[i]->inSegment, 1);
	}

	if (outsideSegments != NULL) {
		inSingleSegment->addSummand(outsideSegments, -1);
	}
	else if (canBeOutsideSegments) {
		int length = asTimeSeries ? system.nrOfTimeSteps : 1;
		outsideSegments = system.createVariable("outside_segments", *this, length, boost::none, boost::none, true);
		inSingleSegment->addSummand(outsideSegments, -1);
	}
	else {
		inSingleSegment->addConstant(1);
	}
}

SegmentedSharesModel::SegmentedSharesModel (Element &element, const SegmentedVariable &variableSegments,
											const map<string, Segments> &shareSegments,
											bool canBeOutsideSegments, Variable *outsideSegments, const string &label) :
	ElementModel(element, label), variableSegments(variableSegments), shareSegments(shareSegments),
	canBeOutsideSegments(canBeOutsideSegments), outsideVariable(outsideSegments), asTimeSeries(false)
{
	if (variableSegments.first == NULL) {
		throw ModelingException(labelFull() + ": segmented shares need a variable");
	}
	for (map<string, Segments>::const_iterator it = shareSegments.begin(); it != shareSegments.end(); ++it) {
		if (it->second.size() != variableSegments.second.size()) {
			throw ModelingException(labelFull() + ": segment length of " + variableSegments.first->label
									+ " and of the shares of " + it->first + " must be equal");
		}
	}
	asTimeSeries = variableSegments.first->length > 1;
}

void SegmentedSharesModel::doModeling (SystemModel &system) {
	int length = asTimeSeries ? system.nrOfTimeSteps : 1;

	vector<SegmentedVariable> segments;
	for (map<string, Segments>::const_iterator it = shareSegments.begin(); it != shareSegments.end(); ++it) {
		string effectName = it->first.empty() ? "standard" : it->first;
		shares[it->first] = system.createVariable(effectName + "_segmented", *this, length);
		segments.push_back(SegmentedVariable(shares[it->first], it->second));
	}
	segments.push_back(variableSegments);

	segmentsModel.reset(new MultipleSegmentsModel(element, segments, canBeOutsideSegments, outsideVariable,
												   asTimeSeries, label + "__Segments"));
	segmentsModel->doModeling(system);

	/* shares */
	EffectCollectionModel *effectCollection = system.effectCollectionModel;
	if (effectCollection == NULL) {
		throw ModelingException(labelFull() + ": shares need an effect collection model");
	}
	for (map<string, Variable*>::iterator it = shares.begin(); it != shares.end(); ++it) {
		EffectValues effectValues;
		effectValues[it->first] = TimeSeries(1.0);

		if (asTimeSeries) {
			effectCollection->addShareToOperation(system, "segmented_effects", element, effectValues, toVector(1.0), it->second);
		}
		else {
			effectCollection->addShareToInvest(system, "segmented_effects", element, effectValues, 1.0, it->second);
		}
	}
}
