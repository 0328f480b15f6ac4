//
//  InvestmentModel.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef InvestmentModel_hpp
#define InvestmentModel_hpp

#include <memory>

#include "../SystemModel.hpp"
#include "../elements/Parameters.hpp"
#include "SegmentModel.hpp"

using namespace std;

/****************************************************************************
 * InvestmentModel
 * - Sizing decision of one defining variable:
 *		var(t) = size * profile(t)						(fixed relative profile)
 *		size * relmin(t) <= var(t) <= size * relmax(t)	(otherwise)
 * - With an on variable the lower bound only holds while on(t) = 1.
 * - An optional investment gets the binary isInvested; size is zero
 * unless isInvested = 1.
 ****************************************************************************/
class InvestmentModel : public ElementModel {

public:
	InvestmentModel (Element &element, const InvestParameters &parameters, Variable *definingVariable,
					 const NumericBounds &relativeBounds, const OptionalNumeric &fixedRelativeProfile = boost::none,
					 Variable *onVariable = NULL, const string &label = "Investment");

	void doModeling (SystemModel &system);

	Variable *size;
	Variable *isInvested;

	SegmentedSharesModel* getSegments () const { return segments.get(); }

private:
	InvestParameters	parameters;
	Variable			*definingVariable;
	NumericBounds		relativeBounds;
	OptionalNumeric		fixedRelativeProfile;
	Variable			*onVariable;

	unique_ptr<SegmentedSharesModel> segments;

	void createBoundsForOptionalInvestment (SystemModel &system);
	void createBoundsForDefiningVariable (SystemModel &system);
	void createShares (SystemModel &system);
};

#endif /* InvestmentModel_hpp */
