//
//  PreventSimultaneousUsageModel.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef PreventSimultaneousUsageModel_hpp
#define PreventSimultaneousUsageModel_hpp

#include <vector>

#include "../SystemModel.hpp"

using namespace std;

/****************************************************************************
 * PreventSimultaneousUsageModel
 * - At most one of the binaries may be 1 per time step:
 *		sum(binary_i(t)) <= 1 + slack
 ****************************************************************************/
class PreventSimultaneousUsageModel : public ElementModel {

public:
	PreventSimultaneousUsageModel (Element &element, const vector<Variable*> &variables,
								   const string &label = "PreventSimultaneousUsage");

	void doModeling (SystemModel &system);

private:
	vector<Variable*> variables;
};

#endif /* PreventSimultaneousUsageModel_hpp */
