//
//  config.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef config_hpp
#define config_hpp

#include <string>
#include <limits>

using namespace std;

/* Numeric settings threaded through every model of a horizon */
struct ModelingConfig {
	ModelingConfig () :
		epsilon(1e-5), big(1e7), bigBinaryBound(1e5), binarySlack(0.1), mipGap(1e-4), threads(1) {}

	double	epsilon;			// values within [-epsilon, epsilon] count as zero (off)
	double	big;				// default size of flows without an explicit size, default maximum invest size
	double	bigBinaryBound;		// on/off upper bounds above this value are reported
	double	binarySlack;		// sums of binaries are bounded by 1 + binarySlack
	double	mipGap;				// relative MIP gap passed to the solver
	int		threads;			// solver threads
};

/* Rolling horizon parameters of a run */
struct runType {
	runType () : horizonSteps(24), windowSteps(24), stepHours(1.0), useHistory(true) {}

	int		horizonSteps;		// total number of time steps of the problem
	int		windowSteps;		// time steps solved per horizon window
	double	stepHours;			// duration of a time step in hours
	bool	useHistory;			// true if the previous window seeds the next one
};

const double INF = numeric_limits<double>::infinity();

bool readConfig (string path, ModelingConfig &config, runType &runParam);

#endif /* config_hpp */
