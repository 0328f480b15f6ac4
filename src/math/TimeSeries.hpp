//
//  TimeSeries.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef TimeSeries_hpp
#define TimeSeries_hpp

#include <vector>
#include <map>
#include <string>

using namespace std;

/****************************************************************************
 * TimeSeries
 * - Scalar or per-step data over the whole problem horizon. A scalar is
 * stored once and broadcast; a model reads the window of its horizon with
 * activeData().
 ****************************************************************************/
class TimeSeries {

public:
	TimeSeries ();
	TimeSeries (double value);
	TimeSeries (const vector<double> &values);

	bool	isScalar () const { return scalar; }
	int		size () const { return (int) data.size(); }
	double	at (int t) const;
	double	first () const { return data.front(); }
	double	maximum () const;
	double	minimum () const;

	const vector<double>& values () const { return data; }

	// values of the steps [begin, begin+length); a scalar stays of length 1
	vector<double> activeData (int begin, int length) const;

	// throws unless the series is scalar or has exactly nrOfTimeSteps values
	void checkLength (int nrOfTimeSteps, const string &name) const;

private:
	vector<double>	data;
	bool			scalar;
};

/* Effect label -> contribution per unit. An empty label denotes the standard effect. */
typedef map<string, TimeSeries> EffectValues;

#endif /* TimeSeries_hpp */
