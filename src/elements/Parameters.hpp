//
//  Parameters.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef Parameters_hpp
#define Parameters_hpp

#include <string>
#include <vector>
#include <map>

#include <boost/optional.hpp>

#include "../config.hpp"
#include "../math/TimeSeries.hpp"

using namespace std;

/* A linear piece given by the values of a variable at its two ends */
typedef pair<double, double>	Segment;
typedef vector<Segment>			Segments;

/****************************************************************************
 * OnOffParameters
 * - Selects the parts of the on/off state machine that get modeled:
 *		off variable		<- consecutive off hours are bounded
 *		duration counters	<- consecutive on/off hours are bounded
 *		switch counting		<- forced, switch-on effects or a switch-on limit
 ****************************************************************************/
class OnOffParameters {

public:
	OnOffParameters ();

	EffectValues	effectsPerSwitchOn;
	EffectValues	effectsPerRunningHour;

	boost::optional<double>		onHoursTotalMin;
	boost::optional<double>		onHoursTotalMax;
	boost::optional<TimeSeries>	consecutiveOnHoursMin;
	boost::optional<TimeSeries>	consecutiveOnHoursMax;
	boost::optional<TimeSeries>	consecutiveOffHoursMin;
	boost::optional<TimeSeries>	consecutiveOffHoursMax;
	boost::optional<double>		switchOnTotalMax;
	bool						forceSwitchOn;

	bool useOff () const;
	bool useConsecutiveOnHours () const;
	bool useConsecutiveOffHours () const;
	bool useSwitchOn () const;

	void transformData (int nrOfTimeSteps, const string &owner) const;
};

/* Piecewise-linear invest effects: segments of the size and, per effect, the matching segments of the effect */
struct SegmentedEffects {
	Segments					sizeSegments;
	map<string, Segments>		effectSegments;
};

/****************************************************************************
 * InvestParameters
 * - Sizing decision of a flow. The size is either fixed or chosen within
 * [minimumSize, maximumSize]; an optional investment may also be zero.
 ****************************************************************************/
class InvestParameters {

public:
	InvestParameters ();

	boost::optional<double>	fixedSize;
	double					minimumSize;
	boost::optional<double>	maximumSize;		// config.big if unset
	bool					isOptional;

	EffectValues	fixEffects;			// paid once if invested
	EffectValues	specificEffects;	// per unit of size
	EffectValues	divestEffects;		// paid if not invested
	boost::optional<SegmentedEffects> effectsInSegments;

	double	minimum () const;		// fixed size if given
	double	maximum () const;		// fixed size if given

	void transformData (const ModelingConfig &config, const string &owner);
};

#endif /* Parameters_hpp */
