//
//  Parameters.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "Parameters.hpp"
#include "../misc.hpp"

OnOffParameters::OnOffParameters () : forceSwitchOn(false) {}

bool OnOffParameters::useOff () const {
	return useConsecutiveOffHours();
}

bool OnOffParameters::useConsecutiveOnHours () const {
	return consecutiveOnHoursMin || consecutiveOnHoursMax;
}

bool OnOffParameters::useConsecutiveOffHours () const {
	return consecutiveOffHoursMin || consecutiveOffHoursMax;
}

bool OnOffParameters::useSwitchOn () const {
	return forceSwitchOn || !effectsPerSwitchOn.empty() || switchOnTotalMax;
}

void OnOffParameters::transformData (int nrOfTimeSteps, const string &owner) const {
	if (consecutiveOnHoursMin)	consecutiveOnHoursMin->checkLength(nrOfTimeSteps, owner + ": consecutive on hours min");
	if (consecutiveOnHoursMax)	consecutiveOnHoursMax->checkLength(nrOfTimeSteps, owner + ": consecutive on hours max");
	if (consecutiveOffHoursMin)	consecutiveOffHoursMin->checkLength(nrOfTimeSteps, owner + ": consecutive off hours min");
	if (consecutiveOffHoursMax)	consecutiveOffHoursMax->checkLength(nrOfTimeSteps, owner + ": consecutive off hours max");

	for (EffectValues::const_iterator it = effectsPerSwitchOn.begin(); it != effectsPerSwitchOn.end(); ++it) {
		it->second.checkLength(nrOfTimeSteps, owner + ": effects per switch on");
	}
	for (EffectValues::const_iterator it = effectsPerRunningHour.begin(); it != effectsPerRunningHour.end(); ++it) {
		it->second.checkLength(nrOfTimeSteps, owner + ": effects per running hour");
	}
}

InvestParameters::InvestParameters () : minimumSize(0.0), isOptional(true) {}

double InvestParameters::minimum () const {
	return fixedSize ? *fixedSize : minimumSize;
}

double InvestParameters::maximum () const {
	if (fixedSize) return *fixedSize;
	return maximumSize ? *maximumSize : INF;
}

void InvestParameters::transformData (const ModelingConfig &config, const string &owner) {
	if (!maximumSize) maximumSize = config.big;

	if (minimumSize < 0 || minimumSize > *maximumSize) {
		throw ModelingException(owner + ": invest sizes must satisfy 0 <= minimum_size <= maximum_size");
	}
	if (fixedSize && *fixedSize < 0) {
		throw ModelingException(owner + ": the fixed size must not be negative");
	}

	if (effectsInSegments) {
		const Segments &sizeSegments = effectsInSegments->sizeSegments;
		for (map<string, Segments>::const_iterator it = effectsInSegments->effectSegments.begin();
			 it != effectsInSegments->effectSegments.end(); ++it) {
			if (it->second.size() != sizeSegments.size()) {
				throw ModelingException(owner + ": the segments of effect " + it->first
										+ " do not match the size segments");
			}
		}
	}
}
