//
//  TimeSeries.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "TimeSeries.hpp"
#include "../misc.hpp"

TimeSeries::TimeSeries () : data(1, 0.0), scalar(true) {}

TimeSeries::TimeSeries (double value) : data(1, value), scalar(true) {}

TimeSeries::TimeSeries (const vector<double> &values) : data(values), scalar(false) {
	if (values.empty()) {
		throw ModelingException("A time series needs at least one value");
	}
}

double TimeSeries::at (int t) const {
	return scalar ? data[0] : data.at(t);
}

double TimeSeries::maximum () const {
	return ::maximum(data);
}

double TimeSeries::minimum () const {
	return ::minimum(data);
}

vector<double> TimeSeries::activeData (int begin, int length) const {
	if (scalar) return data;

	if (begin < 0 || begin + length > (int) data.size()) {
		throw ModelingException("Time window [" + numToStr(begin) + ", " + numToStr(begin+length)
								+ ") exceeds a time series of length " + numToStr(data.size()));
	}
	return vector<double> (data.begin()+begin, data.begin()+begin+length);
}

void TimeSeries::checkLength (int nrOfTimeSteps, const string &name) const {
	if (!scalar && (int) data.size() != nrOfTimeSteps) {
		throw ModelingException(name + " has " + numToStr(data.size()) + " values, but the horizon has "
								+ numToStr(nrOfTimeSteps) + " time steps");
	}
}
