//
//  misc.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef _MISC_H
#define _MISC_H

#include <iostream>
#include <sstream>
#include <iomanip>
#include <fstream>
#include <vector>
#include <algorithm>
#include <cmath>
#include <stdio.h>
#include <stdlib.h>
#include <stdexcept>
#include <map>
#include <string>

#define MISCPRECISION 1e-4

using namespace std;

/* Raised for every precondition violation while declaring or modeling a system */
class ModelingException : public runtime_error {
public:
	explicit ModelingException (const string &message) : runtime_error(message) {}
};

// Commonly used functions

/****************************************************************************
 * numToStr
 * - Converts numbers to string
 *****************************************************************************/
template <typename T>
string numToStr (T Number) {
	ostringstream ss;
	ss << Number;
	return ss.str();
}

istream& safeGetline(istream& is, string& t);

bool open_file (ifstream &file, string filename);
bool open_file (ofstream &file, string filename);

/* Vector helpers. A vector of length 1 broadcasts against any length. */
vector<double>	toVector (double value);
vector<int>		indexRange (int begin, int end);		// [begin, end)
vector<double>	slice (const vector<double> &x, int begin, int end);
vector<double>	multiply (const vector<double> &x, const vector<double> &y);
vector<double>	multiply (const vector<double> &x, double factor);
vector<double>	add (const vector<double> &x, double value);
vector<double>	add (const vector<double> &x, const vector<double> &y);
vector<double>	elementMax (const vector<double> &x, double value);

template <class object>
object sum (const vector<object> &x)
{
	object res = 0;
	for (unsigned int i=0; i<x.size(); i++)	res += x[i];
	return res;
}

template <class object>
object maximum (const vector<object> &x)
{
	object temp = -INFINITY;
	for (unsigned int i=0; i<x.size(); i++) {
		if (x[i] > temp) temp = x[i];
	}
	return temp;
}

template <class object>
object minimum (const vector<object> &x)
{
	object temp = INFINITY;
	for (unsigned int i=0; i<x.size(); i++) {
		if (x[i] < temp) temp = x[i];
	}
	return temp;
}

template <class object>
bool isFractional (object x, double prec)
{
	return ( fabs(x - round(x)) > prec );
}

#endif
