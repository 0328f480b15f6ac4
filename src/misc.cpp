//
//  misc.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "misc.hpp"

/****************************************************************************
 * safeGetline
 * - Works the same as getline, however, can handle issues where the end of
 * line tokens might be either '\n', '\r', or '\n\r'.
 *****************************************************************************/
istream& safeGetline(istream& is, string& t)
{
	t.clear();

	std::istream::sentry se(is, true);
	std::streambuf* sb = is.rdbuf();

	for(;;) {
		int c = sb->sbumpc();
		switch (c) {
		case '\n':
			return is;
		case '\r':
			if(sb->sgetc() == '\n')
				sb->sbumpc();
			return is;
		case std::streambuf::traits_type::eof():
			// Also handle the case when the last line has no line ending
			if(t.empty())
				is.setstate(std::ios::eofbit);
			return is;
		default:
			t += (char)c;
		}
	}
}

bool open_file (ifstream &fptr, string filename) {

	fptr.open( filename.c_str() );
	if (fptr.fail()) {
		cout << "Error opening file: " << filename << endl;
		return false;
	}
	return true;
}

bool open_file (ofstream &fptr, string filename) {

	fptr.open( filename.c_str() );
	if (fptr.fail()) {
		cout << "Error opening file: " << filename << endl;
		return false;
	}
	return true;
}

vector<double> toVector (double value) {
	return vector<double> (1, value);
}

vector<int> indexRange (int begin, int end) {
	vector<int> idx;
	for (int i=begin; i<end; i++) idx.push_back(i);
	return idx;
}

vector<double> slice (const vector<double> &x, int begin, int end) {
	if (x.size() == 1) return x;
	return vector<double> (x.begin()+begin, x.begin()+end);
}

/****************************************************************************
 * multiply
 * - Element-wise product. Vectors of length 1 are broadcast, any other
 * length mismatch is a modeling error.
 ****************************************************************************/
vector<double> multiply (const vector<double> &x, const vector<double> &y) {
	if (x.size() != y.size() && x.size() != 1 && y.size() != 1) {
		throw ModelingException("Cannot multiply vectors of length " + numToStr(x.size()) + " and " + numToStr(y.size()));
	}
	size_t n = max(x.size(), y.size());
	vector<double> res (n);
	for (size_t i=0; i<n; i++) {
		res[i] = x[x.size() == 1 ? 0 : i] * y[y.size() == 1 ? 0 : i];
	}
	return res;
}

vector<double> multiply (const vector<double> &x, double factor) {
	return multiply(x, toVector(factor));
}

vector<double> add (const vector<double> &x, double value) {
	vector<double> res (x);
	for (unsigned int i=0; i<res.size(); i++) res[i] += value;
	return res;
}

vector<double> add (const vector<double> &x, const vector<double> &y) {
	if (x.size() != y.size() && x.size() != 1 && y.size() != 1) {
		throw ModelingException("Cannot add vectors of length " + numToStr(x.size()) + " and " + numToStr(y.size()));
	}
	size_t n = max(x.size(), y.size());
	vector<double> res (n);
	for (size_t i=0; i<n; i++) {
		res[i] = x[x.size() == 1 ? 0 : i] + y[y.size() == 1 ? 0 : i];
	}
	return res;
}

vector<double> elementMax (const vector<double> &x, double value) {
	vector<double> res (x);
	for (unsigned int i=0; i<res.size(); i++) res[i] = max(res[i], value);
	return res;
}
