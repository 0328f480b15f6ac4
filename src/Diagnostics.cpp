//
//  Diagnostics.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "Diagnostics.hpp"
#include "misc.hpp"

Diagnostics::Diagnostics () : echo(true) {}

Diagnostics::~Diagnostics () {
	closeLogFile();
}

void Diagnostics::warning (WarningType type, const string &source, const string &message) {
	Warning w;
	w.type	  = type;
	w.source  = source;
	w.message = message;
	warnings.push_back(w);

	if (echo) {
		out() << "Warning: " << source << ": " << message << endl;
	}
}

int Diagnostics::count (WarningType type) const {
	int n = 0;
	for (unsigned int i=0; i<warnings.size(); i++) {
		if (warnings[i].type == type) n++;
	}
	return n;
}

void Diagnostics::clear () {
	warnings.clear();
}

/****************************************************************************
 * out
 * - Returns the log file if one is open, the standard output otherwise.
 ****************************************************************************/
ostream& Diagnostics::out () {
	if (log_stream.is_open()) return log_stream;
	return cout;
}

bool Diagnostics::openLogFile (string filename) {
	closeLogFile();
	log_stream_name = filename;
	return open_file(log_stream, filename);
}

void Diagnostics::closeLogFile () {
	if (log_stream.is_open()) {
		log_stream.close();
	}
}
