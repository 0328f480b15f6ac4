//
//  Diagnostics.hpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#ifndef Diagnostics_hpp
#define Diagnostics_hpp

#include <string>
#include <vector>
#include <fstream>
#include <iostream>

using namespace std;

/****************************************************************************
 * Diagnostics
 * - Collects the non-fatal conditions found while a model is built. Every
 * warning is kept for the caller and echoed to the log stream.
 ****************************************************************************/
class Diagnostics {

public:
	enum WarningType {
		BIG_BINARY_BOUND,			// on/off bound exceeds the big-binary bound
		MAXIMUM_DURATION,			// maximum duration below the carried-over duration
		ZERO_EXCESS_PENALTY,		// excess penalty of exactly zero
		DEFAULT_SIZE_WITH_PROFILE,	// fixed profile on a flow with the default size
		SOLVER						// reported by the solver glue
	};

	struct Warning {
		WarningType type;
		string		source;
		string		message;
	};

	Diagnostics ();
	~Diagnostics ();

	void warning (WarningType type, const string &source, const string &message);

	const vector<Warning>&	getWarnings () const { return warnings; }
	int						count (WarningType type) const;
	void					clear ();

	/* log keeping */
	ostream&	out ();
	bool		openLogFile (string filename);
	void		closeLogFile ();
	void		setEcho (bool echo) { this->echo = echo; }

private:
	vector<Warning> warnings;

	ofstream	log_stream;
	string		log_stream_name;
	bool		echo;
};

#endif /* Diagnostics_hpp */
