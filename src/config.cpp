//
//  config.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "config.hpp"
#include "misc.hpp"

/****************************************************************************
 * readConfig
 * - Sets the default values of the modeling and run parameters, then
 * overwrites them with the "key value" lines of the given file.
 * - A missing file is not an error: the defaults are used.
 * - Returns false if the file could not be read or contained unknown keys.
 ****************************************************************************/
bool readConfig (string path, ModelingConfig &config, runType &runParam) {
	ifstream fptr;
	string	 line, field1, field2;
	bool	 status = true;

	config	 = ModelingConfig();
	runParam = runType();

	if ( !open_file(fptr, path) ) {
		perror("Failed to read the run parameters, using the default parameters.\n");
		return false;
	}

	while ( safeGetline(fptr, line) ) {
		if (line.empty() || line[0] == '#') continue;

		istringstream iss(line);
		if ( !(iss >> field1 >> field2) ) continue;

		double temp = atof(field2.c_str());

		if ( field1 == "epsilon" )
			config.epsilon = temp;
		else if ( field1 == "big" )
			config.big = temp;
		else if ( field1 == "bigBinaryBound" )
			config.bigBinaryBound = temp;
		else if ( field1 == "binarySlack" )
			config.binarySlack = temp;
		else if ( field1 == "mipGap" )
			config.mipGap = temp;
		else if ( field1 == "threads" )
			config.threads = (int) temp;
		else if ( field1 == "horizonSteps" )
			runParam.horizonSteps = (int) temp;
		else if ( field1 == "windowSteps" )
			runParam.windowSteps = (int) temp;
		else if ( field1 == "stepHours" )
			runParam.stepHours = temp;
		else if ( field1 == "useHistory" )
			runParam.useHistory = (temp != 0);
		else {
			cout << "Warning: Unidentified run parameter in the file: " << field1 << endl;
			status = false;
		}
	}
	fptr.close();

	/* Make sure that the parameters make sense */
	if ( config.epsilon <= 0 || config.big <= 0 || config.binarySlack < 0 || config.binarySlack >= 1 ) {
		cout << "Warning: Inconsistent modeling parameters, using the defaults." << endl;
		config = ModelingConfig();
		status = false;
	}
	if ( runParam.windowSteps <= 0 || runParam.horizonSteps < runParam.windowSteps || runParam.stepHours <= 0 ) {
		cout << "Warning: Inconsistent time parameters, using the defaults." << endl;
		runParam = runType();
		status = false;
	}

	return status;
}//END readConfig()
