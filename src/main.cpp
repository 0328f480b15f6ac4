//
//  main.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include "misc.hpp"
#include "config.hpp"
#include "Diagnostics.hpp"
#include "FlowSystem.hpp"
#include "CplexModel.hpp"

runType			runParam;
ModelingConfig	modelingConfig;

void parseCmdLine (int argc, const char *argv[], string &runFile, string &logFile);
void buildHeatSystem (FlowSystem &flowSys);
void printConfiguration ();
void printWindow (FlowSystem &flowSys, const Solution &solution, const SystemModel &system, ostream &out);

int main (int argc, const char * argv[]) {
	string runFile, logFile;

	parseCmdLine(argc, argv, runFile, logFile);

	/* Read the configuration file */
	readConfig(runFile, modelingConfig, runParam);
	printConfiguration();

	Diagnostics diagnostics;
	if ( !logFile.empty() && !diagnostics.openLogFile(logFile) ) {
		perror("Failed to open the log file, logging to the console.\n");
	}

	try {
		FlowSystem flowSys (vector<double> (runParam.horizonSteps, runParam.stepHours));
		buildHeatSystem(flowSys);
		flowSys.transformData(modelingConfig, diagnostics);

		/* Rolling horizon */
		for (int first=0; first<runParam.horizonSteps; first+=runParam.windowSteps) {
			int nrOfSteps = min(runParam.windowSteps, runParam.horizonSteps - first);

			unique_ptr<SystemModel> system (flowSys.createSystemModel(first, nrOfSteps, modelingConfig, diagnostics));
			flowSys.doModeling(*system);

			CplexModel cplex;
			cplex.formulate(*system);
			if ( !cplex.solve() ) {
				perror("Failed to solve the horizon window.\n");
				return 1;
			}

			diagnostics.out() << "Window [" << first << ", " << first + nrOfSteps << "): objective = "
							  << fixed << setprecision(2) << cplex.getObjValue() << endl;
			printWindow(flowSys, cplex.getSolution(), *system, diagnostics.out());

			if (runParam.useHistory) {
				flowSys.updatePreviousValues(cplex.getSolution(), *system);
			}
		}
	}
	catch (ModelingException &e) {
		cout << "Error: " << e.what() << endl;
		return 1;
	}

	if (!diagnostics.getWarnings().empty()) {
		cout << diagnostics.getWarnings().size() << " warning(s) were raised while modeling." << endl;
	}
	diagnostics.closeLogFile();

	return 0;
}

void parseCmdLine (int argc, const char *argv[], string &runFile, string &logFile) {
	if (argc == 2) {
		runFile = argv[1];
	}
	else if (argc == 3) {
		runFile = argv[1];
		logFile = argv[2];
	}
	else {
		cout << "Missing inputs. Please provide the following in the given order:\n  (1) run parameters file path,\n  (2) log file path (optional)." << endl;
		exit(1);
	}
}//END parseCmdLine()

/****************************************************************************
 * buildHeatSystem
 * - A heat bus supplied by a gas boiler (on/off with start costs and a
 * minimum run time) and an optional CHP whose size is chosen with
 * piecewise-linear invest costs. Fuel costs are booked per flow hour.
 ****************************************************************************/
void buildHeatSystem (FlowSystem &flowSys) {
	int T = flowSys.nrOfTimeSteps();

	flowSys.addEffect(new Effect("costs", "EUR", "operation and invest costs", true, true));
	Effect *co2 = flowSys.addEffect(new Effect("CO2", "kg", "CO2 emissions"));
	co2->maximumOperationPerHour = TimeSeries(30.0);

	Bus *heat = flowSys.addBus(new Bus("Heat"));

	/* heat demand: low at night, peaks in the morning and the evening */
	vector<double> demand (T);
	for (int t=0; t<T; t++) {
		int hour = t % 24;
		if (hour < 6)		demand[t] = 0.3;
		else if (hour < 9)	demand[t] = 0.9;
		else if (hour < 17)	demand[t] = 0.5;
		else if (hour < 22)	demand[t] = 1.0;
		else				demand[t] = 0.4;
	}
	Flow *load = new Flow("Q_th_Load", *heat);
	load->size = 60.0;
	load->fixedRelativeProfile = TimeSeries(demand);
	flowSys.addComponent(new Component("HeatDemand", vector<Flow*>(1, load), vector<Flow*>()));

	/* gas boiler */
	Flow *boilerHeat = new Flow("Q_th", *heat, TimeSeries(0.2), TimeSeries(1.0));
	boilerHeat->size = 50.0;
	boilerHeat->effectsPerFlowHour["costs"] = TimeSeries(0.07);
	boilerHeat->effectsPerFlowHour["CO2"]	= TimeSeries(0.25);

	OnOffParameters boilerOnOff;
	boilerOnOff.effectsPerSwitchOn[""]	 = TimeSeries(2.0);
	boilerOnOff.consecutiveOnHoursMin	 = TimeSeries(2.0);
	boilerHeat->onOffParameters = boilerOnOff;
	flowSys.addComponent(new Component("Boiler", vector<Flow*>(), vector<Flow*>(1, boilerHeat)));

	/* CHP with sizing */
	Flow *chpHeat = new Flow("Q_th", *heat, TimeSeries(0.3), TimeSeries(1.0));
	chpHeat->effectsPerFlowHour["costs"] = TimeSeries(0.05);
	chpHeat->effectsPerFlowHour["CO2"]	 = TimeSeries(0.3);
	chpHeat->onOffParameters = OnOffParameters();

	InvestParameters chpInvest;
	chpInvest.maximumSize = 40.0;
	SegmentedEffects costCurve;
	costCurve.sizeSegments.push_back(Segment(5, 20));
	costCurve.sizeSegments.push_back(Segment(20, 40));
	costCurve.effectSegments["costs"].push_back(Segment(50, 150));
	costCurve.effectSegments["costs"].push_back(Segment(150, 250));
	chpInvest.effectsInSegments = costCurve;
	chpHeat->investParameters = chpInvest;
	flowSys.addComponent(new Component("CHP", vector<Flow*>(), vector<Flow*>(1, chpHeat)));
}

void printConfiguration () {
	cout << "------------------------------------------------------------------" << endl;
	cout << "Horizon " << runParam.horizonSteps << " steps of " << runParam.stepHours << " h, solved in windows of "
		 << runParam.windowSteps << " steps" << endl;
	cout << "epsilon = " << modelingConfig.epsilon << ", big = " << modelingConfig.big
		 << ", big binary bound = " << modelingConfig.bigBinaryBound << endl;
	if (runParam.useHistory) cout << "Using the flow rates of the previous window." << endl;
	cout << "------------------------------------------------------------------" << endl;
}

void printWindow (FlowSystem &flowSys, const Solution &solution, const SystemModel &system, ostream &out) {
	const vector< unique_ptr<Component> > &components = flowSys.getComponents();
	for (unsigned int c=0; c<components.size(); c++) {
		vector<Flow*> flows = components[c]->getFlows();
		for (unsigned int f=0; f<flows.size(); f++) {
			string label = flows[f]->labelFull() + "__flow_rate";
			out << setw(20) << left << flows[f]->labelFull();
			const vector<double> &values = solution.get(system.getVariable(label)->label);
			for (unsigned int t=0; t<values.size(); t++) out << setw(7) << right << setprecision(1) << values[t];
			out << endl;
		}
	}
}
