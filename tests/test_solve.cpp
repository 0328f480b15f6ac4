//
//  test_solve.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include <catch2/catch.hpp>

#include <memory>

#include "misc.hpp"
#include "FlowSystem.hpp"
#include "CplexModel.hpp"

static vector<Flow*> flows (Flow *a) {
	return vector<Flow*> (1, a);
}

static vector<Flow*> noFlows () {
	return vector<Flow*> ();
}

static Flow* addDemand (FlowSystem &flowSys, Bus &bus, double size, const vector<double> &profile) {
	Flow *load = new Flow("Q_th_Load", bus);
	load->size = size;
	load->fixedRelativeProfile = TimeSeries(profile);
	flowSys.addComponent(new Component("Demand", flows(load), noFlows()));
	return load;
}

/* models and solves one window, true if a solution was found */
static bool solveWindow (FlowSystem &flowSys, SystemModel &system, Solution &solution, double &objValue) {
	flowSys.doModeling(system);

	CplexModel cplex;
	cplex.formulate(system);
	if ( !cplex.solve() ) return false;

	solution = cplex.getSolution();
	objValue = cplex.getObjValue();
	return true;
}

static bool isOn (double value) {
	return value > 0.5;
}

TEST_CASE("Switching follows the demand", "[solve]") {
	ModelingConfig config;
	Diagnostics diag;
	diag.setEcho(false);

	FlowSystem flowSys (vector<double>(7, 1.0));
	flowSys.addEffect(new Effect("costs", "EUR", "", true, true));
	Bus *heat = flowSys.addBus(new Bus("Heat", boost::none));

	double profile[] = {0, 1, 1, 1, 0, 0, 1};
	addDemand(flowSys, *heat, 5.0, vector<double>(profile, profile+7));

	Flow *boiler = new Flow("Q_th", *heat);
	boiler->size = 10.0;
	boiler->effectsPerFlowHour[""] = TimeSeries(1.0);
	OnOffParameters onOff;
	onOff.effectsPerSwitchOn[""] = TimeSeries(10.0);
	boiler->onOffParameters = onOff;
	flowSys.addComponent(new Component("Boiler", noFlows(), flows(boiler)));

	flowSys.transformData(config, diag);
	unique_ptr<SystemModel> system (flowSys.createSystemModel(0, 7, config, diag));

	Solution sol;
	double objValue;
	REQUIRE(solveWindow(flowSys, *system, sol, objValue));

	// 20 flow hours and two starts
	CHECK(objValue == Approx(40.0));
	CHECK(sol.get("Boiler__Q_th__OnOff__nrSwitchOn")[0] == Approx(2.0));

	const vector<double> &on		= sol.get("Boiler__Q_th__OnOff__on");
	const vector<double> &duration	= sol.get("Boiler__Q_th__OnOff__consecutiveOnHours");
	double expected[] = {0, 1, 2, 3, 0, 0, 1};
	for (int t=0; t<7; t++) {
		CHECK(isOn(on[t]) == (profile[t] > 0));
		CHECK(duration[t] == Approx(expected[t]).margin(1e-4));
	}
}

TEST_CASE("A minimum run time keeps the unit on", "[solve]") {
	ModelingConfig config;
	Diagnostics diag;
	diag.setEcho(false);

	FlowSystem flowSys (vector<double>(5, 1.0));
	flowSys.addEffect(new Effect("costs", "EUR", "", true, true));
	Bus *heat = flowSys.addBus(new Bus("Heat", TimeSeries(10.0)));

	double profile[] = {0, 1, 0, 0, 0};
	addDemand(flowSys, *heat, 5.0, vector<double>(profile, profile+5));

	Flow *boiler = new Flow("Q_th", *heat);
	boiler->size = 10.0;
	boiler->effectsPerFlowHour[""] = TimeSeries(1.0);
	OnOffParameters onOff;
	onOff.consecutiveOnHoursMin = TimeSeries(3.0);
	boiler->onOffParameters = onOff;
	flowSys.addComponent(new Component("Boiler", noFlows(), flows(boiler)));

	Flow *peak = new Flow("Q_th", *heat);
	peak->size = 10.0;
	peak->effectsPerFlowHour[""] = TimeSeries(100.0);
	flowSys.addComponent(new Component("Peak", noFlows(), flows(peak)));

	flowSys.transformData(config, diag);
	unique_ptr<SystemModel> system (flowSys.createSystemModel(0, 5, config, diag));

	Solution sol;
	double objValue;
	REQUIRE(solveWindow(flowSys, *system, sol, objValue));

	// the cheap boiler serves the demand and runs idle afterwards
	CHECK(objValue == Approx(5.0).epsilon(1e-3));
	CHECK(sol.get("Peak__Q_th__flow_rate")[1] == Approx(0.0).margin(1e-6));

	const vector<double> &on = sol.get("Boiler__Q_th__OnOff__on");
	CHECK_FALSE(isOn(on[0]));
	CHECK(isOn(on[1]));
	CHECK(isOn(on[2]));
	CHECK(isOn(on[3]));
}

TEST_CASE("Optional investment decision", "[solve]") {
	ModelingConfig config;
	Diagnostics diag;
	diag.setEcho(false);

	FlowSystem flowSys (vector<double>(2, 1.0));
	flowSys.addEffect(new Effect("costs", "EUR", "", true, true));
	Bus *heat = flowSys.addBus(new Bus("Heat", boost::none));
	addDemand(flowSys, *heat, 10.0, vector<double>(2, 1.0));

	Flow *boiler = new Flow("Q_th", *heat);
	boiler->effectsPerFlowHour[""] = TimeSeries(1.0);
	InvestParameters invest;
	invest.fixedSize = 10.0;

	Flow *peak = new Flow("Q_th", *heat);
	peak->size = 100.0;
	peak->effectsPerFlowHour[""] = TimeSeries(5.0);
	flowSys.addComponent(new Component("Peak", noFlows(), flows(peak)));

	SECTION("investing pays off") {
		invest.fixEffects[""] = TimeSeries(50.0);
		boiler->investParameters = invest;
		flowSys.addComponent(new Component("Boiler", noFlows(), flows(boiler)));

		flowSys.transformData(config, diag);
		unique_ptr<SystemModel> system (flowSys.createSystemModel(0, 2, config, diag));

		Solution sol;
		double objValue;
		REQUIRE(solveWindow(flowSys, *system, sol, objValue));

		CHECK(objValue == Approx(70.0));
		CHECK(isOn(sol.get("Boiler__Q_th__Investment__isInvested")[0]));
		CHECK(sol.get("Boiler__Q_th__Investment__size")[0] == Approx(10.0));
		CHECK(sol.get("costs__invest__sum")[0] == Approx(50.0));
	}

	SECTION("investing is too expensive") {
		invest.fixEffects[""] = TimeSeries(200.0);
		boiler->investParameters = invest;
		flowSys.addComponent(new Component("Boiler", noFlows(), flows(boiler)));

		flowSys.transformData(config, diag);
		unique_ptr<SystemModel> system (flowSys.createSystemModel(0, 2, config, diag));

		Solution sol;
		double objValue;
		REQUIRE(solveWindow(flowSys, *system, sol, objValue));

		CHECK(objValue == Approx(100.0));
		CHECK_FALSE(isOn(sol.get("Boiler__Q_th__Investment__isInvested")[0]));
		CHECK(sol.get("Boiler__Q_th__flow_rate")[0] == Approx(0.0).margin(1e-6));
	}
}

TEST_CASE("Piecewise invest costs", "[solve]") {
	ModelingConfig config;
	Diagnostics diag;
	diag.setEcho(false);

	FlowSystem flowSys (vector<double>(1, 1.0));
	flowSys.addEffect(new Effect("costs", "EUR", "", true, true));
	Bus *heat = flowSys.addBus(new Bus("Heat", boost::none));
	addDemand(flowSys, *heat, 5.0, vector<double>(1, 1.0));

	Flow *chp = new Flow("Q_th", *heat);
	InvestParameters invest;
	invest.maximumSize = 40.0;
	SegmentedEffects costCurve;
	costCurve.sizeSegments.push_back(Segment(5, 20));
	costCurve.sizeSegments.push_back(Segment(20, 40));
	costCurve.effectSegments["costs"].push_back(Segment(50, 150));
	costCurve.effectSegments["costs"].push_back(Segment(150, 250));
	invest.effectsInSegments = costCurve;
	chp->investParameters = invest;
	flowSys.addComponent(new Component("CHP", noFlows(), flows(chp)));

	flowSys.transformData(config, diag);
	unique_ptr<SystemModel> system (flowSys.createSystemModel(0, 1, config, diag));

	Solution sol;
	double objValue;
	REQUIRE(solveWindow(flowSys, *system, sol, objValue));

	// the smallest size on the curve
	CHECK(objValue == Approx(50.0));
	CHECK(sol.get("CHP__Q_th__Investment__size")[0] == Approx(5.0));
	CHECK(sol.get("costs__invest__sum")[0] == Approx(50.0));
}

TEST_CASE("Unmet demand is penalized", "[solve]") {
	ModelingConfig config;
	Diagnostics diag;
	diag.setEcho(false);

	vector<double> dt (2, 1.0);
	dt[1] = 2.0;
	FlowSystem flowSys (dt);
	flowSys.addEffect(new Effect("costs", "EUR", "", true, true));
	Bus *heat = flowSys.addBus(new Bus("Heat"));
	addDemand(flowSys, *heat, 10.0, vector<double>(2, 1.0));

	flowSys.transformData(config, diag);
	unique_ptr<SystemModel> system (flowSys.createSystemModel(0, 2, config, diag));

	Solution sol;
	double objValue;
	REQUIRE(solveWindow(flowSys, *system, sol, objValue));

	// 10 * 1e5 * (1h + 2h)
	CHECK(objValue == Approx(3e6));
	CHECK(sol.get("Heat__excess_input")[0] == Approx(10.0));
	CHECK(sol.get("Heat__excess_input")[1] == Approx(10.0));
	CHECK(sol.get("Effects__penalty__sum")[0] == Approx(3e6));
	CHECK(system->checkSolution(sol, 1e-3).empty());
}

TEST_CASE("Windows are linked by the previous flow rates", "[solve]") {
	ModelingConfig config;
	Diagnostics diag;
	diag.setEcho(false);

	FlowSystem flowSys (vector<double>(4, 1.0));
	flowSys.addEffect(new Effect("costs", "EUR", "", true, true));
	Bus *heat = flowSys.addBus(new Bus("Heat", TimeSeries(100.0)));

	double profile[] = {0, 1, 0, 0};
	addDemand(flowSys, *heat, 5.0, vector<double>(profile, profile+4));

	Flow *boiler = new Flow("Q_th", *heat);
	boiler->size = 10.0;
	boiler->effectsPerFlowHour[""] = TimeSeries(1.0);
	OnOffParameters onOff;
	onOff.consecutiveOnHoursMin = TimeSeries(2.0);
	boiler->onOffParameters = onOff;
	flowSys.addComponent(new Component("Boiler", noFlows(), flows(boiler)));

	flowSys.transformData(config, diag);

	Solution first;
	double objValue;
	{
		unique_ptr<SystemModel> system (flowSys.createSystemModel(0, 2, config, diag));
		REQUIRE(solveWindow(flowSys, *system, first, objValue));
		flowSys.updatePreviousValues(first, *system);
	}

	// the run starts in the last step of the first window
	REQUIRE(boiler->previousFlowRate.size() == 2);
	CHECK(boiler->previousFlowRate[1] == Approx(5.0));
	CHECK(isOn(first.get("Boiler__Q_th__OnOff__on")[1]));

	Solution second;
	unique_ptr<SystemModel> system (flowSys.createSystemModel(2, 2, config, diag));
	REQUIRE(solveWindow(flowSys, *system, second, objValue));

	// ... and has to be continued at the start of the second one
	CHECK(isOn(second.get("Boiler__Q_th__OnOff__on")[0]));
	CHECK(second.get("Boiler__Q_th__OnOff__consecutiveOnHours")[0] == Approx(2.0).margin(1e-4));
	CHECK(objValue < 1.0);
}
