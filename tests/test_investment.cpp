//
//  test_investment.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include <catch2/catch.hpp>

#include "misc.hpp"
#include "SystemModel.hpp"
#include "effects/Effect.hpp"
#include "features/InvestmentModel.hpp"
#include "testHelpers.hpp"

static NumericBounds relative (double relmin, double relmax) {
	return NumericBounds(toVector(relmin), toVector(relmax));
}

TEST_CASE("Optional investment with a fixed size", "[investment]") {
	ModelingConfig config;
	Diagnostics diag;
	diag.setEcho(false);
	SystemModel system (vector<double>(2, 1.0), config, diag);

	Element boiler ("Boiler");
	HostModel host (boiler);
	Variable *rate = system.createVariable("flow_rate", host, 2, toVector(0.0));

	InvestParameters parameters;
	parameters.fixedSize = 10.0;

	InvestmentModel investment (boiler, parameters, rate, relative(0, 1));
	investment.doModeling(system);

	REQUIRE(investment.isInvested != NULL);
	CHECK(investment.size->label == "Boiler__Investment__size");
	CHECK(investment.size->lb(0) == 0.0);
	CHECK(investment.size->ub(0) == 10.0);
	CHECK(investment.getSegments() == NULL);

	Solution sol = baseSolution(system);
	CHECK(system.checkSolution(sol, 1e-6).empty());

	SECTION("invested means the full size") {
		sol.set("Boiler__Investment__isInvested", toVector(1.0));
		sol.set("Boiler__Investment__size", toVector(10.0));
		sol.set("Boiler__flow_rate", vector<double>(2, 10.0));
		CHECK(system.checkSolution(sol, 1e-6).empty());

		sol.set("Boiler__flow_rate", vector<double>(2, 11.0));
		CHECK(violationsOf(system, sol, "ub_flow_rate").size() == 2);
	}

	SECTION("no intermediate size") {
		sol.set("Boiler__Investment__isInvested", toVector(1.0));
		sol.set("Boiler__Investment__size", toVector(5.0));
		CHECK(violationsOf(system, sol, "is_invested").size() == 1);
	}

	SECTION("no size without investing") {
		sol.set("Boiler__Investment__size", toVector(10.0));
		CHECK(violationsOf(system, sol, "is_invested").size() == 1);
	}

	SECTION("no flow without investing") {
		sol.set("Boiler__flow_rate", vector<double>(2, 1.0));
		CHECK(violationsOf(system, sol, "ub_flow_rate").size() == 2);
	}
}

TEST_CASE("Investment sizes", "[investment]") {
	ModelingConfig config;
	Diagnostics diag;
	diag.setEcho(false);
	SystemModel system (vector<double>(2, 1.0), config, diag);

	Element chp ("CHP");
	HostModel host (chp);
	Variable *rate = system.createVariable("flow_rate", host, 2, toVector(0.0));

	SECTION("a mandatory fixed size is a constant") {
		InvestParameters parameters;
		parameters.fixedSize  = 10.0;
		parameters.isOptional = false;

		InvestmentModel investment (chp, parameters, rate, relative(0, 1));
		investment.doModeling(system);

		CHECK(investment.isInvested == NULL);
		CHECK(investment.size->isFixed());
		CHECK(investment.size->lb(0) == 10.0);
	}

	SECTION("a mandatory investment starts at the minimum size") {
		InvestParameters parameters;
		parameters.minimumSize = 5.0;
		parameters.maximumSize = 20.0;
		parameters.isOptional  = false;

		InvestmentModel investment (chp, parameters, rate, relative(0, 1));
		investment.doModeling(system);

		CHECK(investment.isInvested == NULL);
		CHECK(investment.size->lb(0) == 5.0);
		CHECK(investment.size->ub(0) == 20.0);
	}

	SECTION("an optional investment is zero or within the size range") {
		InvestParameters parameters;
		parameters.minimumSize = 5.0;
		parameters.maximumSize = 20.0;

		InvestmentModel investment (chp, parameters, rate, relative(0, 1));
		investment.doModeling(system);

		CHECK(investment.size->lb(0) == 0.0);
		CHECK(hasEquation(investment, "is_invested_ub"));
		CHECK(hasEquation(investment, "is_invested_lb"));

		Solution sol = baseSolution(system);
		CHECK(system.checkSolution(sol, 1e-6).empty());

		sol.set("CHP__Investment__isInvested", toVector(1.0));
		sol.set("CHP__Investment__size", toVector(3.0));
		CHECK(violationsOf(system, sol, "is_invested_lb").size() == 1);

		sol.set("CHP__Investment__size", toVector(12.0));
		CHECK(system.checkSolution(sol, 1e-6).empty());

		sol.set("CHP__Investment__isInvested", toVector(0.0));
		CHECK(violationsOf(system, sol, "is_invested_ub").size() == 1);
	}

	SECTION("a missing defining variable") {
		CHECK_THROWS_AS(InvestmentModel(chp, InvestParameters(), NULL, relative(0, 1)), ModelingException);
	}
}

TEST_CASE("Flow bounds scale with the size", "[investment]") {
	ModelingConfig config;
	Diagnostics diag;
	diag.setEcho(false);
	SystemModel system (vector<double>(2, 1.0), config, diag);

	Element chp ("CHP");
	HostModel host (chp);
	Variable *rate = system.createVariable("flow_rate", host, 2, toVector(0.0));

	InvestParameters parameters;
	parameters.maximumSize = 20.0;
	parameters.isOptional  = false;

	SECTION("the lower bound is relaxed while off") {
		Variable *on = system.createVariable("on", host, 2, boost::none, boost::none, true);

		InvestmentModel investment (chp, parameters, rate, relative(0.2, 1), boost::none, on);
		investment.doModeling(system);

		Solution sol = baseSolution(system);
		sol.set("CHP__Investment__size", toVector(20.0));
		CHECK(system.checkSolution(sol, 1e-6).empty());

		double onValues[] = {1, 0};
		double low[]	  = {2, 0};
		double enough[]	  = {4, 0};
		sol.set("CHP__on", vector<double>(onValues, onValues+2));
		sol.set("CHP__flow_rate", vector<double>(low, low+2));
		CHECK(violationsOf(system, sol, "lb_flow_rate") == vector<string>(1, "CHP__Investment__lb_flow_rate[0]"));

		sol.set("CHP__flow_rate", vector<double>(enough, enough+2));
		CHECK(system.checkSolution(sol, 1e-6).empty());
	}

	SECTION("a fixed profile pins the flow") {
		double p[] = {0.5, 1};
		InvestmentModel investment (chp, parameters, rate, relative(0, 1), vector<double>(p, p+2));
		investment.doModeling(system);

		CHECK(hasEquation(investment, "fixed_flow_rate"));
		CHECK_FALSE(hasEquation(investment, "ub_flow_rate"));

		double r[] = {5, 10};
		Solution sol = baseSolution(system);
		sol.set("CHP__Investment__size", toVector(10.0));
		sol.set("CHP__flow_rate", vector<double>(r, r+2));
		CHECK(system.checkSolution(sol, 1e-6).empty());

		sol.set("CHP__flow_rate", vector<double>(2, 5.0));
		CHECK(violationsOf(system, sol, "fixed_flow_rate").size() == 1);
	}
}

TEST_CASE("Investment effects", "[investment]") {
	ModelingConfig config;
	Diagnostics diag;
	diag.setEcho(false);
	SystemModel system (vector<double>(2, 1.0), config, diag);

	EffectCollection effects;
	effects.addEffect(new Effect("costs", "EUR", "", true, true));
	EffectCollectionModel ledger (effects);
	ledger.doModeling(system);

	Element chp ("CHP");
	HostModel host (chp);
	Variable *rate = system.createVariable("flow_rate", host, 2, toVector(0.0));

	SECTION("fix, divest and specific effects") {
		InvestParameters parameters;
		parameters.maximumSize = 40.0;
		parameters.fixEffects[""]	   = TimeSeries(1000.0);
		parameters.divestEffects[""]   = TimeSeries(200.0);
		parameters.specificEffects[""] = TimeSeries(10.0);

		InvestmentModel investment (chp, parameters, rate, relative(0, 1));
		investment.doModeling(system);

		const map<string, Variable*> &shares = ledger.getEffectModel("costs")->invest->shares();
		CHECK(shares.size() == 4);
		CHECK(shares.count("CHP__divest_cancellation_effects") == 1);

		Solution sol = baseSolution(system);
		sol.set("costs__invest__CHP__divest_effects__share", toVector(200.0));
		sol.set("costs__invest__sum", toVector(200.0));
		CHECK(violationsOf(system, sol, "costs__invest").empty());

		sol.set("CHP__Investment__isInvested", toVector(1.0));
		sol.set("CHP__Investment__size", toVector(10.0));
		sol.set("costs__invest__CHP__fix_effects__share", toVector(1000.0));
		sol.set("costs__invest__CHP__divest_cancellation_effects__share", toVector(-200.0));
		sol.set("costs__invest__CHP__specific_effects__share", toVector(100.0));
		sol.set("costs__invest__sum", toVector(1100.0));
		CHECK(violationsOf(system, sol, "costs__invest").empty());
	}

	SECTION("a mandatory investment pays no divest effects") {
		InvestParameters parameters;
		parameters.maximumSize = 40.0;
		parameters.isOptional  = false;
		parameters.fixEffects[""]	 = TimeSeries(1000.0);
		parameters.divestEffects[""] = TimeSeries(200.0);

		InvestmentModel investment (chp, parameters, rate, relative(0, 1));
		investment.doModeling(system);

		const map<string, Variable*> &shares = ledger.getEffectModel("costs")->invest->shares();
		CHECK(shares.size() == 1);
		CHECK(shares.count("CHP__fix_effects") == 1);
	}

	SECTION("piecewise costs follow the size") {
		InvestParameters parameters;
		parameters.maximumSize = 40.0;

		SegmentedEffects segmented;
		segmented.sizeSegments.push_back(Segment(5, 20));
		segmented.sizeSegments.push_back(Segment(20, 40));
		segmented.effectSegments["costs"].push_back(Segment(50, 150));
		segmented.effectSegments["costs"].push_back(Segment(150, 250));
		parameters.effectsInSegments = segmented;

		InvestmentModel investment (chp, parameters, rate, relative(0, 1));
		investment.doModeling(system);

		REQUIRE(investment.getSegments() != NULL);
		CHECK(investment.getSegments()->getSegmentsModel()->outsideSegments == investment.isInvested);
		CHECK(ledger.getEffectModel("costs")->invest->shares().count("CHP__segmented_effects") == 1);

		const string segments = "CHP__Investment__SegmentedShares__Segments";

		Solution sol = baseSolution(system);
		CHECK(violationsOf(system, sol, "SegmentedShares").empty());

		double costs = 50 * 2.0/3 + 150 * 1.0/3;
		sol.set("CHP__Investment__isInvested", toVector(1.0));
		sol.set("CHP__Investment__size", toVector(10.0));
		sol.set(segments + "__Segment_0__inSegment", toVector(1.0));
		sol.set(segments + "__Segment_0__lambda0", toVector(2.0/3));
		sol.set(segments + "__Segment_0__lambda1", toVector(1.0/3));
		sol.set("CHP__Investment__SegmentedShares__costs_segmented", toVector(costs));
		sol.set("costs__invest__CHP__segmented_effects__share", toVector(costs));
		sol.set("costs__invest__sum", toVector(costs));
		sol.set("costs__total", toVector(costs));
		CHECK(system.checkSolution(sol, 1e-6).empty());

		// costs off the curve
		sol.set("CHP__Investment__SegmentedShares__costs_segmented", toVector(80.0));
		CHECK(violationsOf(system, sol, "lambda_costs_segmented").size() == 1);
	}
}
