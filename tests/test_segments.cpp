//
//  test_segments.cpp
//  flowSysMIP
//
//  Created by the flowSysMIP developers on 10/18/26.
//  Copyright © 2026 flowSysMIP developers. All rights reserved.
//

#include <catch2/catch.hpp>

#include "misc.hpp"
#include "SystemModel.hpp"
#include "effects/Effect.hpp"
#include "features/SegmentModel.hpp"
#include "testHelpers.hpp"

static Segments segments (double a0, double a1) {
	return Segments(1, Segment(a0, a1));
}

static Segments segments (double a0, double a1, double b0, double b1) {
	Segments s;
	s.push_back(Segment(a0, a1));
	s.push_back(Segment(b0, b1));
	return s;
}

TEST_CASE("Interpolation within one segment", "[segments]") {
	ModelingConfig config;
	Diagnostics diag;
	diag.setEcho(false);
	SystemModel system (vector<double>(2, 1.0), config, diag);

	Element converter ("Converter");
	HostModel host (converter);
	Variable *fuel = system.createVariable("Q_fu", host, 2, toVector(0.0));
	Variable *heat = system.createVariable("Q_th", host, 2, toVector(0.0));

	vector<SegmentedVariable> points;
	points.push_back(SegmentedVariable(fuel, segments(0, 10)));
	points.push_back(SegmentedVariable(heat, segments(0, 100)));

	MultipleSegmentsModel model (converter, points, false);
	model.doModeling(system);

	REQUIRE(model.getSegmentModels().size() == 1);
	CHECK(model.outsideSegments == NULL);
	CHECK(model.getSegmentModels()[0]->lambda0->label == "Converter__MultipleSegments__Segment_0__lambda0");
	CHECK(model.getSegmentModels()[0]->inSegment->isBinary);

	double f[]	 = {5, 10};
	double h[]	 = {50, 100};
	double l0[]	 = {0.5, 0};
	double l1[]	 = {0.5, 1};

	const string segment = "Converter__MultipleSegments__Segment_0";
	Solution sol = baseSolution(system);
	sol.set("Converter__Q_fu", vector<double>(f, f+2));
	sol.set("Converter__Q_th", vector<double>(h, h+2));
	sol.set(segment + "__inSegment", vector<double>(2, 1.0));
	sol.set(segment + "__lambda0", vector<double>(l0, l0+2));
	sol.set(segment + "__lambda1", vector<double>(l1, l1+2));
	CHECK(system.checkSolution(sol, 1e-6).empty());

	SECTION("values off the line") {
		h[0] = 40;
		sol.set("Converter__Q_th", vector<double>(h, h+2));
		CHECK(violationsOf(system, sol, "lambda_Q_th") == vector<string>(1, "Converter__MultipleSegments__lambda_Q_th[0]"));
	}

	SECTION("the weights add up to the segment flag") {
		sol.set(segment + "__lambda0", vector<double>(2, 0.0));
		CHECK(violationsOf(system, sol, segment + "__inSegment[").size() == 1);
	}

	SECTION("staying outside is not allowed") {
		Solution zero = baseSolution(system);
		CHECK(violationsOf(system, zero, "in_single_Segment").size() == 2);
	}
}

TEST_CASE("Choosing one of several segments", "[segments]") {
	ModelingConfig config;
	Diagnostics diag;
	diag.setEcho(false);
	SystemModel system (vector<double>(1, 1.0), config, diag);

	Element converter ("Converter");
	HostModel host (converter);
	Variable *fuel = system.createVariable("Q_fu", host, 1, toVector(0.0));
	Variable *heat = system.createVariable("Q_th", host, 1, toVector(0.0));

	vector<SegmentedVariable> points;
	points.push_back(SegmentedVariable(fuel, segments(0, 10, 10, 20)));
	points.push_back(SegmentedVariable(heat, segments(0, 100, 100, 150)));

	const string segment0 = "Converter__MultipleSegments__Segment_0";
	const string segment1 = "Converter__MultipleSegments__Segment_1";

	SECTION("inside the second segment") {
		MultipleSegmentsModel model (converter, points, false);
		model.doModeling(system);

		Solution sol = baseSolution(system);
		sol.set("Converter__Q_fu", toVector(15.0));
		sol.set("Converter__Q_th", toVector(125.0));
		sol.set(segment1 + "__inSegment", toVector(1.0));
		sol.set(segment1 + "__lambda0", toVector(0.5));
		sol.set(segment1 + "__lambda1", toVector(0.5));
		CHECK(system.checkSolution(sol, 1e-6).empty());

		// both segments active
		sol.set(segment0 + "__inSegment", toVector(1.0));
		CHECK(violationsOf(system, sol, "in_single_Segment").size() == 1);
	}

	SECTION("an outside state is created on request") {
		MultipleSegmentsModel model (converter, points, true);
		model.doModeling(system);

		REQUIRE(model.outsideSegments != NULL);
		CHECK(model.outsideSegments->label == "Converter__MultipleSegments__outside_segments");

		Solution sol = baseSolution(system);
		CHECK(system.checkSolution(sol, 1e-6).empty());

		sol.set(segment0 + "__inSegment", toVector(1.0));
		sol.set(segment0 + "__lambda1", toVector(1.0));
		sol.set("Converter__Q_fu", toVector(10.0));
		sol.set("Converter__Q_th", toVector(100.0));
		CHECK(violationsOf(system, sol, "in_single_Segment").size() == 1);

		sol.set("Converter__MultipleSegments__outside_segments", toVector(1.0));
		CHECK(system.checkSolution(sol, 1e-6).empty());
	}

	SECTION("a supplied outside variable has to be binary") {
		Variable *invested = system.createVariable("isInvested", host, 1, boost::none, boost::none, true);
		Variable *size	   = system.createVariable("size", host, 1, toVector(0.0));

		MultipleSegmentsModel model (converter, points, false, invested);
		model.doModeling(system);
		CHECK(model.outsideSegments == invested);

		CHECK_THROWS_AS(MultipleSegmentsModel(converter, points, false, size), ModelingException);
	}

	SECTION("segment counts have to match") {
		vector<SegmentedVariable> mismatched;
		mismatched.push_back(SegmentedVariable(fuel, segments(0, 10, 10, 20)));
		mismatched.push_back(SegmentedVariable(heat, segments(0, 100)));
		CHECK_THROWS_AS(MultipleSegmentsModel(converter, mismatched, false), ModelingException);

		CHECK_THROWS_AS(MultipleSegmentsModel(converter, vector<SegmentedVariable>(), false), ModelingException);

		vector<SegmentedVariable> missing (1, SegmentedVariable(NULL, segments(0, 10)));
		CHECK_THROWS_AS(MultipleSegmentsModel(converter, missing, false), ModelingException);
	}
}

TEST_CASE("Segmented shares", "[segments]") {
	ModelingConfig config;
	Diagnostics diag;
	diag.setEcho(false);
	SystemModel system (vector<double>(2, 1.0), config, diag);

	Element boiler ("Boiler");
	HostModel host (boiler);
	Variable *rate = system.createVariable("flow_rate", host, 2, toVector(0.0));

	map<string, Segments> costs;
	costs["costs"] = segments(0, 5, 5, 12);

	SECTION("segment lengths have to match") {
		CHECK_THROWS_AS(SegmentedSharesModel(boiler, SegmentedVariable(rate, segments(0, 10)), costs, true), ModelingException);
	}

	SECTION("shares need a ledger") {
		SegmentedSharesModel model (boiler, SegmentedVariable(rate, segments(0, 10, 10, 20)), costs, true);
		CHECK_THROWS_AS(model.doModeling(system), ModelingException);
	}

	SECTION("a time-indexed curve is booked as operation") {
		EffectCollection effects;
		effects.addEffect(new Effect("costs", "EUR", "", true, true));
		EffectCollectionModel ledger (effects);
		ledger.doModeling(system);

		SegmentedSharesModel model (boiler, SegmentedVariable(rate, segments(0, 10, 10, 20)), costs, true);
		model.doModeling(system);

		REQUIRE(model.shares.count("costs") == 1);
		CHECK(model.shares["costs"]->length == 2);
		CHECK(model.shares["costs"]->label == "Boiler__SegmentedShares__costs_segmented");
		CHECK(model.getSegmentsModel()->outsideSegments != NULL);
		CHECK(ledger.getEffectModel("costs")->operation->shares().count("Boiler__segmented_effects") == 1);
		CHECK(ledger.getEffectModel("costs")->invest->shares().empty());
	}
}
