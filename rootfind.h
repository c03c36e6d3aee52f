#pragma once
#ifndef rootfind_h
#define rootfind_h

#include "ahu.h"

// Design parameter found by the root finder
enum designParameter {
	BYPASS_FRACTION,		// beta, m fixed
	SUPPLY_MASS_FLOW		// m, beta fixed
};

// Controlled output that must reach the target
enum controlledOutput {
	ZONE_HUMIDITY_RATIO,		// wI (kg/kg)
	ZONE_RELATIVE_HUMIDITY,	// phiI (0-1), compared as humidity ratio at the temperature setpoint
	SUPPLY_TEMPERATURE		// thetaS (deg C)
};

struct rootOptions {
	double tolerance;		// absolute tolerance on the design parameter
	int maxIterations;	// Brent iterations
	double massFlowMax;	// upper end of the mass flow search interval (kg/s)
	int scanPoints;		// interior points tried when no end of the interval is admissible

	rootOptions();
};

struct rootResult {
	int status;
	double value;				// design parameter found (best trial if not converged)
	bool authoritative;		// false unless status is AHU_OK
	int iterations;			// Brent iterations
	int evaluations;			// AHU solves
	double target;				// target in the units of the compared output
	double lowerBound;		// admissible search interval
	double upperBound;
	bool admissible;			// both ends of the interval solved, lowerOutput and upperOutput are set
	double lowerOutput;		// output at the ends of the interval
	double upperOutput;
	ahuResult state;			// solved AHU at value

	rootResult();
};

class ParametricSolver {
	private:
		AirHandler base;
		designParameter parameter;
		controlledOutput output;
		rootOptions options;

		bool evaluate(double value, double& out, ahuResult& state, int& evaluations) const;
		double admissibleEdge(double good, double bad, int& evaluations) const;

	public:
		ParametricSolver(const AirHandler& ahu, designParameter parameter, controlledOutput output, const rootOptions& options=rootOptions());

		AirHandler trial(double value) const;
		double outputValue(const ahuResult& state) const;
		double compareTarget(double target) const;
		rootResult solve(double target) const;
};

const char* parameterName(designParameter parameter);
const char* outputName(controlledOutput output);

#endif
