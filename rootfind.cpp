#include "rootfind.h"
#include "psychro.h"
#include <cmath>
#include <limits>

using namespace std;

rootOptions::rootOptions() {
	tolerance = 1e-6;
	maxIterations = 100;
	massFlowMax = ::massFlowMax;
	scanPoints = 16;
}

rootResult::rootResult() {
	status = AHU_OK;
	value = 0;
	authoritative = false;
	admissible = false;
	iterations = 0;
	evaluations = 0;
	target = 0;
	lowerBound = upperBound = 0;
	lowerOutput = upperOutput = 0;
}

const char* parameterName(designParameter parameter) {
	return (parameter == BYPASS_FRACTION) ? "beta" : "m";
}

const char* outputName(controlledOutput output) {
	switch(output) {
	case ZONE_HUMIDITY_RATIO:
		return "wI";
	case ZONE_RELATIVE_HUMIDITY:
		return "phiI";
	default:
		return "thetaS";
	}
}

/*
 * ParametricSolver - finds the value of one design parameter for which a controlled output reaches a target
 * @param ahu       - AHU with every other parameter and input fixed
 * @param parameter - by-pass fraction or supply mass flow
 * @param output    - controlled output
 * @param options   - tolerance and limits (optional)
 */
ParametricSolver::ParametricSolver(const AirHandler& ahu, designParameter param, controlledOutput out, const rootOptions& opts)
	: base(ahu), parameter(param), output(out), options(opts) {
}

// AHU with the design parameter set to value. The reheater is off when humidity is the target.
AirHandler ParametricSolver::trial(double value) const {
	ahuParameters p = base.parameters();
	if(parameter == BYPASS_FRACTION)
		p.beta = value;
	else
		p.m = value;
	if(output != SUPPLY_TEMPERATURE)
		p.Kw = 0;
	return base.withParameters(p);
}

double ParametricSolver::outputValue(const ahuResult& state) const {
	if(output == SUPPLY_TEMPERATURE)
		return state.theta[PT_SUPPLY];
	return state.w[PT_ZONE];
}

// Target expressed in the units of outputValue
double ParametricSolver::compareTarget(double target) const {
	if(output == ZONE_RELATIVE_HUMIDITY)
		return humidityRatio(base.scenario().thetaISp, target, base.solver().pressure);
	return target;
}

/*
 * evaluate - solve the AHU at one trial value
 * @return true if the trial is admissible (solved with the coil active)
 */
bool ParametricSolver::evaluate(double value, double& out, ahuResult& state, int& evaluations) const {
	evaluations++;
	state = trial(value).solve();
	if(state.status != AHU_OK || state.coilIdle)
		return false;
	out = outputValue(state);
	return true;
}

/*
 * admissibleEdge - bisection for the limit of the admissible region
 * @param good - admissible value
 * @param bad  - inadmissible value
 * @return admissible value within tolerance of the limit
 */
double ParametricSolver::admissibleEdge(double good, double bad, int& evaluations) const {
	double out;
	ahuResult state;

	for(int i = 0; i < options.maxIterations && abs(bad - good) > options.tolerance; i++) {
		double mid = 0.5 * (good + bad);
		if(evaluate(mid, out, state, evaluations))
			good = mid;
		else
			bad = mid;
	}
	return good;
}

/*
 * solve - Brent's method on (output - target) over the admissible interval
 * @param target - target of the controlled output (kg/kg, 0-1 or deg C)
 * @return result, status AHU_OK when converged
 */
rootResult ParametricSolver::solve(double target) const {
	const double EPS = numeric_limits<double>::epsilon();
	rootResult result;
	double lo, hi;

	if(parameter == BYPASS_FRACTION) {
		lo = 0;
		hi = 1;
	} else {
		lo = base.parameters().mo + options.tolerance;
		hi = options.massFlowMax;
	}
	result.target = compareTarget(target);
	result.lowerBound = lo;
	result.upperBound = hi;

	if(!(options.tolerance > 0) || options.maxIterations < 1 || options.scanPoints < 2 || !(hi > lo) || !std::isfinite(result.target)) {
		result.status = AHU_INVALID_PARAMETER;
		return result;
	}
	if(trial(0.5 * (lo + hi)).validate() != AHU_OK) {
		result.status = AHU_INVALID_PARAMETER;
		return result;
	}

	// Admissible interval
	double fa, fb, fc;
	ahuResult sa, sb, sc;
	bool okLo = evaluate(lo, fa, sa, result.evaluations);
	bool okHi = evaluate(hi, fb, sb, result.evaluations);
	int failure = (sa.status != AHU_OK) ? sa.status : sb.status;

	if(!okLo || !okHi) {
		double good = okLo ? lo : hi;
		bool found = okLo || okHi;
		for(int i = 1; i < options.scanPoints && !found; i++) {
			double p = lo + (hi - lo) * i / options.scanPoints;
			found = evaluate(p, fc, sc, result.evaluations);
			if(found)
				good = p;
			else if(failure == AHU_OK)
				failure = sc.status;
		}
		if(!found) {
			// no admissible trial, report the lower end
			result.status = (failure != AHU_OK) ? failure : AHU_NOT_BRACKETED;
			result.value = lo;
			result.state = sa;
			return result;
		}
		if(!okLo)
			lo = admissibleEdge(good, lo, result.evaluations);
		if(!okHi)
			hi = admissibleEdge(good, hi, result.evaluations);
		okLo = evaluate(lo, fa, sa, result.evaluations);
		okHi = evaluate(hi, fb, sb, result.evaluations);
		if(!okLo || !okHi) {
			result.status = okLo ? sb.status : sa.status;
			if(result.status == AHU_OK)
				result.status = AHU_NOT_BRACKETED;
			result.value = okLo ? hi : lo;
			result.state = okLo ? sb : sa;
			return result;
		}
	}
	result.admissible = true;

	result.lowerBound = lo;
	result.upperBound = hi;
	result.lowerOutput = fa;
	result.upperOutput = fb;

	// Brent's method on f = output - target
	double a = lo;
	double b = hi;
	double c = hi;
	double d = 0;
	double e = 0;
	fa -= result.target;
	fb -= result.target;

	if(fa == 0 || fb == 0) {
		result.status = AHU_OK;
		result.authoritative = true;
		result.value = (fa == 0) ? a : b;
		result.state = (fa == 0) ? sa : sb;
		return result;
	}
	if((fa > 0) == (fb > 0)) {
		// target unreachable, report the closer end
		result.status = AHU_NOT_BRACKETED;
		result.value = (abs(fa) < abs(fb)) ? a : b;
		result.state = (abs(fa) < abs(fb)) ? sa : sb;
		return result;
	}

	fc = fb;
	sc = sb;
	for(int iter = 1; iter <= options.maxIterations; iter++) {
		result.iterations = iter;
		if((fb > 0 && fc > 0) || (fb < 0 && fc < 0)) {
			c = a;
			fc = fa;
			sc = sa;
			e = d = b - a;
		}
		if(abs(fc) < abs(fb)) {
			a = b;
			b = c;
			c = a;
			fa = fb;
			fb = fc;
			fc = fa;
			sa = sb;
			sb = sc;
			sc = sa;
		}

		double tol1 = 2 * EPS * abs(b) + 0.5 * options.tolerance;
		double xm = 0.5 * (c - b);
		if(abs(xm) <= tol1 || fb == 0) {
			result.status = AHU_OK;
			result.authoritative = true;
			result.value = b;
			result.state = sb;
			return result;
		}

		if(abs(e) >= tol1 && abs(fa) > abs(fb)) {
			// inverse quadratic interpolation
			double p, q, r;
			double s = fb / fa;
			if(a == c) {
				p = 2 * xm * s;
				q = 1 - s;
			} else {
				q = fa / fc;
				r = fb / fc;
				p = s * (2 * xm * q * (q - r) - (b - a) * (r - 1));
				q = (q - 1) * (r - 1) * (s - 1);
			}
			if(p > 0)
				q = -q;
			p = abs(p);
			double min1 = 3 * xm * q - abs(tol1 * q);
			double min2 = abs(e * q);
			if(2 * p < (min1 < min2 ? min1 : min2)) {
				e = d;
				d = p / q;
			} else {
				d = xm;
				e = d;
			}
		} else {
			// bisection
			d = xm;
			e = d;
		}

		a = b;
		fa = fb;
		sa = sb;
		if(abs(d) > tol1)
			b += d;
		else
			b += (xm >= 0) ? tol1 : -tol1;

		double out;
		if(!evaluate(b, out, sb, result.evaluations)) {
			result.status = (sb.status != AHU_OK) ? sb.status : AHU_NOT_BRACKETED;
			result.value = a;
			result.state = sa;
			return result;
		}
		fb = out - result.target;
	}

	// iteration limit, best trial is not authoritative
	result.status = AHU_NOT_CONVERGED;
	result.value = b;
	result.state = sb;
	return result;
}
