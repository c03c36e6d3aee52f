#include "ahu.h"
#include "psychro.h"
#include "gauss.h"
#include <cmath>

using namespace std;

solverOptions::solverOptions() {
	conditionLimit = conditionLimitDefault;
	minDewPoint = 0;
	satTolerance = 1e-8;
	satIterations = 50;
	tempSatInit = tempSatGuess;
	pressure = pressureStd;
}

ahuResult::ahuResult() {
	status = AHU_OK;
	for(int i = 0; i < NUM_POINTS; i++) {
		theta[i] = 0;
		w[i] = 0;
	}
	for(int i = 0; i < ArraySize; i++)
		x[i] = 0;
	QtCC = QsCC = QlCC = QsHC = QsTZ = QlTZ = 0;
	mOut = mRecycle = mBypass = mCoil = 0;
	condition = 0;
	satIterations = 0;
	coilIdle = false;
	coilDry = false;
}

const char* statusName(int status) {
	switch(status) {
	case AHU_OK:
		return "OK";
	case AHU_INVALID_PARAMETER:
		return "InvalidParameter";
	case AHU_SINGULAR:
		return "SingularSystem";
	case AHU_COIL_LIMIT:
		return "CoilLimit";
	case AHU_NOT_BRACKETED:
		return "InfeasibleTarget";
	case AHU_NOT_CONVERGED:
		return "DidNotConverge";
	default:
		return "Unknown";
	}
}

/*
 * AirHandler - AHU model constructor
 * @param parameters - flows, by-pass fraction and controller gains
 * @param inputs     - outdoor and indoor conditions, building loads
 * @param options    - linear solver and saturation iteration settings (optional)
 */
AirHandler::AirHandler(const ahuParameters& parameters, const ahuInputs& scenarioInputs, const solverOptions& solverOpts) {
	params = parameters;
	inputs = scenarioInputs;
	options = solverOpts;
	wOut = humidityRatio(inputs.thetaO, inputs.phiO, options.pressure);
	wISp = humidityRatio(inputs.thetaISp, inputs.phiISp, options.pressure);
}

/*
 * validate - check parameters and inputs against their physical domain
 * @return AHU_OK or AHU_INVALID_PARAMETER
 */
int AirHandler::validate() const {
	const double values[] = {params.m, params.mo, params.beta, params.Ktheta, params.Kw,
							inputs.thetaO, inputs.phiO, inputs.thetaISp, inputs.phiISp,
							inputs.mi, inputs.UA, inputs.Qsa, inputs.Qla};
	const int numValues = sizeof(values) / sizeof(values[0]);

	for(int i = 0; i < numValues; i++) {
		if(std::isnan(values[i]))
			return AHU_INVALID_PARAMETER;
		// only the controller gains (3 and 4) may be infinite
		if(i != 3 && i != 4 && !std::isfinite(values[i]))
			return AHU_INVALID_PARAMETER;
	}

	if(params.m <= 0 || params.mo < 0 || params.mo > params.m)
		return AHU_INVALID_PARAMETER;
	if(params.beta < 0 || params.beta > 1)
		return AHU_INVALID_PARAMETER;
	if(params.Ktheta <= 0 || params.Kw < 0)
		return AHU_INVALID_PARAMETER;
	if(inputs.mi < 0 || inputs.UA < 0)
		return AHU_INVALID_PARAMETER;
	if(inputs.phiO < 0 || inputs.phiO > 1 || inputs.phiISp < 0 || inputs.phiISp > 1)
		return AHU_INVALID_PARAMETER;
	if(options.satIterations < 1 || !(options.satTolerance > 0) || !(options.conditionLimit > 0) || !(options.pressure > 0))
		return AHU_INVALID_PARAMETER;

	return AHU_OK;
}

// No air goes through the coil
bool AirHandler::coilIdle() const {
	return params.beta >= 1;
}

/*
 * assemble - mass and energy balances of the AHU as A x = b
 * @param tempSat - temperature where the saturation curve is linearized (deg C)
 * @param A       - coefficients of the unknowns (see unknownIndex)
 * @param b       - inputs
 * @param dryCoil - coil outlet keeps the humidity ratio of the mixed air instead of lying on the saturation curve
 */
void AirHandler::assemble(double tempSat, double A[][ArraySize], double* b, bool dryCoil) const {
	const double c = CpAir;
	const double l = hfgWater;
	const double m = params.m;
	const double mo = params.mo;
	const double beta = params.beta;
	const double mCoil = (1 - beta) * m;
	const double UAmi = inputs.UA + inputs.mi * c;	// envelope and infiltration conductance

	for(int i = 0; i < ArraySize; i++) {
		b[i] = 0;
		for(int j = 0; j < ArraySize; j++)
			A[i][j] = 0;
	}

	double ws0 = saturationHumidityRatio(tempSat, options.pressure);
	double wsp = saturationSlope(tempSat, options.pressure);

	// MX1 mixing of outdoor and recycled air
	A[0][X_THETA_M] = m * c;
	A[0][X_THETA_I] = -(m - mo) * c;
	b[0] = mo * c * inputs.thetaO;
	A[1][X_W_M] = m * l;
	A[1][X_W_I] = -(m - mo) * l;
	b[1] = mo * l * wOut;

	// CC cooling coil, outlet on the saturation curve
	A[2][X_THETA_M] = mCoil * c;
	A[2][X_THETA_S] = -mCoil * c;
	A[2][X_QS_CC] = 1;
	A[3][X_W_M] = mCoil * l;
	A[3][X_W_S] = -mCoil * l;
	A[3][X_QL_CC] = 1;
	if(dryCoil) {
		A[4][X_W_S] = 1;
		A[4][X_W_M] = -1;
	} else {
		A[4][X_THETA_S] = wsp;
		A[4][X_W_S] = -1;
		b[4] = wsp * tempSat - ws0;
	}
	A[5][X_QT_CC] = -1;
	A[5][X_QS_CC] = 1;
	A[5][X_QL_CC] = 1;

	// MX2 mixing of treated and by-passed air
	A[6][X_THETA_M] = beta * m * c;
	A[6][X_THETA_S] = mCoil * c;
	A[6][X_THETA_C] = -m * c;
	A[7][X_W_M] = beta * m * l;
	A[7][X_W_S] = mCoil * l;
	A[7][X_W_C] = -m * l;

	// HC reheater (sensible only)
	A[8][X_THETA_C] = m * c;
	A[8][X_THETA_SUP] = -m * c;
	A[8][X_QS_HC] = 1;
	A[9][X_W_C] = m * l;
	A[9][X_W_SUP] = -m * l;

	// TZ thermal zone
	A[10][X_THETA_SUP] = m * c;
	A[10][X_THETA_I] = -m * c;
	A[10][X_QS_TZ] = 1;
	A[11][X_W_SUP] = m * l;
	A[11][X_W_I] = -m * l;
	A[11][X_QL_TZ] = 1;

	// BL building envelope, infiltration and auxiliary loads
	A[12][X_THETA_I] = UAmi;
	A[12][X_QS_TZ] = 1;
	b[12] = UAmi * inputs.thetaO + inputs.Qsa;
	A[13][X_W_I] = inputs.mi * l;
	A[13][X_QL_TZ] = 1;
	b[13] = inputs.mi * l * wOut + inputs.Qla;

	// Ktheta indoor temperature controller acting on the coil.
	// With an idle coil the controller is saturated and the coil outlet is pinned instead.
	if(coilIdle()) {
		A[14][X_THETA_S] = 1;
		b[14] = tempSat;
	} else if(std::isinf(params.Ktheta)) {
		A[14][X_THETA_I] = 1;
		b[14] = inputs.thetaISp;
	} else {
		A[14][X_THETA_I] = params.Ktheta;
		A[14][X_QT_CC] = 1;
		b[14] = params.Ktheta * inputs.thetaISp;
	}

	// Kw indoor humidity controller acting on the reheater
	if(std::isinf(params.Kw)) {
		A[15][X_W_I] = 1;
		b[15] = wISp;
	} else {
		A[15][X_W_I] = params.Kw;
		A[15][X_QS_HC] = 1;
		b[15] = params.Kw * wISp;
	}
}

/*
 * solveLinear - one solve with the saturation curve linearized at tempSat
 * @param tempSat - linearization temperature (deg C)
 * @param dryCoil - no condensation on the coil
 * @return result, status AHU_OK, AHU_INVALID_PARAMETER or AHU_SINGULAR
 */
ahuResult AirHandler::solveLinear(double tempSat, bool dryCoil) const {
	ahuResult result;
	double A[ArraySize][ArraySize];
	double b[ArraySize];

	result.status = validate();
	if(result.status != AHU_OK)
		return result;

	assemble(tempSat, A, b, dryCoil);
	if(solveSystem(A, b, result.x, options.conditionLimit, result.condition) != GAUSS_OK) {
		result.status = AHU_SINGULAR;
		return result;
	}

	const double* x = result.x;
	result.theta[PT_OUT] = inputs.thetaO;
	result.w[PT_OUT] = wOut;
	result.theta[PT_MIX] = x[X_THETA_M];
	result.w[PT_MIX] = x[X_W_M];
	result.theta[PT_COIL] = x[X_THETA_S];
	result.w[PT_COIL] = x[X_W_S];
	result.theta[PT_BYPASS_MIX] = x[X_THETA_C];
	result.w[PT_BYPASS_MIX] = x[X_W_C];
	result.theta[PT_SUPPLY] = x[X_THETA_SUP];
	result.w[PT_SUPPLY] = x[X_W_SUP];
	result.theta[PT_ZONE] = x[X_THETA_I];
	result.w[PT_ZONE] = x[X_W_I];

	result.QtCC = x[X_QT_CC];
	result.QsCC = x[X_QS_CC];
	result.QlCC = x[X_QL_CC];
	result.QsHC = x[X_QS_HC];
	result.QsTZ = x[X_QS_TZ];
	result.QlTZ = x[X_QL_TZ];

	result.mOut = params.mo;
	result.mRecycle = params.m - params.mo;
	result.mBypass = params.beta * params.m;
	result.mCoil = params.m - result.mBypass;
	result.coilIdle = coilIdle();
	result.coilDry = dryCoil && !result.coilIdle;

	return result;
}

/*
 * solve - solves the AHU with the coil outlet on the saturation curve.
 *         The saturation curve is linearized at tempSat, and tempSat is moved to the
 *         computed coil outlet temperature until ws = wsat(tempSat).
 *         A saturated outlet wetter than the mixed air would mean a coil that adds
 *         moisture; the coil is then dry and the AHU is solved again with ws = wM.
 * @return result, see ahuStatus for the failure codes
 */
ahuResult AirHandler::solve() const {
	ahuResult result;
	double tempSat = options.tempSatInit;

	for(int iter = 1; iter <= options.satIterations; iter++) {
		result = solveLinear(tempSat);
		result.satIterations = iter;
		if(result.status != AHU_OK || result.coilIdle)
			return result;

		double ts = result.theta[PT_COIL];
		// outside of the saturation pressure correlations
		if(!std::isfinite(ts) || ts < -100 || saturationVaporPressure(ts + C_TO_K) >= options.pressure) {
			result.status = AHU_COIL_LIMIT;
			return result;
		}

		double dws = abs(saturationHumidityRatio(ts, options.pressure) - result.w[PT_COIL]);
		tempSat = ts;
		if(dws < options.satTolerance) {
			if(result.w[PT_COIL] > result.w[PT_MIX])
				return solveDry(tempSat, iter);
			if(ts < options.minDewPoint)
				result.status = AHU_COIL_LIMIT;
			return result;
		}
	}

	result.status = AHU_NOT_CONVERGED;
	return result;
}

/*
 * solveDry - sensible cooling only, the coil outlet keeps the mixed air humidity ratio
 * @param tempSat    - last linearization temperature (deg C)
 * @param iterations - saturation iterations already used
 * @return result, AHU_COIL_LIMIT if the dry outlet would be supersaturated or too cold
 */
ahuResult AirHandler::solveDry(double tempSat, int iterations) const {
	ahuResult result = solveLinear(tempSat, true);
	result.satIterations = iterations + 1;
	if(result.status != AHU_OK)
		return result;

	double ts = result.theta[PT_COIL];
	if(!std::isfinite(ts) || ts < -100 || ts < options.minDewPoint)
		result.status = AHU_COIL_LIMIT;
	else if(result.w[PT_COIL] > saturationHumidityRatio(ts, options.pressure) + options.satTolerance)
		result.status = AHU_COIL_LIMIT;
	return result;
}

// Copy of this AHU with other parameters, same inputs and options
AirHandler AirHandler::withParameters(const ahuParameters& parameters) const {
	return AirHandler(parameters, inputs, options);
}
