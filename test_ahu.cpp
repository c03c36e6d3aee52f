/* Unit tests for the AHU model in ahu.cpp
*/
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "ahu.h"
#include "psychro.h"
#include "gauss.h"

static ahuParameters defaultParameters() {
	ahuParameters p = {3.5, 1.0, 0.1, 1e10, 0.0};
	return p;
}

static ahuInputs defaultInputs() {
	ahuInputs in = {32.0, 0.5, 24.0, 0.6, 0.7, 675.0, 17000.0, 2000.0};
	return in;
}

TEST(AirHandler, DefaultScenarioHoldsZoneTemperature) {
	AirHandler ahu(defaultParameters(), defaultInputs());
	ahuResult r = ahu.solve();

	ASSERT_EQ(r.status, AHU_OK);
	EXPECT_FALSE(r.coilIdle);
	EXPECT_GE(r.satIterations, 2);
	EXPECT_NEAR(r.theta[PT_ZONE], 24.0, 1e-3);
	EXPECT_NEAR(r.theta[PT_MIX], 26.2857, 1e-3);
	EXPECT_NEAR(r.theta[PT_SUPPLY], 16.0, 1e-3);
	EXPECT_NEAR(r.theta[PT_COIL], 14.857, 1e-3);
	EXPECT_NEAR(r.QsTZ, 28000, 1);
	EXPECT_NEAR(r.QsCC, -36000, 5);
	EXPECT_LE(r.QtCC, 0);
	EXPECT_LE(r.QlCC, 0);
	EXPECT_NEAR(r.QsHC, 0, 1e-6);
	EXPECT_EQ(r.theta[PT_OUT], 32.0);
	EXPECT_DOUBLE_EQ(r.w[PT_OUT], ahu.outdoorHumidityRatio());
}

TEST(AirHandler, CoilOutletIsSaturated) {
	AirHandler ahu(defaultParameters(), defaultInputs());
	ahuResult r = ahu.solve();

	ASSERT_EQ(r.status, AHU_OK);
	EXPECT_LT(std::abs(saturationHumidityRatio(r.theta[PT_COIL]) - r.w[PT_COIL]), 1e-8);
	EXPECT_NEAR(relativeHumidity(r.theta[PT_COIL], r.w[PT_COIL]), 1.0, 1e-5);
}

TEST(AirHandler, CoilHeatFlowsAreConsistent) {
	AirHandler ahu(defaultParameters(), defaultInputs());
	ahuResult r = ahu.solve();

	ASSERT_EQ(r.status, AHU_OK);
	EXPECT_NEAR(r.QtCC, r.QsCC + r.QlCC, 1e-9 * std::abs(r.QtCC));
	EXPECT_NEAR(r.QsCC, r.mCoil * CpAir * (r.theta[PT_COIL] - r.theta[PT_MIX]), 1e-6 * std::abs(r.QsCC));
	EXPECT_NEAR(r.QlCC, r.mCoil * hfgWater * (r.w[PT_COIL] - r.w[PT_MIX]), 1e-6 * std::abs(r.QlCC));
}

TEST(AirHandler, MassFlowsAreConserved) {
	const double flows[] = {1.5, 3.5, 6.0};
	const double fractions[] = {0.0, 0.3, 1.0};
	const double betas[] = {0.0, 0.2, 0.4};

	for(int i = 0; i < 3; i++) {
		for(int j = 0; j < 3; j++) {
			for(int k = 0; k < 3; k++) {
				ahuParameters p = defaultParameters();
				p.m = flows[i];
				p.mo = fractions[j] * flows[i];
				p.beta = betas[k];
				ahuResult r = AirHandler(p, defaultInputs()).solveLinear(10.0);
				ASSERT_EQ(r.status, AHU_OK);
				EXPECT_NEAR(r.mOut + r.mRecycle, p.m, 1e-12);
				EXPECT_NEAR(r.mBypass + r.mCoil, p.m, 1e-12);
				EXPECT_NEAR(r.mBypass, p.beta * p.m, 1e-12);
			}
		}
	}
}

TEST(AirHandler, ZoneBalanceHolds) {
	ahuInputs in = defaultInputs();
	AirHandler ahu(defaultParameters(), in);
	ahuResult r = ahu.solve();

	ASSERT_EQ(r.status, AHU_OK);
	double m = defaultParameters().m;
	EXPECT_NEAR(m * CpAir * (r.theta[PT_SUPPLY] - r.theta[PT_ZONE]) + r.QsTZ, 0, 1e-4);
	EXPECT_NEAR(r.QsTZ, (in.UA + in.mi * CpAir) * (in.thetaO - r.theta[PT_ZONE]) + in.Qsa, 1e-4);
	EXPECT_NEAR(r.QlTZ, in.mi * hfgWater * (r.w[PT_OUT] - r.w[PT_ZONE]) + in.Qla, 1e-4);
}

TEST(AirHandler, TemperatureGainApproachesSetpoint) {
	const double gains[] = {1e5, 1e6, 1e7, 1e8, 1e9, 1e10};
	double previous = std::numeric_limits<double>::infinity();

	for(int i = 0; i < 6; i++) {
		ahuParameters p = defaultParameters();
		p.Ktheta = gains[i];
		ahuResult r = AirHandler(p, defaultInputs()).solve();
		ASSERT_EQ(r.status, AHU_OK) << "Ktheta " << gains[i];
		double deviation = std::abs(r.theta[PT_ZONE] - 24.0);
		EXPECT_LT(deviation, previous) << "Ktheta " << gains[i];
		if(gains[i] >= 1e8)
			EXPECT_LT(deviation, 1e-3);
		previous = deviation;
	}
}

TEST(AirHandler, InfiniteTemperatureGainIsExact) {
	ahuParameters p = defaultParameters();
	p.Ktheta = std::numeric_limits<double>::infinity();
	ahuResult r = AirHandler(p, defaultInputs()).solve();

	ASSERT_EQ(r.status, AHU_OK);
	EXPECT_NEAR(r.theta[PT_ZONE], 24.0, 1e-9);
	EXPECT_NEAR(r.theta[PT_SUPPLY], 16.0, 1e-9);
}

TEST(AirHandler, NoBypassTreatsAllAir) {
	ahuParameters p = defaultParameters();
	p.beta = 0;
	ahuResult r = AirHandler(p, defaultInputs()).solve();

	ASSERT_EQ(r.status, AHU_OK);
	EXPECT_NEAR(r.theta[PT_BYPASS_MIX], r.theta[PT_COIL], 1e-9);
	EXPECT_NEAR(r.w[PT_BYPASS_MIX], r.w[PT_COIL], 1e-12);
	EXPECT_EQ(r.mBypass, 0);
	EXPECT_EQ(r.mCoil, p.m);
}

TEST(AirHandler, FullBypassIdlesCoil) {
	ahuParameters p = defaultParameters();
	p.beta = 1;
	ahuResult r = AirHandler(p, defaultInputs()).solve();

	ASSERT_EQ(r.status, AHU_OK);
	EXPECT_TRUE(r.coilIdle);
	EXPECT_EQ(r.satIterations, 1);
	EXPECT_NEAR(r.QtCC, 0, 1e-6);
	EXPECT_NEAR(r.QsCC, 0, 1e-6);
	EXPECT_NEAR(r.QlCC, 0, 1e-6);
	EXPECT_NEAR(r.theta[PT_BYPASS_MIX], r.theta[PT_MIX], 1e-9);
	EXPECT_NEAR(r.w[PT_BYPASS_MIX], r.w[PT_MIX], 1e-12);
	EXPECT_EQ(r.mCoil, 0);
	// no cooling, the zone floats at 32 + 17000 / 2375 deg C
	EXPECT_NEAR(r.theta[PT_ZONE], 32 + 17000.0 / 2375.0, 1e-6);
}

TEST(AirHandler, BypassDriesZoneAir) {
	const double outdoorTemps[] = {30, 32};
	const double outdoorHumidities[] = {0.4, 0.5};
	const double flows[] = {3.5, 4.5};
	int compared = 0;

	for(int i = 0; i < 2; i++) {
		for(int j = 0; j < 2; j++) {
			for(int k = 0; k < 2; k++) {
				ahuInputs in = defaultInputs();
				in.thetaO = outdoorTemps[i];
				in.phiO = outdoorHumidities[j];
				ahuParameters p = defaultParameters();
				p.m = flows[k];

				double previous = 0;
				bool havePrevious = false;
				for(int n = 0; n <= 6; n++) {
					p.beta = 0.05 * n;
					ahuResult r = AirHandler(p, in).solve();
					if(r.status != AHU_OK) {
						havePrevious = false;
						continue;
					}
					if(havePrevious) {
						EXPECT_LE(r.w[PT_ZONE], previous + 1e-12) << "thetaO " << in.thetaO
							<< " phiO " << in.phiO << " m " << p.m << " beta " << p.beta;
						compared++;
					}
					previous = r.w[PT_ZONE];
					havePrevious = true;
				}
			}
		}
	}
	EXPECT_GE(compared, 40);
}

TEST(AirHandler, HumidityControlHoldsSetpoint) {
	ahuParameters p = defaultParameters();
	p.Kw = std::numeric_limits<double>::infinity();
	AirHandler ahu(p, defaultInputs());
	ahuResult r = ahu.solve();

	ASSERT_EQ(r.status, AHU_OK);
	EXPECT_NEAR(r.w[PT_ZONE], ahu.humidityRatioSetpoint(), 1e-9);
	EXPECT_NEAR(r.theta[PT_ZONE], 24.0, 1e-3);
	EXPECT_GT(r.QsHC, 0);
	EXPECT_LT(r.theta[PT_BYPASS_MIX], r.theta[PT_SUPPLY]);
	EXPECT_NEAR(r.w[PT_BYPASS_MIX], r.w[PT_SUPPLY], 1e-12);
}

TEST(AirHandler, FiniteHumidityGainApproachesSetpoint) {
	ahuParameters p = defaultParameters();
	p.Kw = 1e10;
	AirHandler ahu(p, defaultInputs());
	ahuResult r = ahu.solve();

	ASSERT_EQ(r.status, AHU_OK);
	EXPECT_LT(std::abs(r.w[PT_ZONE] - ahu.humidityRatioSetpoint()), 1e-6);
	EXPECT_NEAR(r.theta[PT_ZONE], 24.0, 1e-3);
	EXPECT_GT(r.QsHC, 0);
	EXPECT_LE(r.QlCC, 0);
	// reheater row: Kw (wI - wISp) + QsHC = 0
	EXPECT_NEAR(r.QsHC, -p.Kw * (r.w[PT_ZONE] - ahu.humidityRatioSetpoint()), 1e-3 * r.QsHC);
}

TEST(AirHandler, DryOutdoorAirGivesDryCoil) {
	ahuInputs in = defaultInputs();
	in.phiO = 0.15;
	in.Qla = 0;
	const double betas[] = {0.0, 0.4};

	for(int i = 0; i < 2; i++) {
		ahuParameters p = defaultParameters();
		p.beta = betas[i];
		AirHandler ahu(p, in);
		ahuResult r = ahu.solve();

		ASSERT_EQ(r.status, AHU_OK) << "beta " << p.beta;
		EXPECT_TRUE(r.coilDry);
		EXPECT_LE(r.QlCC, 1e-6);
		EXPECT_NEAR(r.QlCC, 0, 1e-6);
		EXPECT_LE(r.QtCC, 0);
		EXPECT_NEAR(r.QsCC, -36000, 5);
		EXPECT_NEAR(r.w[PT_COIL], r.w[PT_MIX], 1e-12);
		EXPECT_LE(r.w[PT_COIL], saturationHumidityRatio(r.theta[PT_COIL]));
		// no latent load and no condensation, the zone reaches the outdoor humidity ratio
		EXPECT_NEAR(r.w[PT_ZONE], ahu.outdoorHumidityRatio(), 1e-9);
		EXPECT_NEAR(r.theta[PT_ZONE], 24.0, 1e-3);
	}
}

TEST(AirHandler, HumidOutdoorAirGivesWetCoil) {
	ahuResult r = AirHandler(defaultParameters(), defaultInputs()).solve();
	ASSERT_EQ(r.status, AHU_OK);
	EXPECT_FALSE(r.coilDry);
	EXPECT_LT(r.w[PT_COIL], r.w[PT_MIX]);
}

TEST(AirHandler, RejectsParametersOutsideDomain) {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	ahuParameters bad[8];
	for(int i = 0; i < 8; i++)
		bad[i] = defaultParameters();
	bad[0].beta = 1.2;
	bad[1].beta = -0.1;
	bad[2].m = 0;
	bad[3].mo = 4.0;
	bad[4].Ktheta = 0;
	bad[5].Kw = -1;
	bad[6].mo = -0.5;
	bad[7].m = nan;

	for(int i = 0; i < 8; i++) {
		ahuResult r = AirHandler(bad[i], defaultInputs()).solve();
		EXPECT_EQ(r.status, AHU_INVALID_PARAMETER) << "case " << i;
	}

	ahuInputs in = defaultInputs();
	in.phiO = 1.5;
	EXPECT_EQ(AirHandler(defaultParameters(), in).solve().status, AHU_INVALID_PARAMETER);
	in = defaultInputs();
	in.UA = -1;
	EXPECT_EQ(AirHandler(defaultParameters(), in).solve().status, AHU_INVALID_PARAMETER);
	in = defaultInputs();
	in.Qsa = std::numeric_limits<double>::infinity();
	EXPECT_EQ(AirHandler(defaultParameters(), in).solve().status, AHU_INVALID_PARAMETER);
}

TEST(AirHandler, DeepCoolingHitsCoilLimit) {
	ahuParameters p = defaultParameters();
	p.beta = 0.9;
	ahuResult r = AirHandler(p, defaultInputs()).solve();
	EXPECT_EQ(r.status, AHU_COIL_LIMIT);
}

TEST(AirHandler, TightConditionLimitReportsSingular) {
	solverOptions opt;
	opt.conditionLimit = 1;
	ahuResult r = AirHandler(defaultParameters(), defaultInputs(), opt).solve();
	EXPECT_EQ(r.status, AHU_SINGULAR);
}

TEST(AirHandler, SaturationIterationLimit) {
	solverOptions opt;
	opt.satIterations = 1;
	ahuResult r = AirHandler(defaultParameters(), defaultInputs(), opt).solve();
	EXPECT_EQ(r.status, AHU_NOT_CONVERGED);
	EXPECT_EQ(r.satIterations, 1);
}

TEST(AirHandler, ControllerRows) {
	double A[ArraySize][ArraySize];
	double b[ArraySize];

	AirHandler(defaultParameters(), defaultInputs()).assemble(10.0, A, b);
	EXPECT_EQ(A[14][X_THETA_I], 1e10);
	EXPECT_EQ(A[14][X_QT_CC], 1);
	EXPECT_EQ(b[14], 1e10 * 24.0);
	EXPECT_EQ(A[15][X_W_I], 0);
	EXPECT_EQ(A[15][X_QS_HC], 1);
	EXPECT_EQ(b[15], 0);

	ahuParameters p = defaultParameters();
	p.beta = 1;
	AirHandler(p, defaultInputs()).assemble(10.0, A, b);
	EXPECT_EQ(A[14][X_THETA_S], 1);
	EXPECT_EQ(A[14][X_THETA_I], 0);
	EXPECT_EQ(A[14][X_QT_CC], 0);
	EXPECT_EQ(b[14], 10.0);
}

TEST(AirHandler, DryCoilRow) {
	double A[ArraySize][ArraySize];
	double b[ArraySize];

	AirHandler ahu(defaultParameters(), defaultInputs());
	ahu.assemble(10.0, A, b);
	EXPECT_EQ(A[4][X_W_S], -1);
	EXPECT_EQ(A[4][X_THETA_S], saturationSlope(10.0));
	EXPECT_EQ(A[4][X_W_M], 0);

	ahu.assemble(10.0, A, b, true);
	EXPECT_EQ(A[4][X_W_S], 1);
	EXPECT_EQ(A[4][X_W_M], -1);
	EXPECT_EQ(A[4][X_THETA_S], 0);
	EXPECT_EQ(b[4], 0);
}

TEST(AirHandler, StatusNames) {
	EXPECT_STREQ(statusName(AHU_OK), "OK");
	EXPECT_STREQ(statusName(AHU_NOT_BRACKETED), "InfeasibleTarget");
	EXPECT_STREQ(statusName(AHU_COIL_LIMIT), "CoilLimit");
	EXPECT_STREQ(statusName(42), "Unknown");
}
