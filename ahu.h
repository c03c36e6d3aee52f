#pragma once
#ifndef ahu_h
#define ahu_h

#include "constants.h"

/*
	Air handling unit with recycled air, cooling coil with by-pass, reheater and one thermal zone.

	<=5=================================5=========<==================
	  mo      ||                        m                          ||
	          5 (m-mo) =======1=======                             ||
	          ||       ||    βm     ||                             ||
	θo,φo=0=>[MX1]==1==||          [MX2]==3=[HC]==4=F==>===[TZ]==5==||
	 mo             |  ||           ||                     //      |
	                |  ===1=[CC]==2===                     sl      |
	                |        \\ (1-β)m                     ||      |
	                |         sl                          [BL]<-mi |
	                |         |                                    |
	                |         -----------------------[Kθ]----------|<-θI
	                |--------------------------------[Kw]----------|<-φI

	Point 0 is outdoor air, 1 mixed air, 2 coil outlet (apparatus dew point), 3 mixed
	treated and by-passed air, 4 supply air, 5 zone air (also return air).
	A dry coil cools without condensing: point 2 keeps the humidity ratio of point 1.
*/

// Status codes returned by the solvers
enum ahuStatus {
	AHU_OK = 0,
	AHU_INVALID_PARAMETER = -1,	// parameter outside of its physical domain
	AHU_SINGULAR = -2,				// singular or ill-conditioned system
	AHU_COIL_LIMIT = -3,				// apparatus dew point below the allowed minimum
	AHU_NOT_BRACKETED = -4,			// target outside of the achievable range
	AHU_NOT_CONVERGED = -5			// iteration limit reached
};

const char* statusName(int status);

// State points
enum statePoint {
	PT_OUT = 0,
	PT_MIX = 1,
	PT_COIL = 2,
	PT_BYPASS_MIX = 3,
	PT_SUPPLY = 4,
	PT_ZONE = 5,
	NUM_POINTS = 6
};

// Position of the unknowns in the solution vector
enum unknownIndex {
	X_THETA_M = 0, X_W_M,		// mixed air
	X_THETA_S, X_W_S,				// coil outlet
	X_THETA_C, X_W_C,				// after by-pass mixing
	X_THETA_SUP, X_W_SUP,		// supply air
	X_THETA_I, X_W_I,				// zone air
	X_QT_CC, X_QS_CC, X_QL_CC,	// cooling coil total, sensible and latent heat (W)
	X_QS_HC,							// reheater sensible heat (W)
	X_QS_TZ, X_QL_TZ				// zone sensible and latent load (W)
};

struct ahuParameters {
	double m;			// supply dry air mass flow rate (kg/s)
	double mo;			// outdoor air mass flow rate (kg/s)
	double beta;		// coil by-pass fraction (0-1)
	double Ktheta;		// indoor temperature controller gain (W/K), infinity for an exact setpoint
	double Kw;			// indoor humidity controller gain (W/(kg/kg)), 0 switches the reheater off
};

struct ahuInputs {
	double thetaO;		// outdoor temperature (deg C)
	double phiO;		// outdoor relative humidity (0-1)
	double thetaISp;	// indoor temperature setpoint (deg C)
	double phiISp;		// indoor relative humidity setpoint (0-1)
	double mi;			// infiltration mass flow rate (kg/s)
	double UA;			// building overall heat transfer coefficient (W/K)
	double Qsa;			// auxiliary sensible load (W)
	double Qla;			// auxiliary latent load (W)
};

struct solverOptions {
	double conditionLimit;		// largest condition number accepted by the linear solver
	double minDewPoint;			// lowest apparatus dew point the coil can reach (deg C)
	double satTolerance;			// convergence of the coil outlet onto the saturation curve (kg/kg)
	int satIterations;			// maximum number of saturation point iterations
	double tempSatInit;			// first linearization point of the saturation curve (deg C)
	double pressure;				// atmospheric pressure (Pa)

	solverOptions();
};

struct ahuResult {
	int status;
	double theta[NUM_POINTS];	// dry-bulb temperature (deg C)
	double w[NUM_POINTS];		// humidity ratio (kg/kg)
	double QtCC, QsCC, QlCC;	// cooling coil heat flows (W), negative for cooling
	double QsHC;					// reheater heat flow (W)
	double QsTZ, QlTZ;			// zone loads (W)
	double mOut;					// outdoor air flow (kg/s)
	double mRecycle;				// recycled air flow (kg/s)
	double mBypass;				// air flow around the coil (kg/s)
	double mCoil;					// air flow through the coil (kg/s)
	double condition;				// condition number of the last linear solve
	int satIterations;			// saturation point iterations used
	bool coilIdle;					// no air through the coil, zone temperature floats
	bool coilDry;					// coil surface above the dew point of the entering air, no condensation
	double x[ArraySize];			// raw solution vector

	ahuResult();
};

class AirHandler {
	private:
		ahuParameters params;
		ahuInputs inputs;
		solverOptions options;
		double wOut;		// outdoor humidity ratio
		double wISp;		// indoor humidity ratio setpoint

		ahuResult solveDry(double tempSat, int iterations) const;

	public:
		AirHandler(const ahuParameters& parameters, const ahuInputs& inputs, const solverOptions& options=solverOptions());

		int validate() const;
		bool coilIdle() const;
		void assemble(double tempSat, double A[][ArraySize], double* b, bool dryCoil=false) const;
		ahuResult solveLinear(double tempSat, bool dryCoil=false) const;
		ahuResult solve() const;
		AirHandler withParameters(const ahuParameters& parameters) const;

		const ahuParameters& parameters() const { return params; }
		const ahuInputs& scenario() const { return inputs; }
		const solverOptions& solver() const { return options; }
		double outdoorHumidityRatio() const { return wOut; }
		double humidityRatioSetpoint() const { return wISp; }
};

#endif
