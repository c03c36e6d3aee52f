#pragma once
#ifndef gauss_h
#define gauss_h

#include "constants.h"

/*
===================================================================
In theory, a matrix can be exactly singular.  Numerically, exact singularity is a rare occurrence because
round off error turns exact zeroes into very small numbers. This data corruption makes it necessary to set
a criterion to determine how small a number has to be before we flag it as zero and call the matrix singular.

Rows and columns are scaled to unit maximum before factoring, so the stiff controller rows (gains of 1e10)
and the latent rows (m * hfg ~ 1e7) do not swamp the pivot search. pivotDrop sets the maximum drop allowed
in pivot values relative to the first pivot. The condition number of the scaled matrix is checked against
a limit supplied by the caller.
===================================================================
*/

const double pivotDrop = 1e-13;
const double conditionLimitDefault = 1e12;

// Error codes returned
const int GAUSS_OK = 0;
const int GAUSS_SINGULAR = -1;			// zero row, zero column or pivot drop too large
const int GAUSS_ILL_CONDITIONED = -2;	// condition number above limit

struct luSystem {
	double LU[ArraySize][ArraySize];	// scaled matrix, then its LU factors (negative multipliers below pivots)
	double rowScale[ArraySize];
	double colScale[ArraySize];
	int rpvt[ArraySize];					// row pivot order
	int cpvt[ArraySize];					// column pivot order
	double norm1;							// 1-norm of the scaled matrix
};

int matlu(luSystem& sys, const double A[][ArraySize]);
void matbs(const luSystem& sys, const double* b, double* x);
double conditionNumber(const luSystem& sys);
int solveSystem(const double A[][ArraySize], const double* b, double* x, double conditionLimit, double& condition);

#endif
