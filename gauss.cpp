#include "gauss.h"
#include <cmath>

using namespace std;

/*
 * matlu - scale A and factor it in place with complete pivoting
 * @param sys - receives the scale factors, LU factors and pivot order
 * @param A   - coefficient matrix (not modified)
 * @return GAUSS_OK or GAUSS_SINGULAR
 *
 * Rows and columns are not actually switched, only the order in which they are used.
 */
int matlu(luSystem& sys, const double A[][ArraySize]) {
	int r, c, rp, cp;
	int bestrow = 0;
	int bestcol = 0;
	int tempswap;
	double max;
	double temp;
	double firstmax = 0;

	// row scaling, a zero row means the matrix is singular
	for(int row = 0; row < ArraySize; row++) {
		sys.rpvt[row] = row;
		sys.cpvt[row] = row;
		max = 0;
		for(int col = 0; col < ArraySize; col++) {
			if(!std::isfinite(A[row][col]))
				return GAUSS_SINGULAR;
			if(abs(A[row][col]) > max)
				max = abs(A[row][col]);
		}
		if(max == 0)
			return GAUSS_SINGULAR;
		sys.rowScale[row] = 1 / max;
	}

	// column scaling of the row-scaled matrix
	for(int col = 0; col < ArraySize; col++) {
		max = 0;
		for(int row = 0; row < ArraySize; row++) {
			temp = abs(A[row][col]) * sys.rowScale[row];
			if(temp > max)
				max = temp;
		}
		if(max == 0)
			return GAUSS_SINGULAR;
		sys.colScale[col] = 1 / max;
	}

	sys.norm1 = 0;
	for(int col = 0; col < ArraySize; col++) {
		double colsum = 0;
		for(int row = 0; row < ArraySize; row++) {
			sys.LU[row][col] = A[row][col] * sys.rowScale[row] * sys.colScale[col];
			colsum += abs(sys.LU[row][col]);
		}
		if(colsum > sys.norm1)
			sys.norm1 = colsum;
	}

	for(int pvt = 0; pvt < ArraySize; pvt++) {
		// Find best available pivot among rows and columns not already used for pivoting
		max = 0;
		for(int row = pvt; row < ArraySize; row++) {
			r = sys.rpvt[row];
			for(int col = pvt; col < ArraySize; col++) {
				c = sys.cpvt[col];
				temp = abs(sys.LU[r][c]);
				if(temp > max) {
					max = temp;
					bestrow = row;
					bestcol = col;
				}
			}
		}

		if(pvt == 0)
			firstmax = max;
		// no nonzero pivot left, or the drop in pivots is too much
		if(max == 0 || max < pivotDrop * firstmax)
			return GAUSS_SINGULAR;

		if(bestrow != pvt) {
			tempswap = sys.rpvt[pvt];
			sys.rpvt[pvt] = sys.rpvt[bestrow];
			sys.rpvt[bestrow] = tempswap;
		}
		if(bestcol != pvt) {
			tempswap = sys.cpvt[pvt];
			sys.cpvt[pvt] = sys.cpvt[bestcol];
			sys.cpvt[bestcol] = tempswap;
		}

		//Eliminate all values below the pivot
		rp = sys.rpvt[pvt];
		cp = sys.cpvt[pvt];
		for(int row = pvt + 1; row < ArraySize; row++) {
			r = sys.rpvt[row];
			sys.LU[r][cp] = -sys.LU[r][cp] / sys.LU[rp][cp];		// save multipliers
			for(int col = pvt + 1; col < ArraySize; col++) {
				c = sys.cpvt[col];
				sys.LU[r][c] += sys.LU[r][cp] * sys.LU[rp][c];
			}
		}
	}

	return GAUSS_OK;
}

/*
 * matbs - solve the scaled system with the factors from matlu
 * @param sys - factored system
 * @param b   - right hand side in scaled form (not modified)
 * @param x   - scaled solution
 */
void matbs(const luSystem& sys, const double* b, double* x) {
	double lb[ArraySize];
	int c, r;

	for(int i = 0; i < ArraySize; i++)
		lb[i] = b[i];

	// do row operations on b using the multipliers in L to find Lb
	for(int pvt = 0; pvt < ArraySize - 1; pvt++) {
		c = sys.cpvt[pvt];
		for(int row = pvt + 1; row < ArraySize; row++) {
			r = sys.rpvt[row];
			lb[r] += sys.LU[r][c] * lb[sys.rpvt[pvt]];
		}
	}

	// backsolve Ux=Lb to find x
	for(int row = ArraySize - 1; row >= 0; row--) {
		c = sys.cpvt[row];
		r = sys.rpvt[row];
		x[c] = lb[r];
		for(int col = row + 1; col < ArraySize; col++) {
			x[c] -= sys.LU[r][sys.cpvt[col]] * x[sys.cpvt[col]];
		}
		x[c] /= sys.LU[r][c];
	}
}

/*
 * conditionNumber - 1-norm condition number of the scaled matrix
 * The inverse is built column by column from the factors.
 */
double conditionNumber(const luSystem& sys) {
	double e[ArraySize];
	double col[ArraySize];
	double invNorm = 0;

	for(int j = 0; j < ArraySize; j++) {
		for(int i = 0; i < ArraySize; i++)
			e[i] = (i == j) ? 1 : 0;
		matbs(sys, e, col);

		double colsum = 0;
		for(int i = 0; i < ArraySize; i++)
			colsum += abs(col[i]);
		if(colsum > invNorm)
			invNorm = colsum;
	}
	return sys.norm1 * invNorm;
}

/*
 * solveSystem - solve A x = b
 * @param A             - coefficient matrix
 * @param b             - right hand side
 * @param x             - solution
 * @param conditionLimit - largest condition number accepted
 * @param condition     - condition number of the scaled matrix (0 if singular)
 * @return GAUSS_OK, GAUSS_SINGULAR or GAUSS_ILL_CONDITIONED
 */
int solveSystem(const double A[][ArraySize], const double* b, double* x, double conditionLimit, double& condition) {
	luSystem sys;
	double sb[ArraySize];
	double y[ArraySize];

	condition = 0;
	int errcode = matlu(sys, A);
	if(errcode != GAUSS_OK)
		return errcode;

	condition = conditionNumber(sys);
	if(!std::isfinite(condition) || condition > conditionLimit)
		return GAUSS_ILL_CONDITIONED;

	for(int i = 0; i < ArraySize; i++)
		sb[i] = b[i] * sys.rowScale[i];
	matbs(sys, sb, y);
	for(int i = 0; i < ArraySize; i++)
		x[i] = y[i] * sys.colScale[i];

	return GAUSS_OK;
}
