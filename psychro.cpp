#include "constants.h"
#include "psychro.h"
#include <cmath>

using namespace std;

//Coefficients for saturation vapor pressure over ice -100 to 0C. ASHRAE HoF.
static const double C1 = -5.6745359E+03;
static const double C2 = 6.3925247E+00;
static const double C3 = -9.6778430E-03;
static const double C4 = 6.2215701E-07;
static const double C5 = 2.0747825E-09;
static const double C6 = -9.4840240E-13;
static const double C7 = 4.1635019E+00;

//Coefficients for saturation vapor pressure over liquid water 0 to 200C. ASHRAE HoF.
static const double C8 = -5.8002206E+03;
static const double C9 = 1.3914993E+00;
static const double C10 = -4.8640239E-02;
static const double C11 = 4.1764768E-05;
static const double C12 = -1.4452093E-08;
static const double C13 = 6.5459673E+00;

/*
 * saturationVaporPressure - Equations 5 and 6 in 2009 ASHRAE HoF 1.2
 * @param temp - temperature (deg K)
 * @return saturation vapor pressure (Pa)
 */
double saturationVaporPressure(double temp) {
	if(temp <= C_TO_K){
		return exp((C1/temp)+(C2)+(C3*temp)+(C4*pow(temp, 2))+(C5*pow(temp, 3))+(C6*pow(temp, 4))+(C7*log(temp)));
	} else{
		return exp((C8/temp)+(C9)+(C10*temp)+(C11*pow(temp, 2))+(C12*pow(temp, 3))+(C13*log(temp)));
	}
}

/*
 * saturationVaporPressureSlope - derivative of saturationVaporPressure with temperature
 * @param temp - temperature (deg K)
 * @return dPws/dT (Pa/K)
 */
double saturationVaporPressureSlope(double temp) {
	double dLnP;	// d(ln Pws)/dT

	if(temp <= C_TO_K){
		dLnP = -C1/pow(temp, 2) + C3 + 2*C4*temp + 3*C5*pow(temp, 2) + 4*C6*pow(temp, 3) + C7/temp;
	} else{
		dLnP = -C8/pow(temp, 2) + C10 + 2*C11*temp + 3*C12*pow(temp, 2) + C13/temp;
	}
	return saturationVaporPressure(temp) * dLnP;
}

// Humidity ratio from partial pressure of water vapor (Pa) and total pressure (Pa)
double calcHumidityRatio(double pw, double pressure) {
	return MW_RATIO * pw / (pressure - pw);
}

/*
 * humidityRatio - humidity ratio of moist air
 * @param temp - dry-bulb temperature (deg C)
 * @param rh - relative humidity (fraction)
 * @param pressure - atmospheric pressure (Pa)
 * @return humidity ratio (kg/kg)
 */
double humidityRatio(double temp, double rh, double pressure) {
	return calcHumidityRatio(rh * saturationVaporPressure(temp + C_TO_K), pressure);
}

double saturationHumidityRatio(double temp, double pressure) {
	return humidityRatio(temp, 1.0, pressure);
}

/*
 * saturationSlope - slope of the saturation curve on the psychrometric chart
 * @param temp - temperature (deg C)
 * @param pressure - atmospheric pressure (Pa)
 * @return dWs/dT (kg/kg K)
 */
double saturationSlope(double temp, double pressure) {
	double pws = saturationVaporPressure(temp + C_TO_K);
	return MW_RATIO * pressure / pow(pressure - pws, 2) * saturationVaporPressureSlope(temp + C_TO_K);
}

/*
 * relativeHumidity - relative humidity from temperature and humidity ratio
 * @param temp - dry-bulb temperature (deg C)
 * @param hr - humidity ratio (kg/kg)
 * @param pressure - atmospheric pressure (Pa)
 * @return relative humidity (fraction)
 */
double relativeHumidity(double temp, double hr, double pressure) {
	double pw = pressure * hr / (MW_RATIO + hr);
	return pw / saturationVaporPressure(temp + C_TO_K);
}

// Specific enthalpy of moist air per kg dry air (J/kg), 0 at 0 deg C dry air
double moistAirEnthalpy(double temp, double hr) {
	return CpAir * temp + hr * (hfgWater + CpVapor * temp);
}
