#pragma once
#ifndef psychro_h
#define psychro_h

#include "constants.h"

// Temperatures are in deg C except for saturationVaporPressure (deg K).
// Relative humidity is a fraction (0-1).

double saturationVaporPressure(double temp);
double saturationVaporPressureSlope(double temp);
double calcHumidityRatio(double pw, double pressure);
double humidityRatio(double temp, double rh, double pressure=pressureStd);
double saturationHumidityRatio(double temp, double pressure=pressureStd);
double saturationSlope(double temp, double pressure=pressureStd);
double relativeHumidity(double temp, double hr, double pressure=pressureStd);
double moistAirEnthalpy(double temp, double hr);

#endif
