#pragma once
#ifndef constant_h
#define constant_h

// ============================== CONSTANTS ===============================================
const double C_TO_K = 273.15;
const double CpAir = 1000.;					// specific heat of dry air [J/kg K]
const double hfgWater = 2496e3;				// latent heat of vaporization [J/kg]
const double pressureStd = 101325.;			// standard atmospheric pressure [Pa]
const double MW_RATIO = 0.621945;			// ratio of molecular weights of water vapor and dry air
const double CpVapor = 1860.;				// specific heat of water vapor [J/kg K]
const int ArraySize = 16;					// number of unknowns in the AHU system

const double massFlowMax = 100.;			// upper bound for supply air mass flow [kg/s]
const double tempSatGuess = 5.;				// initial guess of coil saturation temperature [deg C]

#endif
