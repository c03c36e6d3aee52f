#pragma once
#ifndef scenario_h
#define scenario_h

#include <ostream>
#include "paramfile.h"
#include "ahu.h"
#include "rootfind.h"

ahuParameters readParameters(const ParamFile& file);
ahuInputs readInputs(const ParamFile& file);
solverOptions readSolverOptions(const ParamFile& file);
rootOptions readRootOptions(const ParamFile& file);
controlledOutput readOutput(const ParamFile& file);
int runScenario(const ParamFile& file, std::ostream& out);

#endif
