#pragma once
#ifndef report_h
#define report_h

#include <ostream>
#include <string>
#include "ahu.h"
#include "rootfind.h"

void printResult(std::ostream& out, const AirHandler& ahu, const ahuResult& result);
void printRootResult(std::ostream& out, designParameter parameter, controlledOutput output, const rootResult& result);
void writeSummaryHeader(std::ostream& out);
void writeSummary(std::ostream& out, const std::string& name, const ahuParameters& params, const ahuResult& result);

#endif
