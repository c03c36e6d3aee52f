#include "scenario.h"
#include "report.h"
#include <fstream>

using namespace std;

// Values used when a scenario file leaves a parameter out
static const ahuParameters defaultParameters = {3.5, 1.0, 0.1, 1e10, 0.0};
static const ahuInputs defaultInputs = {32.0, 0.5, 24.0, 0.6, 0.7, 675.0, 17000.0, 2000.0};

ahuParameters readParameters(const ParamFile& file) {
	ahuParameters p;
	p.m = file.pDouble("m", defaultParameters.m);
	p.mo = file.pDouble("mo", defaultParameters.mo);
	p.beta = file.pDouble("beta", defaultParameters.beta);
	p.Ktheta = file.pDouble("Ktheta", defaultParameters.Ktheta);
	p.Kw = file.pDouble("Kw", defaultParameters.Kw);
	return p;
}

ahuInputs readInputs(const ParamFile& file) {
	ahuInputs in;
	in.thetaO = file.pDouble("thetaO", defaultInputs.thetaO);
	in.phiO = file.pDouble("phiO", defaultInputs.phiO);
	in.thetaISp = file.pDouble("thetaISp", defaultInputs.thetaISp);
	in.phiISp = file.pDouble("phiISp", defaultInputs.phiISp);
	in.mi = file.pDouble("mi", defaultInputs.mi);
	in.UA = file.pDouble("UA", defaultInputs.UA);
	in.Qsa = file.pDouble("Qsa", defaultInputs.Qsa);
	in.Qla = file.pDouble("Qla", defaultInputs.Qla);
	return in;
}

solverOptions readSolverOptions(const ParamFile& file) {
	solverOptions opt;
	opt.conditionLimit = file.pDouble("conditionLimit", opt.conditionLimit);
	opt.minDewPoint = file.pDouble("minDewPoint", opt.minDewPoint);
	opt.satTolerance = file.pDouble("satTolerance", opt.satTolerance);
	opt.satIterations = file.pInt("satIterations", opt.satIterations);
	opt.tempSatInit = file.pDouble("tempSatInit", opt.tempSatInit);
	opt.pressure = file.pDouble("pressure", opt.pressure);
	return opt;
}

rootOptions readRootOptions(const ParamFile& file) {
	rootOptions opt;
	opt.tolerance = file.pDouble("tolerance", opt.tolerance);
	opt.maxIterations = file.pInt("maxIterations", opt.maxIterations);
	opt.massFlowMax = file.pDouble("massFlowMax", opt.massFlowMax);
	opt.scanPoints = file.pInt("scanPoints", opt.scanPoints);
	return opt;
}

controlledOutput readOutput(const ParamFile& file) {
	string name = file.pString("output", "wI");
	if(name == "wI")
		return ZONE_HUMIDITY_RATIO;
	if(name == "phiI")
		return ZONE_RELATIVE_HUMIDITY;
	if(name == "thetaS")
		return SUPPLY_TEMPERATURE;
	throw file.name() + ": unknown output " + name + " (wI, phiI or thetaS)";
}

/*
 * runScenario - solve one scenario and report it
 * @param file - scenario parameters
 * @param out  - report stream
 * @return AHU status of the scenario
 *
 * problem = direct solves with every parameter fixed, bypass finds beta and
 * massflow finds m so that the controlled output reaches the target.
 */
int runScenario(const ParamFile& file, ostream& out) {
	string problem = file.pString("problem", "direct");
	AirHandler ahu(readParameters(file), readInputs(file), readSolverOptions(file));
	AirHandler solved = ahu;
	ahuResult state;
	int status;

	if(problem == "direct") {
		state = ahu.solve();
		status = state.status;
	} else {
		designParameter parameter;
		if(problem == "bypass")
			parameter = BYPASS_FRACTION;
		else if(problem == "massflow")
			parameter = SUPPLY_MASS_FLOW;
		else
			throw file.name() + ": unknown problem " + problem + " (direct, bypass or massflow)";

		controlledOutput output = readOutput(file);
		ParametricSolver solver(ahu, parameter, output, readRootOptions(file));
		rootResult root = solver.solve(file.pDouble("target"));
		printRootResult(out, parameter, output, root);
		out << endl;

		status = root.status;
		state = root.state;
		if(root.status == AHU_INVALID_PARAMETER)
			state.status = AHU_INVALID_PARAMETER;
		else
			solved = solver.trial(root.value);
	}

	printResult(out, solved, state);

	if(file.has("outputFile")) {
		string outputFileName = file.pString("outputFile");
		ofstream summaryFile(outputFileName.c_str());
		if(!summaryFile)
			throw "Cannot open output file: " + outputFileName;
		writeSummaryHeader(summaryFile);
		writeSummary(summaryFile, file.name(), solved.parameters(), state);
	}

	return status;
}
