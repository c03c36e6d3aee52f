#include <iostream>
#include <fstream>
#include <string>
#include <time.h>
#include "ahu.h"
#include "paramfile.h"
#include "scenario.h"

using namespace std;

/*
Steady-state air handling unit solver

The batch file lists scenario files, one per name. Each scenario file holds
"name = value" lines:
	problem		direct, bypass (find beta) or massflow (find m)
	output		wI, phiI or thetaS, the controlled output for bypass and massflow
	target		value of the controlled output (kg/kg, 0-1 or deg C)
	m, mo, beta, Ktheta, Kw
	thetaO, phiO, thetaISp, phiISp, mi, UA, Qsa, Qla
	conditionLimit, minDewPoint, satTolerance, satIterations, tempSatInit, pressure
	tolerance, maxIterations, massFlowMax, scanPoints
	outputFile	optional tab separated summary
*/

int main(int argc, char *argv[])
{
	// Read in batch file name from command line
	string batchFileName = "";
	if ( (argc <= 1) || (argv[argc-1] == NULL) || (argv[argc-1][0] == '-') ) {
		cerr << "usage: " << argv[0] << " batch_file" << endl;
		return(1);
	}
	else {
		batchFileName = argv[argc-1];
	}

	ifstream batchFile(batchFileName.c_str());
	if(!batchFile) {
		cout << "Cannot open batch file: " << batchFileName << endl;
		return 1;
	}

	time_t startTime, endTime;
	time(&startTime);
	string runStartTime = ctime(&startTime);

	int simNum = 0;
	int failures = 0;
	string scenarioFileName = "";

	cout << "AHU steady-state solver" << endl;

	// Main loop on each scenario file
	while(batchFile >> scenarioFileName) {
		simNum++;
		cout << endl;
		cout << "Simulation: " << simNum << endl;
		cout << "Batch File:\t " << batchFileName << endl;
		cout << "Scenario File:\t " << scenarioFileName << endl;
		cout << endl;

		try {
			ParamFile scenario(scenarioFileName);
			int status = runScenario(scenario, cout);
			if(status != AHU_OK)
				failures++;
		}
		catch(const string& message) {
			cout << "Error in scenario " << scenarioFileName << ": " << message << endl;
			failures++;
		}
	}
	batchFile.close();

	time(&endTime);
	string runEndTime = ctime(&endTime);

	cout << endl << simNum << " scenarios, " << failures << " without solution" << endl;
	cout << "\nStart of simulations\t= " << runStartTime;
	cout << "End of simulations\t= " << runEndTime << endl;

	return 0;
}
