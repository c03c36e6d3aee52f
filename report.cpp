#include "report.h"
#include "psychro.h"
#include <iomanip>

using namespace std;

static const char* pointLabel[NUM_POINTS] = {"O", "M", "s", "C", "S", "I"};

/*
 * printResult - state points on the psychrometric chart and heat flows
 * @param out    - output stream
 * @param ahu    - AHU that produced the result
 * @param result - solved AHU
 */
void printResult(ostream& out, const AirHandler& ahu, const ahuResult& result) {
	const ahuParameters& p = ahu.parameters();
	ios::fmtflags flags = out.flags();
	streamsize precision = out.precision();

	out << fixed << setprecision(3);
	out << "m = " << p.m << " kg/s, mo = " << p.mo << " kg/s, beta = " << p.beta << endl;
	if(result.status != AHU_OK) {
		out << "No solution: " << statusName(result.status) << endl;
		out.flags(flags);
		out.precision(precision);
		return;
	}

	out << endl << setprecision(2);
	out << "Point\ttheta [C]\tw [g/kg]\tphi [%]\th [kJ/kg]" << endl;
	for(int i = 0; i < NUM_POINTS; i++) {
		double rh = relativeHumidity(result.theta[i], result.w[i], ahu.solver().pressure);
		double h = moistAirEnthalpy(result.theta[i], result.w[i]);
		out << pointLabel[i] << "\t" << result.theta[i] << "\t\t" << 1000 * result.w[i] << "\t\t" << 100 * rh
			<< "\t\t" << h / 1000 << endl;
	}

	out << endl;
	out << "QtCC\tQsCC\tQlCC\tQsHC\tQsTZ\tQlTZ [kW]" << endl;
	out << result.QtCC / 1000 << "\t" << result.QsCC / 1000 << "\t" << result.QlCC / 1000 << "\t";
	out << result.QsHC / 1000 << "\t" << result.QsTZ / 1000 << "\t" << result.QlTZ / 1000 << endl;
	out << endl;

	if(result.coilIdle) {
		out << "Cooling coil is idle, the indoor temperature is not controlled" << endl;
	} else if(result.coilDry) {
		out << setprecision(3);
		out << "Cooling coil is dry, outlet temperature is: " << result.theta[PT_COIL] << " C" << endl;
	} else {
		out << setprecision(3);
		out << "Apparatus dew point temperature is: " << result.theta[PT_COIL] << " C" << endl;
	}
	out << setprecision(2);
	out << "Total load on the cooling coil is: " << result.QtCC << " W" << endl;
	out << setprecision(3);
	out << "Air mass flow rate is: " << p.m << " kg/s" << endl;
	out << scientific << setprecision(2);
	out << "Condition number: " << result.condition << ", saturation iterations: " << result.satIterations << endl;

	out.flags(flags);
	out.precision(precision);
}

/*
 * printRootResult - outcome of the search for a design parameter
 */
void printRootResult(ostream& out, designParameter parameter, controlledOutput output, const rootResult& result) {
	ios::fmtflags flags = out.flags();
	streamsize precision = out.precision();
	const char* pname = parameterName(parameter);

	out << "Controlled output " << outputName(output) << ", design parameter " << pname << endl;
	out << setprecision(6);
	out << "Status: " << statusName(result.status) << " after " << result.iterations << " iterations, "
		<< result.evaluations << " AHU solves" << endl;
	out << "Search interval: " << pname << " = [" << result.lowerBound << ", " << result.upperBound << "]" << endl;
	if(result.admissible)
		out << "Output at interval ends: " << result.lowerOutput << ", " << result.upperOutput
			<< " (target " << result.target << ")" << endl;
	else
		out << "No admissible trial in the search interval (target " << result.target << ")" << endl;

	if(result.status == AHU_OK)
		out << pname << " = " << result.value << endl;
	else if(result.status == AHU_NOT_BRACKETED)
		out << "Target is outside of the achievable range, closest " << pname << " = " << result.value << endl;
	else if(result.status == AHU_NOT_CONVERGED)
		out << "Best trial (not converged) " << pname << " = " << result.value << endl;

	out.flags(flags);
	out.precision(precision);
}

void writeSummaryHeader(ostream& out) {
	out << "Scenario\tstatus\tm\tmo\tbeta";
	for(int i = 0; i < NUM_POINTS; i++)
		out << "\ttheta" << pointLabel[i] << "\tw" << pointLabel[i];
	out << "\tQtCC\tQsCC\tQlCC\tQsHC\tQsTZ\tQlTZ" << endl;
}

// One tab separated line per scenario
void writeSummary(ostream& out, const string& name, const ahuParameters& params, const ahuResult& result) {
	out << name << "\t" << statusName(result.status) << "\t" << params.m << "\t" << params.mo << "\t" << params.beta;
	for(int i = 0; i < NUM_POINTS; i++)
		out << "\t" << result.theta[i] << "\t" << result.w[i];
	out << "\t" << result.QtCC << "\t" << result.QsCC << "\t" << result.QlCC;
	out << "\t" << result.QsHC << "\t" << result.QsTZ << "\t" << result.QlTZ << endl;
}
