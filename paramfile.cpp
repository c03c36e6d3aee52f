#include "paramfile.h"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cerrno>
#include <cctype>

using namespace std;

static string trim(const string& s) {
	size_t first = s.find_first_not_of(" \t\r\n");
	if(first == string::npos)
		return "";
	size_t last = s.find_last_not_of(" \t\r\n");
	return s.substr(first, last - first + 1);
}

static string lineError(const string& fileName, int lineNum, const string& message) {
	ostringstream err;
	err << fileName << ", line " << lineNum << ": " << message;
	return err.str();
}

/*
 * ParamFile - read a parameter file
 * @param fileName - name of the file
 */
ParamFile::ParamFile(const string& name) : fileName(name) {
	ifstream file(fileName.c_str());
	if(!file) {
		throw "Cannot open parameter file: " + fileName;
	}
	read(file);
}

ParamFile::ParamFile(istream& in, const string& sourceName) : fileName(sourceName) {
	read(in);
}

void ParamFile::read(istream& in) {
	string line;
	int lineNum = 0;

	while(getline(in, line)) {
		lineNum++;
		size_t comment = line.find('#');
		if(comment != string::npos)
			line.erase(comment);
		line = trim(line);
		if(line.empty())
			continue;

		size_t eq = line.find('=');
		if(eq == string::npos)
			throw lineError(fileName, lineNum, "expected name = value, found >>" + line + "<<");
		string key = trim(line.substr(0, eq));
		if(key.empty())
			throw lineError(fileName, lineNum, "missing parameter name");

		values[key] = expand(trim(line.substr(eq + 1)), lineNum);	// last definition wins
	}
}

// Replace ${NAME} by the value of the environment variable NAME (empty if not set)
string ParamFile::expand(const string& value, int lineNum) const {
	string result;
	size_t pos = 0;

	while(pos < value.size()) {
		size_t start = value.find("${", pos);
		if(start == string::npos) {
			result += value.substr(pos);
			break;
		}
		size_t end = value.find('}', start + 2);
		if(end == string::npos)
			throw lineError(fileName, lineNum, "unterminated ${ in >>" + value + "<<");

		result += value.substr(pos, start - pos);
		string var = value.substr(start + 2, end - start - 2);
		const char* env = getenv(var.c_str());
		if(env != NULL)
			result += env;
		pos = end + 1;
	}
	return result;
}

bool ParamFile::has(const string& name) const {
	return values.find(name) != values.end();
}

const string& ParamFile::lookup(const string& name) const {
	map<string, string>::const_iterator it = values.find(name);
	if(it == values.end())
		throw fileName + ": missing parameter " + name;
	return it->second;
}

string ParamFile::pString(const string& name) const {
	return lookup(name);
}

string ParamFile::pString(const string& name, const string& defaultValue) const {
	return has(name) ? lookup(name) : defaultValue;
}

double ParamFile::pDouble(const string& name) const {
	const string& text = lookup(name);
	char* end;
	errno = 0;
	double value = strtod(text.c_str(), &end);
	if(text.empty() || *end != '\0' || errno == ERANGE)
		throw fileName + ": parameter " + name + " is not a number: " + text;
	return value;
}

double ParamFile::pDouble(const string& name, double defaultValue) const {
	return has(name) ? pDouble(name) : defaultValue;
}

int ParamFile::pInt(const string& name) const {
	const string& text = lookup(name);
	char* end;
	errno = 0;
	long value = strtol(text.c_str(), &end, 10);
	if(text.empty() || *end != '\0' || errno == ERANGE || value != (int)value)
		throw fileName + ": parameter " + name + " is not an integer: " + text;
	return (int)value;
}

int ParamFile::pInt(const string& name, int defaultValue) const {
	return has(name) ? pInt(name) : defaultValue;
}

bool ParamFile::pBool(const string& name) const {
	string text = lookup(name);
	for(size_t i = 0; i < text.size(); i++)
		text[i] = (char)tolower((unsigned char)text[i]);

	if(text == "true" || text == "yes" || text == "1")
		return true;
	if(text == "false" || text == "no" || text == "0")
		return false;
	throw fileName + ": parameter " + name + " is not a boolean: " + lookup(name);
}

bool ParamFile::pBool(const string& name, bool defaultValue) const {
	return has(name) ? pBool(name) : defaultValue;
}
