#pragma once
#ifndef paramfile_h
#define paramfile_h

#include <istream>
#include <map>
#include <string>

/*
 * ParamFile - scenario parameters read from a text file
 *
 * One "name = value" pair per line, '#' starts a comment. ${NAME} in a value is
 * replaced by the environment variable NAME. Errors are thrown as a string message.
 */
class ParamFile {
	private:
		std::string fileName;
		std::map<std::string, std::string> values;

		void read(std::istream& in);
		std::string expand(const std::string& value, int lineNum) const;
		const std::string& lookup(const std::string& name) const;

	public:
		explicit ParamFile(const std::string& fileName);
		ParamFile(std::istream& in, const std::string& sourceName);

		bool has(const std::string& name) const;
		std::string pString(const std::string& name) const;
		std::string pString(const std::string& name, const std::string& defaultValue) const;
		double pDouble(const std::string& name) const;
		double pDouble(const std::string& name, double defaultValue) const;
		int pInt(const std::string& name) const;
		int pInt(const std::string& name, int defaultValue) const;
		bool pBool(const std::string& name) const;
		bool pBool(const std::string& name, bool defaultValue) const;
		const std::string& name() const { return fileName; }
};

#endif
