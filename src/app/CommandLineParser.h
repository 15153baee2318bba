/*
CommandLineParser.h

Small in-house command line parser.
- Option prefixes '/', '-' and '--'
- Switches (flags) and key/value options (name=value or name value)
- Case-insensitive option names with aliases
- Help text generated from the same specification that drives parsing
*/
#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>

class CommandLineParser
{
public:
	// Option specification used for parsing and help generation
	struct OptionSpec {
		std::string canonicalName; // lower-case canonical key (e.g. "input")
		std::vector<std::string> aliases; // lower-case, canonical name included
		bool takesValue = false;
		bool optionalValue = false; // if present without a value, use implicitValue
		std::string valueName; // e.g. "FILE", "N"
		std::string defaultValue;
		std::string implicitValue;
		std::string help;
		std::string group; // section in help
	};

	CommandLineParser();

	// Specification API. Throws std::runtime_error on alias collisions.
	void addFlag(const std::string &canonicalName,
			  const std::vector<std::string> &aliases,
			  const std::string &help,
			  const std::string &group);

	void addOption(const std::string &canonicalName,
			   const std::vector<std::string> &aliases,
			   const std::string &valueName,
			   const std::string &defaultValue,
			   const std::string &help,
			   const std::string &group,
			   bool optionalValue = false,
			   const std::string &implicitValue = "");

	// Parsing API
	void parse(int argc, char *argv[]);
	void parseTokens(const std::vector<std::string>& tokens);

	// Query API (case-insensitive names, aliases resolved)
	bool switchExists(const std::string &name) const; // flag present or value provided
	bool valueProvided(const std::string &name) const;
	std::string getValue(const std::string &name, const std::string &defaultValue) const;
	const std::vector<std::string>& getPositionalArguments() const { return positional; }

	// Normalized "/name=value" form of what was parsed, for logs and output headers
	std::string rebuildCommandLine() const;

	// Help/usage
	std::string formatHelp(const std::string &appName) const;

	// Diagnostics
	const std::vector<std::string>& getUnrecognized() const { return unrecognized; }
	const std::vector<std::string>& getMissingValueOptions() const { return missingValueOptions; }
	std::vector<std::string> allOptionNames() const;

private:
	static std::string toLower(const std::string &s);
	void registerSpec(OptionSpec spec);
	const OptionSpec* findSpec(const std::string &lowerKey) const;
	std::string canonicalOf(const std::string &name) const; // canonical name, or lower-cased input if unknown
	static bool isPrefixed(const std::string &token);

	std::vector<OptionSpec> optionSpecs;
	std::unordered_map<std::string, size_t> aliasToIndex;

	std::unordered_map<std::string, std::string> values; // canonicalName -> value
	std::unordered_set<std::string> flags;
	std::vector<std::string> positional;
	std::vector<std::string> unrecognized;
	std::vector<std::string> missingValueOptions;
};
