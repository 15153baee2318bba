/*
CommandLineParser.cpp

Options start with '/', '-' or '--'. A value follows either after '=' or as the
next token; a negative number is accepted as a value even though it starts with '-'.
Tokens such as "/home/user/pic.png" are paths, not options.
*/

#include "CommandLineParser.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

static bool isSignedNumberToken(const std::string &s) {
	if (s.empty()) return false;
	size_t i = 0;
	if (s[i] == '-' || s[i] == '+') ++i;
	bool anyDigit = false;
	for (; i < s.size(); ++i) {
		unsigned char c = (unsigned char)s[i];
		if (std::isdigit(c)) { anyDigit = true; continue; }
		if (c == '.') continue;
		return false;
	}
	return anyDigit;
}

// "/dir/file" but not "/output=/dir/file"
static bool looksLikePath(const std::string &s) {
	if (s.empty() || s[0] != '/') return false;
	size_t slash = s.find('/', 1);
	return slash != std::string::npos && slash < s.find('=');
}

static std::string stripQuotes(const std::string &s) {
	if (s.size() >= 2) {
		char b = s.front();
		char e = s.back();
		if ((b == '"' && e == '"') || (b == '\'' && e == '\''))
			return s.substr(1, s.size() - 2);
	}
	return s;
}

static std::string quoteIfNeeded(const std::string& token) {
	bool needsQuote = token.empty();
	for (char c : token) {
		if (std::isspace(static_cast<unsigned char>(c)) || c == '"') {
			needsQuote = true;
			break;
		}
	}
	if (!needsQuote)
		return token;
	std::string out = "\"";
	for (char c : token) {
		if (c == '"') out.push_back('\\');
		out.push_back(c);
	}
	out.push_back('"');
	return out;
}

std::string CommandLineParser::toLower(const std::string &s) {
	std::string r = s;
	std::transform(r.begin(), r.end(), r.begin(), [](unsigned char c){ return (char)tolower(c); });
	return r;
}

CommandLineParser::CommandLineParser() {}

void CommandLineParser::registerSpec(OptionSpec spec)
{
	spec.canonicalName = toLower(spec.canonicalName);
	std::vector<std::string> keys;
	keys.push_back(spec.canonicalName);
	for (const auto &a : spec.aliases) keys.push_back(toLower(a));
	spec.aliases = keys;

	for (const auto &k : spec.aliases) {
		auto it = aliasToIndex.find(k);
		if (it != aliasToIndex.end()) {
			throw std::runtime_error("CommandLineParser: option alias '" + k +
				"' conflicts with existing option '" + optionSpecs[it->second].canonicalName + "'");
		}
	}
	optionSpecs.push_back(spec);
	const size_t idx = optionSpecs.size() - 1;
	for (const auto &k : optionSpecs.back().aliases) aliasToIndex[k] = idx;
}

void CommandLineParser::addFlag(const std::string &canonicalName,
			  const std::vector<std::string> &aliases,
			  const std::string &help,
			  const std::string &group)
{
	OptionSpec spec;
	spec.canonicalName = canonicalName;
	spec.aliases = aliases;
	spec.takesValue = false;
	spec.help = help;
	spec.group = group;
	registerSpec(spec);
}

void CommandLineParser::addOption(const std::string &canonicalName,
			   const std::vector<std::string> &aliases,
			   const std::string &valueName,
			   const std::string &defaultValue,
			   const std::string &help,
			   const std::string &group,
			   bool optionalValue,
			   const std::string &implicitValue)
{
	OptionSpec spec;
	spec.canonicalName = canonicalName;
	spec.aliases = aliases;
	spec.takesValue = true;
	spec.optionalValue = optionalValue;
	spec.valueName = valueName;
	spec.defaultValue = defaultValue;
	spec.implicitValue = implicitValue;
	spec.help = help;
	spec.group = group;
	registerSpec(spec);
}

bool CommandLineParser::isPrefixed(const std::string &token) {
	return !token.empty() && (token[0] == '/' || token[0] == '-');
}

const CommandLineParser::OptionSpec* CommandLineParser::findSpec(const std::string &lowerKey) const {
	auto it = aliasToIndex.find(lowerKey);
	if (it == aliasToIndex.end()) return nullptr;
	return &optionSpecs[it->second];
}

std::string CommandLineParser::canonicalOf(const std::string &name) const {
	std::string k = toLower(name);
	const OptionSpec* spec = findSpec(k);
	return spec ? spec->canonicalName : k;
}

void CommandLineParser::parse(int argc, char *argv[])
{
	std::vector<std::string> tokens;
	for (int i = 1; i < argc; ++i) tokens.emplace_back(argv[i]);
	parseTokens(tokens);
}

void CommandLineParser::parseTokens(const std::vector<std::string>& tokens)
{
	values.clear();
	flags.clear();
	positional.clear();
	unrecognized.clear();
	missingValueOptions.clear();

	for (size_t idx = 0; idx < tokens.size(); ++idx) {
		const std::string &token = tokens[idx];

		// a lone negative number or an absolute path is positional, not an option
		if (!isPrefixed(token) || isSignedNumberToken(token) || looksLikePath(token)) {
			positional.push_back(token);
			continue;
		}

		std::string keyval = token;
		if (keyval.compare(0, 2, "--") == 0) keyval.erase(0, 2);
		else keyval.erase(0, 1);

		std::string key = keyval;
		std::string val;
		size_t eq = keyval.find('=');
		if (eq != std::string::npos) {
			key = keyval.substr(0, eq);
			val = keyval.substr(eq + 1);
		}
		key = toLower(key);

		const OptionSpec *spec = findSpec(key);
		if (!spec) {
			if (std::find(unrecognized.begin(), unrecognized.end(), token) == unrecognized.end())
				unrecognized.push_back(token);
			continue;
		}

		if (!spec->takesValue) {
			flags.insert(spec->canonicalName);
			continue;
		}

		if (val.empty() && eq == std::string::npos && idx + 1 < tokens.size()) {
			const std::string &next = tokens[idx + 1];
			if (!isPrefixed(next) || isSignedNumberToken(next) || looksLikePath(next)) {
				val = next;
				++idx;
			}
		}
		if (val.empty() && spec->optionalValue)
			val = spec->implicitValue;
		if (val.empty()) {
			missingValueOptions.push_back(spec->canonicalName);
			continue;
		}
		values[spec->canonicalName] = stripQuotes(val);
	}
}

bool CommandLineParser::switchExists(const std::string &name) const {
	std::string canon = canonicalOf(name);
	return flags.count(canon) != 0 || values.count(canon) != 0;
}

bool CommandLineParser::valueProvided(const std::string &name) const {
	return values.count(canonicalOf(name)) != 0;
}

std::string CommandLineParser::getValue(const std::string &name, const std::string &defaultValue) const {
	auto it = values.find(canonicalOf(name));
	if (it == values.end() || it->second.empty()) return defaultValue;
	return it->second;
}

std::string CommandLineParser::rebuildCommandLine() const
{
	std::vector<std::string> tokens = positional;
	for (const auto &spec : optionSpecs) {
		const std::string &canon = spec.canonicalName;
		if (spec.takesValue) {
			auto it = values.find(canon);
			if (it != values.end())
				tokens.push_back("/" + canon + "=" + it->second);
		} else if (flags.count(canon)) {
			tokens.push_back("/" + canon);
		}
	}
	std::string out;
	for (size_t i = 0; i < tokens.size(); ++i) {
		if (i) out += " ";
		out += quoteIfNeeded(tokens[i]);
	}
	return out;
}

std::string CommandLineParser::formatHelp(const std::string &appName) const
{
	const size_t nameColumn = 30;

	std::vector<std::string> groupOrder;
	for (const auto &spec : optionSpecs) {
		if (std::find(groupOrder.begin(), groupOrder.end(), spec.group) == groupOrder.end())
			groupOrder.push_back(spec.group);
	}

	std::ostringstream out;
	out << "Usage: " << appName << " <InputFile> [options]\n\n";
	out << "Options take a '/', '-' or '--' prefix and their value after '=' or a space,\n";
	out << "e.g. /polygons=50, -polygons 50, --polygons 50. The input file may also be given by /input.\n";

	for (const std::string &group : groupOrder) {
		out << "\n" << group << ":\n";
		for (const OptionSpec &s : optionSpecs) {
			if (s.group != group) continue;

			// "/name, /alias=VALUE"
			std::string names;
			for (size_t i = 0; i < s.aliases.size(); ++i) {
				if (i) names += ", ";
				names += "/" + s.aliases[i];
			}
			if (s.takesValue)
				names += "=" + (s.valueName.empty() ? std::string("VALUE") : s.valueName);

			out << "  " << names;
			if (names.size() < nameColumn)
				out << std::string(nameColumn - names.size(), ' ');
			else
				out << "\n  " << std::string(nameColumn, ' ');
			out << s.help;
			if (!s.defaultValue.empty()) out << " [" << s.defaultValue << "]";
			out << "\n";
		}
	}
	return out.str();
}

std::vector<std::string> CommandLineParser::allOptionNames() const
{
	std::vector<std::string> out;
	out.reserve(optionSpecs.size());
	for (const auto &s : optionSpecs) out.push_back(s.canonicalName);
	return out;
}
