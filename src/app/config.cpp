#include <time.h>
#include "config.h"
#include "../utils/string_conv.h"

#include <cctype>
#include <climits>

using namespace std;

void Configuration::Process(int argc, char *argv[])
{
	std::vector<std::string> tokens;
	for (int i = 1; i < argc; ++i) tokens.emplace_back(argv[i]);
	ProcessTokens(tokens);
}

void Configuration::ProcessTokens(const std::vector<std::string>& tokens)
{
	// Reset parser and diagnostics to allow multiple invocations
	parser = CommandLineParser();
	error_messages.clear();
	warning_messages.clear();
	show_help = false;
	bad_arguments = false;

	parser.addFlag("help", {"?"},
		"Show this help and exit.",
		"General options");
	parser.addFlag("quiet", {"q"},
		"Headless/quiet mode (no window, statistics on stdout).",
		"General options");
	parser.addOption("font", {}, "FILE", "",
		"TTF font for the preview window (default: poly_font.ttf next to the executable).",
		"General options");
	parser.addOption("max_evals", {"me"}, "N", "0",
		"Stop after N rounds (0 = unlimited).",
		"General options");
	parser.addOption("target_match", {"tm"}, "PERCENT", "0",
		"Stop once the match reaches this percentage (0 = off).",
		"General options");
	parser.addOption("stagnation", {"sg"}, "N", "0",
		"Stop after N consecutive rounds without improvement (0 = off).",
		"General options");
	parser.addOption("save", {}, "auto|N", "auto",
		"Auto-save period in rounds or 'auto' to save ~every 30 seconds.",
		"General options");
	parser.addOption("seed", {}, "random|N", "random",
		"RNG seed.",
		"General options");

	parser.addOption("input", {"i"}, "FILE", "",
		"Input image path. May also be provided positionally as the first non-option argument.",
		"Input");
	parser.addOption("output", {"o"}, "FILE", "output.png",
		"Output base filename (.png, -diff.png, .svg and .txt are written).",
		"Input");
	parser.addOption("w", {}, "WIDTH", "-1",
		"Rescale input to this width (-1 = keep; keeps aspect if only height is given).",
		"Input");
	parser.addOption("h", {}, "HEIGHT", "-1",
		"Rescale input to this height (-1 = keep; keeps aspect if only width is given).",
		"Input");
	parser.addOption("filter", {}, "box|bilinear|bicubic|bspline|catmullrom|lanczos3", "box",
		"Rescale filter.",
		"Input");

	parser.addOption("polygons", {"p"}, "N", "100",
		"Number of polygons in the population (>=1).",
		"Polygons");
	parser.addOption("vertices", {"v"}, "N", "3",
		"Vertices per polygon (>=3).",
		"Polygons");
	parser.addOption("mutation", {"m"}, "single|all", "single",
		"Mutation granularity: one vertex or the color per round (single), or everything (all).",
		"Polygons");

	parser.parseTokens(tokens);

	for (const auto &tok : parser.getUnrecognized())
		error_messages.push_back(std::string("Unrecognized option: ") + tok);
	for (const auto &name : parser.getMissingValueOptions())
		error_messages.push_back(std::string("Missing value for option: ") + name);

	// do not treat "-h" as help to avoid conflict with height
	if (parser.switchExists("help"))
		show_help = true;

	command_line = parser.rebuildCommandLine();

	auto readInt = [&](const char* name, const char* def, long long& out) {
		string v = parser.getValue(name, def);
		if (!TryString2Value<long long>(v, out)) {
			error_messages.push_back(std::string("Invalid number for option ") + name + ": '" + v + "'");
			TryString2Value<long long>(def, out);
		}
	};
	auto readDouble = [&](const char* name, const char* def, double& out) {
		string v = parser.getValue(name, def);
		if (!TryString2Value<double>(v, out)) {
			error_messages.push_back(std::string("Invalid number for option ") + name + ": '" + v + "'");
			TryString2Value<double>(def, out);
		}
	};

	// values that end up in an int
	auto fitsInt = [&](const char* name, long long& v) {
		if (v > INT_MAX) {
			error_messages.push_back(std::string("Option ") + name + " is too large.");
			v = INT_MAX;
		}
	};

	input_file = parser.getValue("input", "");
	output_file = parser.getValue("output", "output.png");

	long long value = 0;
	readInt("polygons", "100", value);
	if (value < 1) {
		error_messages.push_back("Option polygons must be at least 1.");
		value = 1;
	}
	fitsInt("polygons", value);
	polygons = (int)value;

	readInt("vertices", "3", value);
	if (value < 3) {
		error_messages.push_back("Option vertices must be at least 3.");
		value = 3;
	}
	fitsInt("vertices", value);
	vertices = (int)value;

	{
		string mode = parser.getValue("mutation", "single");
		for (auto &c : mode) c = (char)tolower(c);
		if (mode == "all")
			mutation_mode = E_MUTATION_ALL;
		else {
			if (mode != "single") warning_messages.push_back("Unknown mutation='" + mode + "', using 'single'.");
			mutation_mode = E_MUTATION_SINGLE;
		}
	}

	readInt("max_evals", "0", value);
	if (value < 0) value = 0;
	max_evals = (unsigned long long)value;

	readDouble("target_match", "0", target_match);
	if (target_match < 0) target_match = 0;
	if (target_match > 100) {
		warning_messages.push_back("target_match above 100 can never be reached.");
	}

	readInt("stagnation", "0", value);
	if (value < 0) value = 0;
	stagnation = (unsigned long long)value;

	string seed_val = parser.getValue("seed", "random");
	if (seed_val == "random")
		initial_seed = (unsigned long long)time(NULL);
	else if (!TryString2Value<unsigned long long>(seed_val, initial_seed))
		error_messages.push_back("Invalid seed: '" + seed_val + "'");

	string save_val = parser.getValue("save", "auto");
	if (save_val == "auto")
		save_period = -1;
	else {
		readInt("save", "-1", save_period);
		if (save_period <= 0) save_period = -1;
	}

	readInt("w", "-1", value);
	if (value < INT_MIN) value = 0;
	fitsInt("w", value);
	width = (int)value;
	readInt("h", "-1", value);
	if (value < INT_MIN) value = 0;
	fitsInt("h", value);
	height = (int)value;
	if (width == 0 || width < -1 || height == 0 || height < -1)
		error_messages.push_back("Width and height must be positive (or -1 to keep the input size).");

	string rescale_filter_value = parser.getValue("filter", "box");
	if (rescale_filter_value == "box")
		rescale_filter = FILTER_BOX;
	else if (rescale_filter_value == "bicubic")
		rescale_filter = FILTER_BICUBIC;
	else if (rescale_filter_value == "bilinear")
		rescale_filter = FILTER_BILINEAR;
	else if (rescale_filter_value == "bspline")
		rescale_filter = FILTER_BSPLINE;
	else if (rescale_filter_value == "catmullrom")
		rescale_filter = FILTER_CATMULLROM;
	else if (rescale_filter_value == "lanczos3")
		rescale_filter = FILTER_LANCZOS3;
	else {
		warning_messages.push_back("Unknown filter='" + rescale_filter_value + "', using 'box'.");
		rescale_filter = FILTER_BOX;
	}

	quiet = parser.switchExists("quiet");
	font_file = parser.getValue("font", "");

	// Positional input file if not specified via -i or --input
	if (input_file.empty()) {
		for (const std::string& candidate : parser.getPositionalArguments()) {
			if (candidate.empty()) continue;
			input_file = candidate;
			break;
		}
	}

	if (input_file.empty() && !show_help)
		error_messages.push_back("No input file given.");

	if (!error_messages.empty())
		bad_arguments = true;
}

OptimizerSettings Configuration::GetOptimizerSettings() const
{
	OptimizerSettings s;
	s.polygon_count = polygons;
	s.vertex_count = vertices;
	s.mutation_mode = mutation_mode;
	s.max_rounds = max_evals;
	s.target_match = target_match;
	s.stagnation_rounds = stagnation;
	return s;
}
