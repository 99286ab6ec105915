/*
	regex_fsm command line demo.

	usage: regex_fsm [--no-memo] [--dump] [pattern [input...]]

	without a pattern, the built-in sample "a*4.+hi" is tested against
	"aaaaaa4uhi", "4uhi" and "meow".
*/

#include <string>
#include <vector>
#include <cstdio>
#include <string_view>

#include "fmt/core.h"
#include "fmt/ranges.h"

#include "regex_fsm/regex_fsm.hpp"

int main(int argc, const char** argv) {
	using std::string;
	using std::vector;
	using namespace fmt;
	using namespace regex_fsm;

	bool memoize = true;
	bool dump = false;
	vector<string> positional;

	for(int i = 1; i < argc; ++i) {
		std::string_view a = argv[i];
		if(a == "--no-memo") memoize = false;
		else if(a == "--dump") dump = true;
		else if(a == "--help" || a == "-h") {
			print("usage: {} [--no-memo] [--dump] [pattern [input...]]\n", argv[0]);
			return 0;
		}
		else positional.emplace_back(a);
	}

	string pattern = "a*4.+hi";
	vector<string> inputs = {"aaaaaa4uhi", "4uhi", "meow"};
	if(!positional.empty()) {
		pattern = positional.front();
		inputs.assign(positional.begin() + 1, positional.end());
	}

	state_graph_builder<char> builder{pattern};
	if(auto errc = builder.get_result(); errc != error_category::success) {
		auto pos = builder.get_error_position();
		print(stderr, "pattern \"{}\": {} at {} ('\\x{:02x}')\n",
			pattern, error_message(errc), pos, static_cast<unsigned char>(builder.get_error_char()));
		return 1;
	}

	regular_expression_engine<char> re{builder.generate()};
	re.memoize = memoize;

	print("pattern: {}\n", pattern);
	if(dump) print("graph:\n  {}\n", join(re.graph.describe(), "\n  "));

	for(const auto& input: inputs) {
		print("{}: {}\n", input, re.matches(input));
	}

	return 0;
}
