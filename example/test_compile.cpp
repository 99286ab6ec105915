#include "./common.hpp"

int main(int argc, const char** argv) {
	using std::string;

	using namespace regex_fsm;

	string pattern;
	while(true) {
		
		println("input a pattern:");
		if(!read_line(pattern)) break;

		println("pattern: {}", pattern);

		state_graph_builder<char> builder{pattern};
		auto result = builder.get_result();
		if(result != error_category::success) {
			println("pattern result: {} at {}", error_message(result), builder.get_error_position());
			continue;
		}
		println("pattern result: {}", error_message(result));

		regular_expression_engine<char> re{builder.generate()};
		for(const auto& line: re.graph.describe()) println("  {}", line);

		while(true) {
			string target;
			println("input a target string(input ~ to set a new pattern):");
			if(!read_line(target) || target == "~") break;
			bool accepted = re.matches(target);
			println("target = \"{}\", accepted: {}, steps: {}", target, accepted, re.last_step_count());
		}
	}

	return 0;
}
