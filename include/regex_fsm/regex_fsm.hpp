#pragma once

/*
	regex_fsm: compiles a pattern into a state graph and tests whether a whole
	string is accepted by it.

	Supported Grammer:
	literal           any ASCII character except the ones below
	wildcard          .
	kleene closure    *
	positive closure  +

	usage:
		auto [errc, graph] = regex_fsm::compile<char>("a*4.+hi");
		if(errc == regex_fsm::error_category::success) {
			regex_fsm::regular_expression_engine<char> re{graph};
			re.matches("aaaaaa4uhi"); // true
		}

	the matcher backtracks, so memoize should stay enabled for untrusted patterns.
	with memoize disabled the search also recurses once per input char, so the
	input length is limited by the stack size; with memoize enabled the call
	depth is bounded by the graph size.
*/

#include <tuple>
#include <cstddef>
#include <string_view>

#include "error.hpp"
#include "matcher.hpp"
#include "state_graph.hpp"

namespace regex_fsm {

using impl::state_category;
using impl::category_name;

template <typename CharT>
using state_graph = impl::state_graph<CharT>;

template <typename CharT>
using state_graph_builder = impl::state_graph_builder<CharT>;

template <typename CharT>
using regular_expression_engine = impl::regular_expression_engine<CharT>;

// free functions
template <typename CharT>
std::tuple<error_category, impl::state_graph<CharT>> compile(std::basic_string_view<CharT> pattern) {
	impl::state_graph_builder<CharT> builder{pattern};
	return {builder.get_result(), builder.generate()};
}

// the build result and the index of the offending char (pattern.size() if succeeded)
template <typename CharT>
std::tuple<error_category, std::size_t> diagnose(std::basic_string_view<CharT> pattern) {
	impl::state_graph_builder<CharT> builder;
	return builder.parse(pattern);
}

template <typename CharT>
std::tuple<error_category, bool> match(std::basic_string_view<CharT> pattern, std::basic_string_view<CharT> target) {
	impl::state_graph_builder<CharT> builder{pattern};
	if(auto errc = builder.get_result(); errc != error_category::success)
		return {errc, false};
	else return {
		errc,
		regular_expression_engine<CharT>{builder.generate()}.matches(target)
	};
}

} // namespace regex_fsm
