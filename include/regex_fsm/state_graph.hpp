#pragma once

/*
	State graph of the regex_fsm pattern language.

	Supported Grammer:
	literal           any ASCII character except the ones below
	wildcard          .
	kleene closure    *
	positive closure  +

	The graph is an arena of states addressed by index. A pattern is compiled
	into a linear chain of atoms, where a quantifier replaces the atom before it
	with a wrapper state whose first out-going edge points back to that atom:

	    a*bc  ->  start -> star(a) -> b -> c -> termination
	                          |
	                          +--> a
*/

#include <span>
#include <tuple>
#include <string>
#include <vector>
#include <cstddef>
#include <utility>
#include <string_view>
#include <type_traits>

#include "error.hpp"

namespace regex_fsm {

namespace impl {

// classes / aliases
using std::span;
using std::tuple;
using std::size_t;
using std::string;
using std::vector;
using std::string_view;
using std::make_unsigned_t;
using std::basic_string_view;

enum class state_category: unsigned char {
	start = 0,   // the unique entry, routes only
	termination, // the unique accept marker
	literal,     // a single char
	wildcard,    // . (any char)
	star,        // kleene closure wrapper:   r*
	plus         // positive closure wrapper: r+
};

constexpr string_view category_name(state_category category) noexcept{
	switch(category) {
	case state_category::start:       return "start";
	case state_category::termination: return "termination";
	case state_category::literal:     return "literal";
	case state_category::wildcard:    return "wildcard";
	case state_category::star:        return "star";
	case state_category::plus:        return "plus";
	}
	return "";
}

template <typename CharT>
struct state_graph_builder;

template <typename CharT>
struct state_graph {
	// output of state_graph_builder, immutable after generation

	using char_t = CharT;
	using state_id_t = size_t;

	using state_graph_builder_t = state_graph_builder<char_t>;

	struct state {

		state_category category;

		union state_data {
			// active when category == literal
			char_t symbol;
			// active when category == star or plus
			state_id_t inner;

			constexpr state_data() noexcept: inner{0} {}
			constexpr state_data(char_t c) noexcept: symbol{c} {}
			constexpr state_data(state_id_t id) noexcept: inner{id} {}
		} data;

		// out-going edges, in the order of the pattern
		vector<state_id_t> next;

		state(state_category category) noexcept: category{category} {}
		state(state_category category, state_data data) noexcept: category{category}, data{data} {}

		state* add_outgoing(state_id_t target) {
			next.push_back(target);
			return this;
		}

		bool is_quantifier() const noexcept{
			return category == state_category::star || category == state_category::plus;
		}

		// a zero-occurrence quantifier, which could be passed without consuming any char
		bool is_skippable() const noexcept{
			return category == state_category::star;
		}

	}; // struct state

	vector<state> states;
	state_id_t start_state = 0;
	state_id_t final_state = 0;

	friend state_graph_builder_t;

	state& operator[](state_id_t id) {
		return states[id];
	}

	const state& operator[](state_id_t id) const{
		return states[id];
	}

	size_t size() const noexcept{
		return states.size();
	}

	bool empty() const noexcept{
		return states.empty();
	}

	// whether the state `id` consumes char c
	bool accept(state_id_t id, char_t c) const noexcept{
		const auto& s = states[id];
		switch(s.category) {
		case state_category::literal:
			return c == s.data.symbol;
		case state_category::wildcard:
			return true;
		case state_category::star:
		case state_category::plus:
			return accept(s.data.inner, c);
		default:
			// start and termination never consume a char
			return false;
		}
	}

	// the states which follow `id` in the chain.
	// the first edge of a quantifier is its loop back to the inner atom, so it is excluded
	span<const state_id_t> successors(state_id_t id) const noexcept{
		const auto& s = states[id];
		span<const state_id_t> edges{s.next};
		return s.is_quantifier() ? edges.subspan(1) : edges;
	}

	// one line per state: "2: star(1) -> [1, 3]"
	vector<string> describe() const{
		vector<string> lines;
		lines.reserve(states.size());
		for(state_id_t id = 0; id < states.size(); ++id) {
			const auto& s = states[id];
			string line = std::to_string(id) + ": " + string{category_name(s.category)};
			switch(s.category) {
			case state_category::literal:
				line += "('";
				line += static_cast<char>(s.data.symbol);
				line += "')";
				break;
			case state_category::star:
			case state_category::plus:
				line += "(" + std::to_string(s.data.inner) + ")";
				break;
			default:
				break;
			}
			line += " -> [";
			for(size_t i = 0; i < s.next.size(); ++i) {
				if(i != 0) line += ", ";
				line += std::to_string(s.next[i]);
			}
			line += "]";
			lines.push_back(std::move(line));
		}
		return lines;
	}

protected:

	// build it from state_graph_builder
	state_graph() noexcept = default;
	state_graph(vector<state> states, state_id_t start_state, state_id_t final_state):
		states{std::move(states)}, start_state{start_state}, final_state{final_state} {}

}; // struct state_graph

template <typename CharT>
struct state_graph_builder {
	// a factory of state_graph

	using char_t = CharT;

	using pattern_view_t = basic_string_view<char_t>;

	using graph_t = state_graph<char_t>;
	using state_t = typename graph_t::state;
	using state_id_t = typename graph_t::state_id_t;

	static constexpr char_t wildcard_char = '.';
	static constexpr char_t kleene_char   = '*';
	static constexpr char_t positive_char = '+';

	state_graph_builder() = default;

	state_graph_builder(pattern_view_t s) {
		parse(s);
	}

	static constexpr bool is_supported(char_t c) noexcept{
		// ASCII only
		return static_cast<make_unsigned_t<char_t>>(c) <= 0x7f;
	}

protected:

	vector<state_t> states;
	state_id_t start_state = 0;
	state_id_t final_state = 0;

	error_category build_result = error_category::ready;
	size_t error_pos = 0;
	char_t error_char{};

	state_id_t new_state(state_category category) {
		states.emplace_back(category);
		return states.size() - 1;
	}

	template <typename DataT>
	state_id_t new_state(state_category category, DataT data) {
		states.emplace_back(category, typename state_t::state_data{data});
		return states.size() - 1;
	}

	tuple<error_category, size_t> reject(error_category category, size_t pos, char_t c) {
		error_pos = pos;
		error_char = c;
		return {build_result = category, pos};
	}

public:

	void reset() {
		states.clear();
		start_state = new_state(state_category::start);
		final_state = 0;
		build_result = error_category::ready;
		error_pos = 0;
		error_char = char_t{};
	}

	// returns the result and the position where the parsing stopped
	tuple<error_category, size_t> parse(pattern_view_t s) {
		reset();

		// the atoms of the pattern from left to right, quantified atoms are replaced by their wrappers
		vector<state_id_t> chain;

		for(size_t pos = 0; pos < s.size(); ++pos) {
			const char_t c = s[pos];
			if(!is_supported(c)) return reject(error_category::unsupported_character, pos, c);

			switch(c) {
			case kleene_char:
			case positive_char: {
				if(chain.empty()) return reject(error_category::quantifier_without_operand, pos, c);
				auto inner = chain.back();
				auto wrapper = new_state(c == kleene_char ? state_category::star : state_category::plus, inner);
				states[wrapper].add_outgoing(inner);
				chain.back() = wrapper;
				break;
			}
			case wildcard_char:
				chain.push_back(new_state(state_category::wildcard));
				break;
			default:
				chain.push_back(new_state(state_category::literal, c));
				break;
			}
		}

		for(size_t i = 0; i + 1 < chain.size(); ++i) {
			states[chain[i]].add_outgoing(chain[i + 1]);
		}

		final_state = new_state(state_category::termination);
		if(chain.empty()) {
			// empty pattern only accepts empty string
			states[start_state].add_outgoing(final_state);
		}else {
			states[chain.back()].add_outgoing(final_state);
			states[start_state].next = {chain.front()};
		}

		return {build_result = error_category::success, s.size()};
	}

	error_category get_result() const noexcept{
		return build_result;
	}

	size_t get_error_position() const noexcept{
		return error_pos;
	}

	char_t get_error_char() const noexcept{
		return error_char;
	}

	// generate the graph as our result
	graph_t generate() const{
		if(build_result != error_category::success) {
			return {}; // return an empty graph
		}
		return {states, start_state, final_state};
	}

}; // struct state_graph_builder

} // namespace impl

} // namespace regex_fsm
