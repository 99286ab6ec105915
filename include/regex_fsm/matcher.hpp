#pragma once

#include <vector>
#include <cstddef>
#include <utility>
#include <string_view>

#include "state_graph.hpp"

namespace regex_fsm {

namespace impl {

template <typename CharT>
struct regular_expression_engine {

	using char_t = CharT;

	// immutable
	using string_view_t = basic_string_view<char_t>;

	using graph_t = state_graph<char_t>;
	using state_id_t = typename graph_t::state_id_t;

	// cached result of accepts(state, pos)
	enum class verdict: unsigned char {
		unknown = 0,
		accepted,
		rejected
	};

	const graph_t graph;

	// cache the verdicts of visited (state, position) pairs during a match.
	// the result is the same either way, but without it the search is exponential in the worst case
	bool memoize = true;

protected:
	string_view_t target;

	// (graph.size() x (target.size() + 1)) table, used only if memoize == true
	vector<verdict> verdicts;

	size_t step_count = 0;

public:

	regular_expression_engine(graph_t graph): graph{std::move(graph)} {}

	// whether the whole string s is accepted by the graph
	bool matches(string_view_t s) {
		reset(s);
		// a graph from a failed build accepts nothing
		if(graph.empty()) return false;
		if(memoize) {
			// fill the table from the end of target backwards, so that accepts() only recurses
			// through same-position star skips and the call depth is bounded by the graph size
			for(size_t pos = target.size(); pos-- > 0;) {
				for(state_id_t id = graph.size(); id-- > 0;) accepts(id, pos);
			}
		}
		return accepts(graph.start_state, 0);
	}

	// count of accepts() invocations during the last matches()
	size_t last_step_count() const noexcept{
		return step_count;
	}

protected:

	regular_expression_engine& reset(string_view_t s) {
		target = s;
		step_count = 0;
		if(memoize) verdicts.assign(graph.size() * (target.size() + 1), verdict::unknown);
		else        verdicts.clear();
		return *this;
	}

	verdict& cached(state_id_t id, size_t pos) noexcept{
		return verdicts[id * (target.size() + 1) + pos];
	}

	// termination is reachable from `id` by skipping zero-occurrence states only
	bool reaches_final(state_id_t id) const noexcept{
		for(auto next: graph.successors(id)) {
			if(next == graph.final_state) return true;
			if(graph[next].is_skippable() && reaches_final(next)) return true;
		}
		return false;
	}

	// whether target[pos, end) could be consumed starting from state `id`,
	// where `id` has just consumed target[pos - 1] (or is the start state)
	bool accepts(state_id_t id, size_t pos) {
		++step_count;

		if(pos == target.size()) return reaches_final(id);

		if(memoize) {
			if(auto v = cached(id, pos); v != verdict::unknown) return v == verdict::accepted;
		}

		bool result = search(id, pos);

		if(memoize) cached(id, pos) = result ? verdict::accepted : verdict::rejected;
		return result;
	}

	bool search(state_id_t id, size_t pos) {
		const char_t c = target[pos];

		// one more occurrence of the quantified atom
		if(graph[id].is_quantifier() && graph.accept(id, c) && accepts(id, pos + 1)) return true;

		for(auto next: graph.successors(id)) {
			if(graph.accept(next, c) && accepts(next, pos + 1)) return true;
			// zero occurrence: pass through the star without consuming c
			if(graph[next].is_skippable() && accepts(next, pos)) return true;
		}

		// rejected branch, backtrack
		return false;
	}

}; // struct regular_expression_engine

} // namespace impl

} // namespace regex_fsm
