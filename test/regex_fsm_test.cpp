#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "regex_fsm/regex_fsm.hpp"

using namespace regex_fsm;

TEST(regex_fsm, error_messages) {
  EXPECT_EQ(error_message(error_category::success), "successed");
  EXPECT_EQ(error_message(error_category::ready), "ready to build");
  EXPECT_EQ(error_message(error_category::unsupported_character), "character is not supported");
  EXPECT_EQ(error_message(error_category::quantifier_without_operand), "quantifier without operand");
  static_assert(!error_message(error_category::unsupported_character).empty());
}

TEST(regex_fsm, category_names) {
  EXPECT_EQ(category_name(state_category::start), "start");
  EXPECT_EQ(category_name(state_category::termination), "termination");
  EXPECT_EQ(category_name(state_category::star), "star");
  EXPECT_EQ(category_name(state_category::plus), "plus");
}

TEST(regex_fsm, compile_success) {
  auto [errc, graph] = compile<char>("a.b");
  EXPECT_EQ(errc, error_category::success);
  EXPECT_EQ(graph.size(), 5u);
  EXPECT_EQ(graph[graph.final_state].category, state_category::termination);
}

TEST(regex_fsm, compile_failures) {
  {
    auto [errc, graph] = compile<char>("*ab");
    EXPECT_EQ(errc, error_category::quantifier_without_operand);
    EXPECT_TRUE(graph.empty());
  }
  {
    auto [errc, graph] = compile<char>("ab\xff");
    EXPECT_EQ(errc, error_category::unsupported_character);
    EXPECT_TRUE(graph.empty());
  }
}

TEST(regex_fsm, diagnose_reports_position) {
  {
    auto [errc, pos] = diagnose<char>("*ab");
    EXPECT_EQ(errc, error_category::quantifier_without_operand);
    EXPECT_EQ(pos, 0u);
  }
  {
    auto [errc, pos] = diagnose<char>("abc\x80");
    EXPECT_EQ(errc, error_category::unsupported_character);
    EXPECT_EQ(pos, 3u);
  }
  {
    const std::string pattern = "a*4.+hi";
    auto [errc, pos] = diagnose<char>(pattern);
    EXPECT_EQ(errc, error_category::success);
    EXPECT_EQ(pos, pattern.size());
  }
}

TEST(regex_fsm, one_shot_match) {
  {
    auto [errc, accepted] = match<char>("a+bc", "aaabc");
    EXPECT_EQ(errc, error_category::success);
    EXPECT_TRUE(accepted);
  }
  {
    auto [errc, accepted] = match<char>("a+bc", "bc");
    EXPECT_EQ(errc, error_category::success);
    EXPECT_FALSE(accepted);
  }
  {
    auto [errc, accepted] = match<char>("+bc", "bc");
    EXPECT_EQ(errc, error_category::quantifier_without_operand);
    EXPECT_FALSE(accepted);
  }
}
