#pragma once

// some common utils for the examples

#include <limits>
#include <string>
#include <format>
#include <utility>
#include <iostream>
#include <string_view>

#include "regex_fsm/regex_fsm.hpp"

template <typename... Args>
void print(std::format_string<Args...> format, Args&&... args) {
    std::cout << std::format(format, std::forward<Args>(args)...);
} 
template <typename... Args>
void println(std::format_string<Args...> format, Args&&... args) {
    print(format, std::forward<Args>(args)...);
    print("\n");
}

// reads a whole line, returns false at the end of input
inline bool read_line(std::string& line) {
    return static_cast<bool>(std::getline(std::cin, line));
}
