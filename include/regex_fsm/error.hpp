#pragma once

#include <string_view>

namespace regex_fsm {

enum class error_category {
	success = 0,
	ready, 
	unsupported_character, 
	quantifier_without_operand
};


constexpr std::string_view error_message(error_category category) noexcept{
	switch(category) {
	case error_category::success:                    return "successed";
	case error_category::ready:                      return "ready to build";
	case error_category::unsupported_character:      return "character is not supported";
	case error_category::quantifier_without_operand: return "quantifier without operand";
	}
	return "";
}

} // namespace regex_fsm
