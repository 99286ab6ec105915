#include "./common.hpp"

int main(int argc, const char** argv) {
    using std::string;

    using namespace regex_fsm;
    
    while(true) {
        string pattern;
        string target;
        println("input a pattern:");
        if(!read_line(pattern)) break;
        println("input a target string:");
        if(!read_line(target)) break;

        println("pattern: {}", pattern);
        println("target: {}", target);

        auto [errc, accepted] = match<char>(pattern, target);
        if (errc != error_category::success) {
            println("error: {}", error_message(errc));
            continue;
        }
        println("pattern result: {}", error_message(errc));
        println("accepted: {}", accepted);
    }

    return 0;
}
