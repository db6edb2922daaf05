#pragma once
#include "Config.h"
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace hostwatch {

class ArgumentParser {
public:
    ArgumentParser();

    // Fills cfg from argv. Returns false when the program should stop:
    // after --help / --version (exit_code() == 0) or on a bad argument
    // (exit_code() == 2, message already on stderr).
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }

    void print_help(std::ostream& os) const;
private:
    enum class ArgKind { None, String, Int, Double };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        const char* help;
        std::function<bool(const std::string&, Config&)> apply;
    };
    const FlagSpec* find_spec(const std::string& flag) const;

    std::vector<FlagSpec> specs_;
    int exit_code_ = 0;
};

}
