#include "core/Config.h"
#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include "core/Logging.h"
#include "core/Target.h"
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    // Space-separated args; argv[0] is the program name.
    std::vector<std::string> args{"hostwatch"};
    size_t pos = 0;
    while (pos < input.size()) {
        size_t next = input.find(' ', pos);
        if (next == std::string::npos) {
            args.push_back(input.substr(pos));
            break;
        }
        args.push_back(input.substr(pos, next - pos));
        pos = next + 1;
    }

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }

    hostwatch::ArgumentParser parser;
    hostwatch::Config cfg;
    if (!parser.parse(static_cast<int>(argv.size()), argv.data(), cfg)) return 0;

    std::ostringstream sink;
    hostwatch::Logger logger(sink);
    hostwatch::ConfigValidator validator(logger);
    if (!validator.validate(cfg)) return 0;

    hostwatch::Target target(cfg.ip, cfg.mac, cfg.hostname);
    (void)target.fullname();
    (void)hostwatch::normalize_mac(input);
    (void)hostwatch::subnet_prefix(input);
    return 0;
}
