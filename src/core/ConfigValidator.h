#pragma once
#include "Config.h"
#include <string>

namespace hostwatch {

class Logger;

class ConfigValidator {
public:
    explicit ConfigValidator(Logger& logger) : logger_(logger) {}

    // Normalizes cfg in place and reports hard errors on stderr. Targets the
    // chosen strategy cannot use are only warned about: the monitor then
    // reports the host as absent.
    bool validate(Config& cfg);
private:
    bool validate_target(const Config& cfg) const;
    bool validate_probe(const Config& cfg) const;
    bool validate_output(const Config& cfg) const;
    void warn_configuration_gaps(const Config& cfg) const;

    Logger& logger_;
};

}
