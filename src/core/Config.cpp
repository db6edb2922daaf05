#include "Config.h"

namespace hostwatch {
static Config global_cfg;
Config& config(){ return global_cfg; }
void set_config(const Config& c){ global_cfg = c; }
}
