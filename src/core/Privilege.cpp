#include "Privilege.h"
#include "Logging.h"
#include <string>
#ifdef HOSTWATCH_HAVE_LIBCAP
#include <sys/capability.h>
#endif

namespace hostwatch {

#ifdef HOSTWATCH_HAVE_LIBCAP
static void log_capabilities(const std::string& context) {
    cap_t caps = cap_get_proc();
    if (!caps) {
        Logger::instance().warn("Failed to get current capabilities " + context);
        return;
    }
    char* cap_text = cap_to_text(caps, nullptr);
    if (cap_text) {
        Logger::instance().debug("Capabilities " + context + ": " + std::string(cap_text));
        cap_free(cap_text);
    }
    cap_free(caps);
}
#endif

bool drop_capabilities(){
#ifdef HOSTWATCH_HAVE_LIBCAP
    Logger::instance().info("Dropping capabilities");
    log_capabilities("before drop");
    cap_t caps = cap_get_proc();
    if(!caps){
        Logger::instance().error("cap_get_proc failed");
        return false;
    }
    cap_clear(caps);
    bool ok = cap_set_proc(caps) == 0;
    if(!ok) Logger::instance().error("cap_set_proc failed");
    cap_free(caps);
    if(ok) log_capabilities("after drop");
    return ok;
#else
    Logger::instance().info("Capability dropping not available (libcap not compiled in)");
    return true;
#endif
}

bool is_privilege_available(){
#ifdef HOSTWATCH_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

}
