// Linux capability helpers (best-effort; compile-time gated on libcap)
#pragma once
namespace hostwatch {
// Clears permitted/effective/inheritable capability sets of this process.
// The ping binary keeps its own file capabilities or setuid bit, so probing
// is unaffected. Returns false when the drop was attempted and failed.
bool drop_capabilities();
bool is_privilege_available();
}
