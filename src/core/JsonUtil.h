#pragma once
#include <string>
#include <chrono>
#include <optional>

namespace hostwatch {
namespace jsonutil {

std::string escape(const std::string& s);

// UTC "YYYY-MM-DDTHH:MM:SSZ"; the zero time_point renders as "".
std::string time_to_iso(std::chrono::system_clock::time_point tp);

// Quoted & escaped JSON string, or the literal null when absent.
std::string quote_or_null(const std::optional<std::string>& v);

}
}
