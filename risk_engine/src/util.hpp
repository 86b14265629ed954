#pragma once

#include <chrono>
#include <string>

namespace util {

// Time utilities
std::string current_iso8601();
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string);

// Identifiers
std::string generate_uuid();

// Stable, non-reversible digest used where a customer id must not leak into events
std::string hash_identifier(const std::string& value);

// String utilities
std::string trim(const std::string& str);
std::string to_upper(const std::string& str);

} // namespace util
