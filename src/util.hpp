#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace chatlink {

// Unix epoch seconds
uint64_t epoch_seconds();

// Unix epoch milliseconds
int64_t epoch_millis();

// ISO 8601 UTC timestamp with milliseconds, e.g. 2024-05-01T12:00:00.000Z
std::string format_iso8601(int64_t epoch_ms);

// Parse an ISO 8601 UTC timestamp (fractional seconds and trailing Z optional).
std::optional<int64_t> parse_iso8601(const std::string& s);

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lowercase
std::string to_lower(const std::string& s);

// True if s is a non-empty run of decimal digits (optionally signed)
bool is_integer(const std::string& s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Random RFC 4122 version 4 UUID
std::string generate_uuid();

// Percent-encode everything outside the RFC 3986 unreserved set
std::string url_encode(const std::string& s);

// Standard base64 with padding
std::string base64_encode(const unsigned char* data, size_t len);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace chatlink
