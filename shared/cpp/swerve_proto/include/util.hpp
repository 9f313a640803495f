#pragma once
#include <string>

std::string getenv_or(const char* key, const std::string& def);
long getenv_long_or(const char* key, long def);

// Lowercase hex SHA-256 of the raw bytes.
std::string sha256_hex(const std::string& bytes);

std::string base64_encode(const std::string& bytes);
// Throws std::invalid_argument on malformed input.
std::string base64_decode(const std::string& text);

// "job_" followed by 32 random hex characters.
std::string gen_job_id();

// UTC, millisecond precision: 2024-01-31T12:00:00.000Z
std::string iso8601_now();
