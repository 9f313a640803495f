#include "../include/util.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <random>
#include <sstream>
#include <stdexcept>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

long getenv_long_or(const char* key, long def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        return std::stol(v);
    } catch (const std::exception&) {
        return def;
    }
}

std::string sha256_hex(const std::string& bytes) {
    unsigned char md[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), md);
    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

std::string base64_encode(const std::string& bytes) {
    if (bytes.empty()) return {};
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(bytes.data()), (int)bytes.size());
    out.resize((size_t)n);
    return out;
}

std::string base64_decode(const std::string& text) {
    if (text.empty()) return {};
    if (text.size() % 4 != 0) throw std::invalid_argument("base64 length is not a multiple of 4");
    // EVP_DecodeBlock does not check where '=' appears; only "x=" or "==" may end the input.
    size_t eq = text.find('=');
    if (eq != std::string::npos &&
        (eq < text.size() - 2 || text.find_first_not_of('=', eq) != std::string::npos)) {
        throw std::invalid_argument("misplaced base64 padding");
    }
    std::string out(3 * (text.size() / 4) + 1, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(text.data()), (int)text.size());
    if (n < 0) throw std::invalid_argument("invalid base64 input");
    // EVP_DecodeBlock counts the zero bytes produced by '=' padding.
    size_t pad = 0;
    if (text[text.size() - 1] == '=') ++pad;
    if (text[text.size() - 2] == '=') ++pad;
    out.resize((size_t)n - pad);
    return out;
}

std::string gen_job_id() {
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng), b = dist(rng);
    char buf[33];
    snprintf(buf, sizeof(buf), "%016llx%016llx", (unsigned long long)a, (unsigned long long)b);
    return std::string("job_") + buf;
}

std::string iso8601_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
             tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, (int)ms.count());
    return buf;
}
