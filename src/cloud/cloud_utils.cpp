/**
 * @file cloud_utils.cpp
 * @brief Utility functions shared by the blob and source HTTP clients
 */

#include "kcenon/blob_migration/cloud/cloud_utils.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <unordered_map>

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace kcenon::blob_migration::cloud_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

namespace {
constexpr const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

auto base64_value(char c) -> int {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
}  // namespace

auto base64_encode(const std::vector<uint8_t>& data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(data[i + 2]);

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

auto base64_encode(const std::string& data) -> std::string {
    std::vector<uint8_t> bytes(data.begin(), data.end());
    return base64_encode(bytes);
}

auto base64_decode(const std::string& encoded) -> std::vector<uint8_t> {
    std::vector<uint8_t> result;
    result.reserve((encoded.size() / 4) * 3);

    int bits = 0;
    int bit_count = 0;

    for (char c : encoded) {
        if (c == '=') break;
        int val = base64_value(c);
        if (val < 0) continue;

        bits = ((bits << 6) | val) & 0xFFFFFF;
        bit_count += 6;

        if (bit_count >= 8) {
            bit_count -= 8;
            result.push_back(static_cast<uint8_t>((bits >> bit_count) & 0xFF));
        }
    }

    return result;
}

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2)
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto url_decode(const std::string& value) -> std::string {
    std::string decoded;
    decoded.reserve(value.size());

    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        decoded += value[i];
    }

    return decoded;
}

// ============================================================================
// Cryptographic Utilities
// ============================================================================

auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    HMAC(EVP_sha256(),
         key.data(),
         static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()),
         data.size(),
         result.data(),
         &len);

    result.resize(len);
    return result;
}

// ============================================================================
// Time Utilities
// ============================================================================

auto get_rfc1123_time() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time_t);
#else
    gmtime_r(&time_t, &tm);
#endif

    // %a and %b are locale dependent; x-ms-date needs the English names.
    static constexpr const char* days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static constexpr const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                             "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    std::ostringstream oss;
    oss << days[tm.tm_wday] << ", "
        << std::setfill('0') << std::setw(2) << tm.tm_mday << ' '
        << months[tm.tm_mon] << ' '
        << (tm.tm_year + 1900) << ' '
        << std::put_time(&tm, "%H:%M:%S") << " GMT";
    return oss.str();
}

// ============================================================================
// Content Type Detection
// ============================================================================

auto detect_content_type(const std::string& key) -> std::string {
    static const std::unordered_map<std::string, std::string> mime_types = {
        {".zip", "application/zip"},
        {".7z", "application/x-7z-compressed"},
        {".rar", "application/vnd.rar"},
        {".gz", "application/gzip"},
        {".tgz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".bz2", "application/x-bzip2"},
        {".xz", "application/x-xz"},
        {".iso", "application/x-iso9660-image"},
        {".pst", "application/vnd.ms-outlook"},
        {".bak", "application/octet-stream"},
        {".pdf", "application/pdf"},
        {".csv", "text/csv"},
        {".txt", "text/plain"},
        {".xml", "application/xml"},
        {".json", "application/json"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".mp4", "video/mp4"},
    };

    auto dot_pos = key.rfind('.');
    auto slash_pos = key.rfind('/');
    if (dot_pos == std::string::npos ||
        (slash_pos != std::string::npos && dot_pos < slash_pos)) {
        return "application/octet-stream";
    }

    std::string ext = key.substr(dot_pos);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = mime_types.find(ext);
    if (it != mime_types.end()) {
        return it->second;
    }

    return "application/octet-stream";
}

// ============================================================================
// Retry Policy Utilities
// ============================================================================

auto calculate_retry_delay(const cloud_retry_policy& policy,
                           std::size_t attempt) -> std::chrono::milliseconds {
    auto delay = static_cast<double>(policy.initial_delay.count());

    for (std::size_t i = 1; i < attempt; ++i) {
        delay *= policy.backoff_multiplier;
    }

    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));

    if (policy.use_jitter) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay *= dis(gen);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

auto is_retryable_status(int status_code,
                         const cloud_retry_policy& policy) -> bool {
    if (status_code == 408) {
        return true;
    }

    if (policy.retry_on_rate_limit && (status_code == 429 || status_code == 503)) {
        return true;
    }

    if (policy.retry_on_server_error && status_code >= 500 && status_code < 600) {
        return true;
    }

    return false;
}

}  // namespace kcenon::blob_migration::cloud_utils
