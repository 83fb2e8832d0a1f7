#include "common/config.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <arpa/inet.h>

namespace buspro {

namespace {

std::string trim(const std::string& s)
{
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

bool parse_int(const std::string& text, long min, long max, long& out)
{
    if (text.empty()) return false;
    size_t pos = 0;
    long value = 0;
    try {
        value = std::stol(text, &pos, 0);
    } catch (const std::exception&) {
        return false;
    }
    if (pos != text.size() || value < min || value > max) return false;
    out = value;
    return true;
}

bool parse_level(const std::string& text, LogLevel& out)
{
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") out = LogLevel::DEBUG;
    else if (lower == "info") out = LogLevel::INFO;
    else if (lower == "warning") out = LogLevel::WARNING;
    else if (lower == "error") out = LogLevel::ERROR;
    else return false;
    return true;
}

bool apply(GatewayConfig& config, const std::string& key, const std::string& value)
{
    long n = 0;

    if (key == "gateway_host") {
        if (value.empty()) return false;
        config.gateway_host = value;
    } else if (key == "gateway_port") {
        if (!parse_int(value, 1, 65535, n)) return false;
        config.gateway_port = static_cast<int>(n);
    } else if (key == "local_port") {
        if (!parse_int(value, 0, 65535, n)) return false;
        config.local_port = static_cast<int>(n);
    } else if (key == "source_subnet") {
        if (!parse_int(value, 0, 255, n)) return false;
        config.source_subnet = static_cast<uint8_t>(n);
    } else if (key == "source_device") {
        if (!parse_int(value, 0, 255, n)) return false;
        config.source_device = static_cast<uint8_t>(n);
    } else if (key == "source_ip") {
        in_addr addr{};
        if (inet_pton(AF_INET, value.c_str(), &addr) != 1) return false;
        config.source_ip = value;
    } else if (key == "checksum") {
        if (value == "crc16") config.checksum = ChecksumMode::CRC16;
        else if (value == "additive") config.checksum = ChecksumMode::ADDITIVE;
        else return false;
    } else if (key == "request_timeout_ms") {
        if (!parse_int(value, 1, 600000, n)) return false;
        config.request_timeout_ms = static_cast<int>(n);
    } else if (key == "send_retries") {
        if (!parse_int(value, 0, 100, n)) return false;
        config.send_retries = static_cast<int>(n);
    } else if (key == "retry_backoff_ms") {
        if (!parse_int(value, 0, 60000, n)) return false;
        config.retry_backoff_ms = static_cast<int>(n);
    } else if (key == "poll_interval_ms") {
        if (!parse_int(value, 0, 86400000, n)) return false;
        config.poll_interval_ms = static_cast<int>(n);
    } else if (key == "poll_delay_ms") {
        if (!parse_int(value, 0, 60000, n)) return false;
        config.poll_delay_ms = static_cast<int>(n);
    } else if (key == "poll_mode") {
        if (value == "subscriptions") config.poll_mode = PollMode::SUBSCRIPTIONS;
        else if (value == "catalog") config.poll_mode = PollMode::CATALOG;
        else return false;
    } else if (key == "discovery_timeout_ms") {
        if (!parse_int(value, 0, 600000, n)) return false;
        config.discovery_timeout_ms = static_cast<int>(n);
    } else if (key == "discovery_repeats") {
        if (!parse_int(value, 1, 10, n)) return false;
        config.discovery_repeats = static_cast<int>(n);
    } else if (key == "discovery_first_subnet") {
        if (!parse_int(value, 1, 254, n)) return false;
        config.discovery_first_subnet = static_cast<uint8_t>(n);
    } else if (key == "discovery_last_subnet") {
        if (!parse_int(value, 1, 254, n)) return false;
        config.discovery_last_subnet = static_cast<uint8_t>(n);
    } else if (key == "log_level") {
        return parse_level(value, config.log_level);
    } else {
        return false;
    }
    return true;
}

} // anonymous namespace

Result<GatewayConfig> parse_config(std::istream& in, std::string* error_line)
{
    GatewayConfig config;
    std::string line;

    while (std::getline(in, line)) {
        size_t hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty()) continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos || !apply(config, trim(line.substr(0, eq)), trim(line.substr(eq + 1)))) {
            if (error_line) *error_line = line;
            return Result<GatewayConfig>::failure(Error::PARSE_ERROR);
        }
    }

    if (config.gateway_host.empty() || config.discovery_first_subnet > config.discovery_last_subnet) {
        if (error_line) *error_line = config.gateway_host.empty() ? "gateway_host" : "discovery_first_subnet";
        return Result<GatewayConfig>::failure(Error::PARSE_ERROR);
    }

    return Result<GatewayConfig>::success(std::move(config));
}

Result<GatewayConfig> load_config(const std::string& path, std::string* error_line)
{
    std::ifstream file(path);
    if (!file) {
        if (error_line) *error_line = path;
        return Result<GatewayConfig>::failure(Error::FILE_ERROR);
    }
    return parse_config(file, error_line);
}

} // namespace buspro
