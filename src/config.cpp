#include "config.h"

#include <cctype>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <string>

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Whole-string unsigned parse. Only digits of the base are accepted: no
// sign, no whitespace and no embedded "0x" (stoul would skip or eat those).
static bool parse_unsigned(const std::string& s, unsigned long& out, int base = 10) {
    static const std::regex re_dec(R"(^[0-9]+$)");
    static const std::regex re_hex(R"(^[0-9a-fA-F]+$)");
    if (!std::regex_match(s, base == 16 ? re_hex : re_dec)) return false;
    size_t pos = 0;
    try {
        out = std::stoul(s, &pos, base);
    } catch (const std::logic_error&) {
        return false;
    }
    return pos == s.size();
}

// -----------------------------------------------------------------------
// USB id / colour strings
// -----------------------------------------------------------------------

bool parse_usb_id(const std::string& s, uint16_t& out) {
    std::string v = to_lower(trim(s));
    unsigned long n = 0;
    bool ok = (v.rfind("0x", 0) == 0) ? parse_unsigned(v.substr(2), n, 16)
                                      : parse_unsigned(v, n, 10);
    if (!ok || n > 0xffff) return false;
    out = static_cast<uint16_t>(n);
    return true;
}

bool parse_color(const std::string& s, Color& out) {
    std::string v = trim(s);

    // "#rrggbb"
    if (!v.empty() && v[0] == '#') {
        std::string hex = v.substr(1);
        unsigned long rgb = 0;
        if (hex.size() != 6 || !parse_unsigned(hex, rgb, 16)) return false;
        out = make_color(static_cast<int>((rgb >> 16) & 0xff),
                         static_cast<int>((rgb >> 8) & 0xff),
                         static_cast<int>(rgb & 0xff));
        return true;
    }

    // "r,g,b"
    std::smatch m;
    static const std::regex re_rgb(R"(^\s*(-?\d+)\s*,\s*(-?\d+)\s*,\s*(-?\d+)\s*$)");
    if (!std::regex_match(v, m, re_rgb)) return false;
    try {
        out = make_color(std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()));
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

// -----------------------------------------------------------------------
// INI parser
// -----------------------------------------------------------------------

Config parse_config_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Cannot open config file: " + path);

    Config cfg;
    std::string section;
    int lineno = 0;

    // Regex patterns
    std::regex re_section(R"(^\[([^\]]+)\])");
    std::regex re_kv(R"(^([^=]+)=(.*)$)");

    auto bad = [&](const std::string& what, const std::string& value) {
        return std::runtime_error("Invalid " + what + " '" + value + "' at line " +
                                  std::to_string(lineno));
    };
    auto number = [&](const std::string& key, const std::string& value) {
        unsigned long n = 0;
        if (!parse_unsigned(value, n) || n > 0xffffffffUL) throw bad(key, value);
        return static_cast<unsigned int>(n);
    };

    std::string line;
    while (std::getline(f, line)) {
        ++lineno;
        line = trim(line);

        // Skip blank lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';')
            continue;

        std::smatch m;

        // Section header
        if (std::regex_match(line, m, re_section)) {
            section = to_lower(trim(m[1].str()));
            continue;
        }

        // Key=value pair
        if (std::regex_match(line, m, re_kv)) {
            std::string key   = to_lower(trim(m[1].str()));
            std::string value = trim(m[2].str());

            if (section == "device") {
                if (key == "vendor_id") {
                    if (!parse_usb_id(value, cfg.device.vendor_id))
                        throw bad("vendor_id", value);
                } else if (key == "product_id") {
                    if (!parse_usb_id(value, cfg.device.product_id))
                        throw bad("product_id", value);
                } else if (key == "led_count") {
                    cfg.device.led_count = number(key, value);
                }

            } else if (section == "transport") {
                if (key == "timeout_ms")
                    cfg.transport.timeout_ms = number(key, value);
                else if (key == "retry_backoff_ms")
                    cfg.transport.retry_backoff_ms = number(key, value);
                else if (key == "report_gap_ms")
                    cfg.transport.report_gap_ms = number(key, value);
                else if (key == "retries")
                    cfg.transport.retries = number(key, value);
            }
            // Unknown sections and keys are silently ignored
            continue;
        }

        throw std::runtime_error("Syntax error at line " + std::to_string(lineno) +
                                 ": " + line);
    }

    return cfg;
}

// -----------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------

void validate_config(const Config& cfg) {
    if (cfg.device.vendor_id == 0 || cfg.device.product_id == 0)
        throw std::runtime_error("vendor_id and product_id must be non-zero");

    if (cfg.device.led_count < 1 || cfg.device.led_count > SMARTDEVICE_MAX_LED_COUNT)
        throw std::runtime_error(
            "led_count must be 1-" + std::to_string(SMARTDEVICE_MAX_LED_COUNT) +
            " (got " + std::to_string(cfg.device.led_count) + ")");

    const SessionOptions& t = cfg.transport;
    if (t.timeout_ms < 1 || t.timeout_ms > 5000)
        throw std::runtime_error("timeout_ms must be 1-5000 (got " +
                                 std::to_string(t.timeout_ms) + ")");
    if (t.retry_backoff_ms > 1000)
        throw std::runtime_error("retry_backoff_ms must be at most 1000 (got " +
                                 std::to_string(t.retry_backoff_ms) + ")");
    if (t.report_gap_ms > 1000)
        throw std::runtime_error("report_gap_ms must be at most 1000 (got " +
                                 std::to_string(t.report_gap_ms) + ")");
    if (t.retries > 3)
        throw std::runtime_error("retries must be 0-3 (got " +
                                 std::to_string(t.retries) + ")");
}
