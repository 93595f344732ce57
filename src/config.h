#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "protocol.h"
#include "session.h"

// Parsed representation of an INI configuration file.
// Missing keys keep the defaults below; values are range-checked by
// validate_config().
struct Config {
    // [device] section
    struct DeviceConfig {
        uint16_t    vendor_id  = SMARTDEVICE_VID;
        uint16_t    product_id = SMARTDEVICE_PID;
        std::size_t led_count  = SMARTDEVICE_LED_COUNT;
    } device;

    // [transport] section
    SessionOptions transport;
};

// Parse an INI config file from disk.
// Throws std::runtime_error if the file cannot be read or has bad values.
Config parse_config_file(const std::string& path);

// Validate a parsed Config and throw std::runtime_error if any value is out of range.
void validate_config(const Config& cfg);

// Parse "255,0,0" or "#ff0000" into a Color.
// Returns false if the string is not a colour; channels above 255 are
// reported by make_color() as an EncodingError.
bool parse_color(const std::string& s, Color& out);

// Parse a decimal or 0x-prefixed hexadecimal USB id
bool parse_usb_id(const std::string& s, uint16_t& out);
