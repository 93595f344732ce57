#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.h"
#include "errors.h"
#include "program.h"
#include "protocol.h"
#include "session.h"
#include "usb.h"

// -----------------------------------------------------------------------
// Version
// -----------------------------------------------------------------------
static constexpr const char* VERSION = "1.0.0";

// -----------------------------------------------------------------------
// Help text
// -----------------------------------------------------------------------
static void print_help(const char* prog) {
    std::cout <<
R"(Usage: )" << prog << R"( [OPTIONS] EFFECT [COLOR ...]

Control NZXT Smart Device (H500i/H700i) leds on Linux.

COLOR is "R,G,B" (e.g. 255,0,0) or "#RRGGBB".

Options:
  -h, --help               Show this help and exit
  -V, --version            Show version and exit
  --list-effects           Print all effects with their flags and exit

  -c, --config FILE        Read device and transport settings from an INI file
  --vid HEX                Override the USB vendor id  (default 1e71)
  --pid HEX                Override the USB product id (default 1714)
  --led-count N            Number of leds on the strip (default 20)

  --speed N                Animation speed 0-4 (default 2, animated effects only)
  --slowest, --slow, --fast, --fastest
                           Shorthands for --speed
  --backward               Play the animation backwards (some effects only)
  --size N                 Led row length 3-6 (marquee, alternating)
  --moving                 Move the rows (alternating only)

  -n, --dry-run            Print the packets instead of sending them
  -v, --verbose            Hex-dump every packet before it is sent

Examples:
  smartdevice-ctl fixed 255,0,0
  smartdevice-ctl breathing 255,0,0 0,255,0 0,0,255 --slow
  smartdevice-ctl marquee "#00ffff" --size 5 --backward
  smartdevice-ctl alternating 255,0,0 0,0,255 --moving
  smartdevice-ctl custom_fixed 255,0,0 0,255,0 0,0,255
  smartdevice-ctl off

Note: Run as root or install a udev rule for non-root access, e.g.
  SUBSYSTEM=="usb", ATTRS{idVendor}=="1e71", ATTRS{idProduct}=="1714", MODE="0666"
)";
}

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_help(argv[0]);
        return 0;
    }

    // ---- option definitions ----
    struct option long_opts[] = {
        {"help",         no_argument,       nullptr, 'h'},
        {"version",      no_argument,       nullptr, 'V'},
        {"config",       required_argument, nullptr, 'c'},
        {"dry-run",      no_argument,       nullptr, 'n'},
        {"verbose",      no_argument,       nullptr, 'v'},
        {"list-effects", no_argument,       nullptr, 1001},
        {"vid",          required_argument, nullptr, 1002},
        {"pid",          required_argument, nullptr, 1003},
        {"led-count",    required_argument, nullptr, 1004},
        {"speed",        required_argument, nullptr, 1005},
        {"slowest",      no_argument,       nullptr, 1006},
        {"slow",         no_argument,       nullptr, 1007},
        {"fast",         no_argument,       nullptr, 1008},
        {"fastest",      no_argument,       nullptr, 1009},
        {"backward",     no_argument,       nullptr, 1010},
        {"size",         required_argument, nullptr, 1011},
        {"moving",       no_argument,       nullptr, 1012},
        {nullptr, 0, nullptr, 0}
    };

    // ---- collect requested operations ----
    std::string    config_file;
    bool           dry_run   = false;
    bool           verbose   = false;
    bool           speed_set = false;
    int            vid_arg   = -1;  // -1 = not set
    int            pid_arg   = -1;
    long           led_count_arg = -1;
    ProgramOptions opts;

    auto set_speed = [&](Speed s) -> bool {
        if (speed_set) {
            std::cerr << "Error: only one speed option may be given\n";
            return false;
        }
        opts.speed = s;
        speed_set  = true;
        return true;
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "hVc:nv", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'h':
            print_help(argv[0]);
            return 0;

        case 'V':
            std::cout << "smartdevice-ctl " << VERSION << "\n";
            return 0;

        case 'c':
            config_file = optarg;
            break;

        case 'n':
            dry_run = true;
            break;

        case 'v':
            verbose = true;
            break;

        case 1001:  // --list-effects
            list_programs();
            return 0;

        case 1002:    // --vid HEX
        case 1003: {  // --pid HEX
            uint16_t id = 0;
            std::string arg = optarg;
            if (arg.rfind("0x", 0) != 0 && arg.rfind("0X", 0) != 0)
                arg = "0x" + arg;
            if (!parse_usb_id(arg, id)) {
                std::cerr << "Error: invalid USB id '" << optarg << "' (expect hex, e.g. 1e71)\n";
                return 1;
            }
            (opt == 1002 ? vid_arg : pid_arg) = id;
            break;
        }

        case 1004:  // --led-count N
            try {
                led_count_arg = std::stol(optarg);
                if (led_count_arg < 1 ||
                    led_count_arg > static_cast<long>(SMARTDEVICE_MAX_LED_COUNT)) {
                    std::cerr << "Error: --led-count must be 1-"
                              << SMARTDEVICE_MAX_LED_COUNT << "\n";
                    return 1;
                }
            } catch (const std::logic_error&) {
                std::cerr << "Error: invalid --led-count argument\n";
                return 1;
            }
            break;

        case 1005:  // --speed N
            try {
                int s = std::stoi(optarg);
                if (s < 0 || s > 4) {
                    std::cerr << "Error: --speed must be 0-4\n";
                    return 1;
                }
                if (!set_speed(static_cast<Speed>(s))) return 1;
            } catch (const std::logic_error&) {
                std::cerr << "Error: invalid --speed argument\n";
                return 1;
            }
            break;

        case 1006: if (!set_speed(Speed::Slowest)) return 1; break;
        case 1007: if (!set_speed(Speed::Slow))    return 1; break;
        case 1008: if (!set_speed(Speed::Fast))    return 1; break;
        case 1009: if (!set_speed(Speed::Fastest)) return 1; break;

        case 1010:  // --backward
            opts.direction = Direction::Backward;
            break;

        case 1011:  // --size N
            try {
                int n = std::stoi(optarg);
                if (n < MIN_GROUP_SIZE || n > MAX_GROUP_SIZE) {
                    std::cerr << "Error: --size must be 3, 4, 5 or 6\n";
                    return 1;
                }
                opts.size = static_cast<uint8_t>(n);
            } catch (const std::logic_error&) {
                std::cerr << "Error: invalid --size argument\n";
                return 1;
            }
            break;

        case 1012:  // --moving
            opts.moving = true;
            break;

        default:
            std::cerr << "Use --help for usage.\n";
            return 1;
        }
    }

    // ---- positional: EFFECT [COLOR ...] ----
    if (optind >= argc) {
        std::cerr << "Error: no effect given. Use --list-effects to see them.\n";
        return 1;
    }
    std::string effect = argv[optind++];
    if (!is_program_name(effect)) {
        std::cerr << "Error: unknown effect '" << effect
                  << "'. Use --list-effects to see them.\n";
        return 1;
    }

    std::vector<Color> colors;
    for (; optind < argc; ++optind) {
        Color c;
        try {
            if (!parse_color(argv[optind], c)) {
                std::cerr << "Error: invalid color '" << argv[optind]
                          << "' (expect R,G,B or #RRGGBB)\n";
                return 1;
            }
        } catch (const EncodingError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
        colors.push_back(c);
    }

    // ---- settings: defaults < config file < command line ----
    Config cfg;
    try {
        if (!config_file.empty())
            cfg = parse_config_file(config_file);
        if (vid_arg >= 0)       cfg.device.vendor_id  = static_cast<uint16_t>(vid_arg);
        if (pid_arg >= 0)       cfg.device.product_id = static_cast<uint16_t>(pid_arg);
        if (led_count_arg >= 0) cfg.device.led_count  = static_cast<std::size_t>(led_count_arg);
        validate_config(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // ---- build and encode the program ----
    std::vector<CommandPacket> packets;
    try {
        packets = encode_program(build_program(effect, colors, opts, cfg.device.led_count),
                                 cfg.device.led_count);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    auto step_label = [&](size_t i) {
        return "step " + std::to_string(i + 1) + "/" + std::to_string(packets.size());
    };

    if (dry_run) {
        for (size_t i = 0; i < packets.size(); ++i)
            hexdump_packet(packets[i], step_label(i));
        return 0;
    }

    // ---- open device and send ----
    const std::string id = format_usb_id(cfg.device.vendor_id, cfg.device.product_id);
    try {
        DeviceSession session(cfg.transport);

        std::cout << "Opening Smart Device (" << id << ")...\n";
        session.open(cfg.device.vendor_id, cfg.device.product_id);
        std::cout << "Connected.\n";

        std::cout << "=== " << effect << " (" << packets.size() << " step"
                  << (packets.size() == 1 ? "" : "s") << ") ===\n";
        if (verbose) {
            for (size_t i = 0; i < packets.size(); ++i)
                hexdump_packet(packets[i], step_label(i));
        }
        run_program(session, packets);

        session.close();
        std::cout << "Done.\n";
    } catch (const DevicePermissionError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Hint: add a udev rule for " << id << " (see --help).\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
