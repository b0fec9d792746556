/**
 * @file config.hpp
 * @brief soodlink command line configuration and parsing
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#include "soodlink/core/sood_codec.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace soodlink {
namespace app {

/**
 * @brief What the executable should do
 */
enum class Command {
    DISCOVER,   ///< Run one discovery round and list servers
    SAVED,      ///< Show the saved server
    FORGET,     ///< Clear the saved token
    RESET       ///< Delete the saved configuration file
};

inline const char* commandToString(Command command) {
    switch (command) {
        case Command::DISCOVER: return "discover";
        case Command::SAVED: return "saved";
        case Command::FORGET: return "forget";
        case Command::RESET: return "reset";
        default: return "unknown";
    }
}

/**
 * @brief CLI configuration structure
 */
struct Config {
    Command command = Command::DISCOVER;
    int64_t timeout_ms = 5000;                          ///< Discovery round length
    std::string mcast_addr = core::sood::kDefaultMulticastGroup;
    std::string bcast_addr = core::sood::kDefaultBroadcastAddress;
    uint16_t port = core::sood::kDefaultPort;           ///< SOOD port
    std::string bind_addr = "0.0.0.0";
    int multicast_ttl = 1;
    std::string config_path;                            ///< Empty = platform default
    std::string log_level = "INFO";
    std::string log_file;                               ///< Empty = stderr
    bool help = false;
    std::string error;                                  ///< Set when parsing failed
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name, std::ostream& out = std::cout) {
    out << "SoodLink - music server discovery and pairing client\n\n"
        << "Usage: " << program_name << " [OPTIONS] [COMMAND]\n\n"
        << "Commands:\n"
        << "  discover              Find servers on the local network (default)\n"
        << "  saved                 Show the saved server\n"
        << "  forget                Forget the saved authorization token\n"
        << "  reset                 Delete the saved configuration\n"
        << "\nDiscovery Options:\n"
        << "  --timeout <ms>        Discovery round length (default: 5000)\n"
        << "  --mcast-addr <addr>   Multicast group to query (default: 239.255.90.90)\n"
        << "  --bcast-addr <addr>   Broadcast address to query (default: 255.255.255.255)\n"
        << "  --port <port>         SOOD port (default: 9003)\n"
        << "  --bind <addr>         Local bind address (default: 0.0.0.0)\n"
        << "  --ttl <n>             Multicast TTL (default: 1)\n"
        << "\nGeneral Options:\n"
        << "  --config <path>       Saved server file (default: ~/.config/soodlink/config.json)\n"
        << "  --log-level <level>   Log level: TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: INFO)\n"
        << "  --log-file <path>     Append log output to a file instead of stderr\n"
        << "\n  --help, -h            Show this help message\n\n"
        << "Example:\n"
        << "  " << program_name << " --timeout 3000\n"
        << "  " << program_name << " --log-level DEBUG saved\n";
}

namespace detail {

inline bool parseUnsigned(const char* text, uint64_t max, uint64_t& out) {
    if (text == nullptr || *text == '\0' || *text == '-' || *text == '+') {
        return false;
    }
    try {
        size_t consumed = 0;
        unsigned long long value = std::stoull(text, &consumed, 10);
        if (text[consumed] != '\0' || value > max) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

// Every option other than --help takes a value
inline bool isKnownOption(const char* arg) {
    static const char* const kOptions[] = {
        "--timeout", "--mcast-addr", "--bcast-addr", "--port", "--bind",
        "--ttl", "--config", "--log-level", "--log-file",
    };
    for (const char* option : kOptions) {
        if (std::strcmp(arg, option) == 0) {
            return true;
        }
    }
    return false;
}

}  // namespace detail

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; on bad input help is set and error explains why
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;
    bool haveCommand = false;

    auto fail = [&config](const std::string& message) {
        config.error = message;
        config.help = true;
        return config;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Positional command
        if (arg[0] != '-') {
            if (haveCommand) {
                return fail(std::string("Unexpected argument ") + arg);
            }
            if (std::strcmp(arg, "discover") == 0) {
                config.command = Command::DISCOVER;
            } else if (std::strcmp(arg, "saved") == 0) {
                config.command = Command::SAVED;
            } else if (std::strcmp(arg, "forget") == 0) {
                config.command = Command::FORGET;
            } else if (std::strcmp(arg, "reset") == 0) {
                config.command = Command::RESET;
            } else {
                return fail(std::string("Unknown command ") + arg);
            }
            haveCommand = true;
            continue;
        }

        if (!detail::isKnownOption(arg)) {
            return fail(std::string("Unknown option ") + arg);
        }
        if (i + 1 >= argc) {
            return fail(std::string("Option ") + arg + " requires a value");
        }

        const char* value = argv[++i];
        uint64_t number = 0;

        if (std::strcmp(arg, "--timeout") == 0) {
            if (!detail::parseUnsigned(value, 3600000, number)) {
                return fail(std::string("Invalid timeout ") + value);
            }
            config.timeout_ms = static_cast<int64_t>(number);
        } else if (std::strcmp(arg, "--mcast-addr") == 0) {
            config.mcast_addr = value;
        } else if (std::strcmp(arg, "--bcast-addr") == 0) {
            config.bcast_addr = value;
        } else if (std::strcmp(arg, "--port") == 0) {
            if (!detail::parseUnsigned(value, 65535, number) || number == 0) {
                return fail(std::string("Invalid port ") + value);
            }
            config.port = static_cast<uint16_t>(number);
        } else if (std::strcmp(arg, "--bind") == 0) {
            config.bind_addr = value;
        } else if (std::strcmp(arg, "--ttl") == 0) {
            if (!detail::parseUnsigned(value, 255, number)) {
                return fail(std::string("Invalid TTL ") + value);
            }
            config.multicast_ttl = static_cast<int>(number);
        } else if (std::strcmp(arg, "--config") == 0) {
            config.config_path = value;
        } else if (std::strcmp(arg, "--log-level") == 0) {
            config.log_level = value;
        } else if (std::strcmp(arg, "--log-file") == 0) {
            config.log_file = value;
        }
    }

    return config;
}

}  // namespace app
}  // namespace soodlink
