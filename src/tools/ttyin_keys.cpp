/**
 * ttyin_keys - Interactive Key Reader
 *
 * Puts the terminal in raw mode and prints every decoded KeyPress, one per
 * line. Handy for checking what a terminal sends for a given key.
 *
 * Exit with Ctrl+D, or Ctrl+C twice in a row.
 */

#include "input/errors.hpp"
#include "input/input_factory.hpp"
#include "input/typeahead.hpp"
#include "platform/wait.hpp"

#include <cstddef>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace ttyin;

namespace {

struct ToolOptions {
    input::InputOptions input;
    bool cooked = false;
    bool verbose = false;
};

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [options]\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  --cooked         Keep the terminal in cooked mode\n";
    std::cerr << "  --prefer-tty     Read from stdout/stderr if stdin is redirected\n";
    std::cerr << "  --timeout <ms>   Escape flush timeout (default 50)\n";
    std::cerr << "  --verbose        Show raw bytes and escape flushes on stderr\n";
    std::cerr << "  --help           Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  TTYIN_ALWAYS_PREFER_TTY, TTYIN_ESCAPE_TIMEOUT_MS\n";
}

/**
 * @return 0 to continue, 1 for --help, -1 on a usage error
 */
int parseArgs(int argc, char* argv[], ToolOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return 1;
        } else if (arg == "--cooked") {
            opts.cooked = true;
        } else if (arg == "--prefer-tty") {
            opts.input.alwaysPreferTty = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--timeout") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --timeout needs a value\n";
                return -1;
            }
            try {
                opts.input.escapeTimeoutMs = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid timeout: " << argv[i] << "\n";
                return -1;
            }
            if (opts.input.escapeTimeoutMs < 0) {
                std::cerr << "Error: timeout must not be negative\n";
                return -1;
            }
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return -1;
        }
    }
    return 0;
}

void printKeys(const input::KeyPressList& keys) {
    for (const auto& key : keys) {
        std::cout << key << "\n";
    }
    std::cout.flush();
}

// "1b 5b 41" for ESC [ A
std::string hexBytes(const std::string& data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < data.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        oss << std::setw(2) << static_cast<unsigned>(static_cast<unsigned char>(data[i]));
    }
    return oss.str();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    ToolOptions opts;
    opts.input = input::InputOptions::fromEnvironment();

    int parsed = parseArgs(argc, argv, opts);
    if (parsed != 0) {
        printUsage(argv[0]);
        return parsed > 0 ? 0 : 2;
    }

    try {
        auto source = input::createInput(opts.input);

        if (!input::isTerminal(source->fileNo())) {
            std::cerr << "Warning: input is not a terminal\n";
        }

        auto mode = opts.cooked ? source->cookedMode() : source->rawMode();

        std::cerr << "Press keys to see their decoding. "
                  << "Ctrl+D or Ctrl+C twice to exit.\n";

        bool sawInterrupt = false;
        bool done = false;
        input::KeyPressList leftover;

        while (!done && !source->closed()) {
            auto ready = platform::waitForHandles({source->fileNo()},
                                                  opts.input.escapeTimeoutMs);

            input::KeyPressList keys;
            if (ready) {
                keys = source->readKeys();
            } else {
                keys = source->flushKeys();
                if (opts.verbose && !keys.empty()) {
                    std::cerr << "[flushed " << keys.size() << " key(s) after "
                              << opts.input.escapeTimeoutMs << "ms]\n";
                }
            }

            for (size_t i = 0; i < keys.size(); ++i) {
                const auto& key = keys[i];
                std::cout << key << "\n";
                if (opts.verbose) {
                    std::cerr << "  [" << key.data().size() << " byte(s): "
                              << hexBytes(key.data()) << "]\n";
                }

                if (key.key() == input::KeySymbol::CONTROL_D) {
                    leftover.assign(keys.begin() + static_cast<std::ptrdiff_t>(i) + 1, keys.end());
                    done = true;
                    break;
                }
                if (key.key() == input::KeySymbol::CONTROL_C) {
                    if (sawInterrupt) {
                        leftover.assign(keys.begin() + static_cast<std::ptrdiff_t>(i) + 1, keys.end());
                        done = true;
                        break;
                    }
                    sawInterrupt = true;
                } else {
                    sawInterrupt = false;
                }
            }
            std::cout.flush();
        }

        // Keys typed after the exit key belong to whoever reads next
        input::TypeaheadStore::store(*source, leftover);
        if (opts.verbose && input::TypeaheadStore::hasTypeahead(*source)) {
            std::cerr << "[" << leftover.size() << " key(s) left as typeahead]\n";
            printKeys(input::TypeaheadStore::get(*source));
        }

        mode->restore();
    } catch (const input::InputError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
