//
// apng-delay: rewrite the frame delays of animated PNG files in place.
//

#include <apng/exceptions.hh>
#include <apng/retime.hh>

#include <charconv>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

    struct settings {
        std::optional<std::uint16_t> delay;
        bool verbose = false;
        bool verify = false;
        std::vector<std::string> files;
    };

    void usage(const char* prog, std::ostream& os) {
        os << "USAGE " << prog << " [options] <file>...\n"
           << "  -d, --delay NUM   Sets the new delay numerator of every frame (0-65535)\n"
           << "  -v, --verbose     Print every chunk visited and every record written\n"
           << "      --verify      Check chunk CRCs while reading\n"
           << "  -h, --help        Show this help\n"
           << "The original of each file is kept as <file>.bak and every run starts from it.\n";
    }

    std::optional<std::uint16_t> parse_delay(std::string_view text) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size() || value > 0xFFFF) {
            return std::nullopt;
        }
        return static_cast<std::uint16_t>(value);
    }

    // Returns an exit code on usage errors or --help
    std::optional<int> parse_args(int argc, char* argv[], settings& s) {
        for (int i = 1; i < argc; i++) {
            std::string_view arg = argv[i];
            std::optional<std::string_view> delay_text;

            if (arg == "-h" || arg == "--help") {
                usage(argv[0], std::cout);
                return 0;
            } else if (arg == "-v" || arg == "--verbose") {
                s.verbose = true;
            } else if (arg == "--verify") {
                s.verify = true;
            } else if (arg == "-d" || arg == "--delay") {
                if (i + 1 >= argc) {
                    std::cerr << "Option " << arg << " requires a value\n";
                    return 2;
                }
                delay_text = argv[++i];
            } else if (arg.substr(0, 8) == "--delay=") {
                delay_text = arg.substr(8);
            } else if (arg.size() > 1 && arg[0] == '-') {
                std::cerr << "Unknown option " << arg << "\n";
                usage(argv[0], std::cerr);
                return 2;
            } else {
                s.files.emplace_back(arg);
            }

            if (delay_text) {
                s.delay = parse_delay(*delay_text);
                if (!s.delay) {
                    std::cerr << "Invalid delay '" << *delay_text << "': expected an integer in 0-65535\n";
                    return 2;
                }
            }
        }

        if (s.files.empty()) {
            usage(argv[0], std::cerr);
            return 2;
        }
        return std::nullopt;
    }

    apng::retime_options make_options(const settings& s) {
        apng::retime_options options;
        options.walk.verify_checksums = s.verify;
        options.patch.delay = s.delay;
        options.on_message = [](std::string_view message) {
            std::cout << message << std::endl;
        };

        if (s.verbose) {
            options.walk.on_chunk = [](std::uint64_t offset, const apng::fourcc& tag, std::uint32_t length) {
                std::cout << "CHUNK: " << tag << " at " << offset << ", " << length << " bytes" << std::endl;
            };
            options.walk.on_header = [](const apng::record& r) {
                std::cout << "HEADER: " << r << std::endl;
            };
            options.walk.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
                std::cerr << "WARNING [" << category << "] at " << offset << ": " << message << std::endl;
            };
            options.patch.on_write = [](std::uint64_t offset, const apng::record& r) {
                std::cout << "GOTO: " << offset << std::endl;
                std::cout << "WRITE: " << r << std::endl;
            };
        }
        return options;
    }
}

int main(int argc, char* argv[]) {
    settings s;
    if (auto code = parse_args(argc, argv, s)) {
        return *code;
    }

    auto options = make_options(s);
    int status = 0;

    for (const auto& file : s.files) {
        try {
            auto result = apng::retime_file(file, options);
            std::cout << file << ": " << result.frames << " frame(s) rewritten" << std::endl;
        } catch (const apng::apng_error& e) {
            std::cerr << file << ": " << e.what() << std::endl;
            status = 1;
        } catch (const std::exception& e) {
            std::cerr << file << ": unexpected error: " << e.what() << std::endl;
            status = 1;
        }
    }

    return status;
}
