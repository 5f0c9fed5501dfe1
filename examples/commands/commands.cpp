#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <variant>
#include <unistd.h>
#include <readline/history.h>
#include <readline/readline.h>
#include "scan/scan.hpp"

// =============================================================================
// ANSI color schemes, enabled only for terminals
// =============================================================================

namespace color {

namespace ansi {
    inline constexpr const char* reset  = "\033[0m";
    inline constexpr const char* bold   = "\033[1m";
    inline constexpr const char* red    = "\033[31m";
    inline constexpr const char* green  = "\033[32m";
    inline constexpr const char* yellow = "\033[33m";
    inline constexpr const char* bright_white = "\033[97m";
} // namespace ansi

struct scheme_t {
    const char* reset   = ansi::reset;
    const char* value   = ansi::bright_white;
    const char* info    = ansi::green;
    const char* warning = ansi::yellow;
    const char* error   = ansi::red;
    const char* header  = ansi::bold;
};

inline auto enabled() -> scheme_t { return scheme_t{}; }
inline auto disabled() -> scheme_t {
    return scheme_t{"", "", "", "", "", ""};
}

inline auto is_tty(std::ostream& os) -> bool {
    if (&os == &std::cout) return isatty(STDOUT_FILENO) != 0;
    if (&os == &std::cerr) return isatty(STDERR_FILENO) != 0;
    return false;
}

inline auto for_stream(std::ostream& os) -> scheme_t {
    return is_tty(os) ? enabled() : disabled();
}

} // namespace color

// =============================================================================
// Command enum: Q | Help | Size w h | Color c
// =============================================================================

struct quit_t {};
struct help_t {};

struct resize_t {
    std::size_t width = 0;
    std::size_t height = 0;
};

inline auto fields(resize_t& r) {
    return std::make_tuple(
        scan::field("width", r.width),
        scan::field("height", r.height)
    );
}

using command_t = std::variant<quit_t, help_t, resize_t, std::uint8_t>;

inline auto variants(std::type_identity<command_t>) {
    return std::make_tuple(
        scan::alternative<quit_t>("Q"),
        scan::alternative<help_t>("Help"),
        scan::alternative<resize_t>("Size"),
        scan::alternative<std::uint8_t>("Color")
    );
}

// =============================================================================
// Session state
// =============================================================================

struct canvas_t {
    std::size_t width = 80;
    std::size_t height = 24;
    std::uint8_t color = 7;
};

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };

static void print_help(std::ostream& os, const color::scheme_t& c) {
    os << c.header << "Commands:" << c.reset << "\n"
       << "  Q            quit\n"
       << "  Help         show this message\n"
       << "  Size <w> <h> resize the canvas\n"
       << "  Color <c>    set the color index (0-255)\n";
}

// Apply one command; returns false when the session should end
static auto apply(canvas_t& canvas, const command_t& cmd, std::ostream& os, const color::scheme_t& c) -> bool {
    return std::visit(overloaded{
        [&](const quit_t&) {
            return false;
        },
        [&](const help_t&) {
            print_help(os, c);
            return true;
        },
        [&](const resize_t& r) {
            canvas.width = r.width;
            canvas.height = r.height;
            os << c.info << "size" << c.reset << " = "
               << c.value << canvas.width << "x" << canvas.height << c.reset << "\n";
            return true;
        },
        [&](std::uint8_t index) {
            canvas.color = index;
            os << c.info << "color" << c.reset << " = "
               << c.value << static_cast<int>(canvas.color) << c.reset << "\n";
            return true;
        },
    }, cmd);
}

static void report(const scan::scan_error& e, std::ostream& os, const color::scheme_t& c) {
    os << c.error << e.what() << c.reset << "\n";

    if (e.kind() == scan::error_kind::unknown_variant) {
        os << c.warning << "known commands:" << c.reset;
        for (const auto& name : e.known_variants()) {
            os << " " << name;
        }
        os << "\n";
    }
}

// =============================================================================
// Command line
// =============================================================================

static auto parse_options(int argc, char* argv[]) -> scan::options {
    auto opts = scan::options{};

    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view(argv[i]);
        if (arg == "--variant-match" && i + 1 < argc) {
            opts.variant_matching = scan::from_str<scan::variant_match>(argv[++i]);
        } else {
            throw std::runtime_error("unknown argument: " + std::string(arg));
        }
    }
    return opts;
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    auto err_colors = color::for_stream(std::cerr);
    auto out_colors = color::for_stream(std::cout);
    auto opts = scan::options{};

    try {
        opts = parse_options(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << err_colors.error << "error" << err_colors.reset << ": " << e.what() << "\n";
        std::cerr << "Usage: " << argv[0] << " [--variant-match exact|ignore_case]\n";
        return 1;
    }

    auto is_interactive = isatty(STDIN_FILENO) != 0;
    FILE* null_stream = nullptr;

    if (!is_interactive) {
        null_stream = std::fopen("/dev/null", "w");
        rl_outstream = null_stream;
    }

    auto canvas = canvas_t{};
    auto prompt = is_interactive ? "> " : "";

    if (is_interactive) {
        std::cout << "variant matching: " << to_string(opts.variant_matching) << "\n";
        print_help(std::cout, out_colors);
    }

    while (true) {
        auto* line = readline(prompt);
        if (!line) {
            if (is_interactive) std::cout << "\n";
            break;
        }

        auto input = std::string{line};
        std::free(line);

        if (input.empty() || input[0] == '#') continue;
        if (is_interactive) add_history(input.c_str());

        try {
            auto cmd = scan::from_str<command_t>(input, opts);
            if (!apply(canvas, cmd, std::cout, out_colors)) break;
        } catch (const scan::scan_error& e) {
            report(e, std::cerr, err_colors);
        }
    }

    if (null_stream) {
        std::fclose(null_stream);
    }
    return 0;
}
