#include "config/CommandLine.hpp"
#include "util/UnicodeUtils.hpp"
#include <charconv>

namespace tether::config {

namespace {

bool to_int(const std::string& text, int& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

}  // namespace

CommandLine parse_command_line(const std::vector<std::string>& args) {
    CommandLine cli;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto has_values = [&](size_t count) { return i + count < args.size(); };

        if (arg == "-h" || arg == "--help") {
            cli.mode = RunMode::Help;
        }
        else if (arg == "--list") {
            cli.mode = RunMode::List;
        }
        else if (arg == "--write-config") {
            cli.mode = RunMode::WriteConfig;
        }
        else if (arg == "--calibrate") {
            if (!has_values(1)) { cli.error = "--calibrate needs a window title"; return cli; }
            cli.mode = RunMode::Calibrate;
            cli.calibrate_title = args[++i];
        }
        else if (arg == "--offset") {
            if (!has_values(2)) { cli.error = "--offset needs DX and DY"; return cli; }
            model::Offset offset;
            if (!to_int(args[i + 1], offset.dx) || !to_int(args[i + 2], offset.dy)) {
                cli.error = "--offset values must be integers";
                return cli;
            }
            cli.offset = offset;
            i += 2;
        }
        else if (arg == "--interval") {
            if (!has_values(1)) { cli.error = "--interval needs milliseconds"; return cli; }
            int ms = 0;
            if (!to_int(args[i + 1], ms) || ms < ConfigLoader::MIN_POLL_INTERVAL_MS) {
                cli.error = "--interval must be a positive integer";
                return cli;
            }
            cli.poll_interval_ms = ms;
            ++i;
        }
        else if (arg == "--config") {
            if (!has_values(1)) { cli.error = "--config needs a path"; return cli; }
            cli.config_path = std::filesystem::path(args[++i]);
        }
        else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            cli.error = "unknown option " + arg;
            return cli;
        }
        else if (!cli.target_title) {
            cli.target_title = arg;
        }
        else {
            cli.error = "unexpected argument " + arg;
            return cli;
        }
    }

    return cli;
}

void apply_overrides(Config& cfg, const CommandLine& cli) {
    if (cli.target_title) cfg.target_title = tether::util::trim_whitespace(*cli.target_title);
    if (cli.offset) cfg.offset = *cli.offset;
    if (cli.poll_interval_ms) cfg.poll_interval_ms = *cli.poll_interval_ms;
}

std::string usage_text() {
    return
        "Usage: tether [TITLE] [options]\n"
        "\n"
        "Keeps an overlay glued to the window titled TITLE.\n"
        "\n"
        "  --offset DX DY       overlay position relative to the target's top-right corner\n"
        "  --interval MS        polling interval in milliseconds\n"
        "  --config PATH        read settings from PATH\n"
        "  --list               print visible top-level windows and exit\n"
        "  --calibrate TITLE    print the offset of window TITLE from the target and exit\n"
        "  --write-config       write the current settings to the config file and exit\n"
        "  -h, --help           show this help\n";
}

}  // namespace tether::config
