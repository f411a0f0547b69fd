#include <jr/cli_args.h>
#include <jr/cli_utils.h>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace jr {

namespace {
    int parse_indent(const std::string& text) {
        if (text.empty() or text.size() > 3) throw std::invalid_argument("--indent requires a number between 0 and 999");
        for (char c : text) {
            if (not std::isdigit(static_cast<unsigned char>(c)))
                throw std::invalid_argument("--indent requires a number between 0 and 999");
        }
        return std::stoi(text);
    }
}

CliArgs::CliArgs(int argc, const char* argv[]) {
    if (argc < 2) {
        action_ = Action::HELP;
        return;
    }

    // Valid options for error suggestions
    static const std::vector<std::string> valid_options = {
        "--help", "-h",
        "--indent", "-i",
        "--tokens",
        "--strict-empty-object",
        "--verbose", "-v"
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            action_ = Action::HELP;
            return;
        }
        else if (arg == "--indent" || arg == "-i") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--indent requires a value argument");
            }
            indent_ = parse_indent(argv[++i]);
        }
        else if (arg == "--tokens") {
            action_ = Action::TOKENS;
        }
        else if (arg == "--strict-empty-object") {
            parserOptions_.allow_empty_object = false;
        }
        else if (arg == "--verbose" || arg == "-v") {
            verbose_ = true;
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument(cli_utils::unknown_flag_error(arg, valid_options));
        }
        else if (!filePath_.empty()) {
            throw std::invalid_argument("Unexpected extra argument: " + arg);
        }
        else {
            filePath_ = arg;
        }
    }

    if (filePath_.empty()) {
        throw std::invalid_argument("Missing input file");
    }
}

}  // namespace jr
