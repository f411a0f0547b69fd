// jerry - parse a JSON-like document and print it back as indented JSON

#include <jr/jerry.h>
#include <jr/cli_args.h>

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace {

std::string readInput(const std::string& path) {
    std::stringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file: " + path);
    }
    buffer << file.rdbuf();
    return buffer.str();
}

void showHelp() {
    std::cout << "jerry - parse a JSON-like document and pretty-print it\n\n";
    std::cout << "USAGE:\n";
    std::cout << "  jerry [options] <file>\n";
    std::cout << "  jerry [options] -          (read standard input)\n\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  --help, -h               Show this message\n";
    std::cout << "  --indent, -i <n>         Spaces per indentation level (default 2, 0 = compact)\n";
    std::cout << "  --tokens                 Print the token stream instead of the tree\n";
    std::cout << "  --strict-empty-object    Reject '{}' (empty objects)\n";
    std::cout << "  --verbose, -v            Report each stage on stderr\n\n";
    std::cout << "GRAMMAR:\n";
    std::cout << "  Objects, arrays, \"strings\" without escapes, non-negative integers\n";
    std::cout << "  and decimals. The document must be an object or an array.\n";
}

void logStage(bool enabled, const std::string& msg) {
    if (enabled) std::cerr << "jerry: " << msg << "\n";
}

void onInterrupt(int) { std::_Exit(0); }

}  // namespace

int main(int argc, const char* argv[]) {
    std::signal(SIGINT, onInterrupt);

    try {
        jr::CliArgs args(argc, argv);

        if (args.getAction() == jr::CliArgs::Action::HELP) {
            showHelp();
            return 0;
        }

        const bool verbose = args.isVerbose();
        std::string content = readInput(args.getFilePath());
        // end of input straight away on an interactive terminal
        if (content.empty() && args.getFilePath() == "-" && ::isatty(STDIN_FILENO)) {
            return 0;
        }
        logStage(verbose, "read " + std::to_string(content.size()) + " bytes from " + args.getFilePath());

        jr::Reader<char> chars(content);
        auto tokens = jr::tokenize(chars);
        if (!tokens) {
            std::cerr << "parse error: " << jr::format_error(content, tokens.error()) << "\n";
            return 1;
        }
        logStage(verbose, "tokenized " + std::to_string(tokens.value().size()) + " tokens");

        if (args.getAction() == jr::CliArgs::Action::TOKENS) {
            for (const auto& t : tokens.value()) {
                std::cout << t.offset() << "\t" << t.kindString() << "\t" << t.to_string() << "\n";
            }
            return 0;
        }

        jr::Reader<jr::Token> reader(tokens.value());
        auto tree = jr::parse(reader, args.getParserOptions());
        if (!tree) {
            std::cerr << "parse error: " << jr::format_error(content, tree.error()) << "\n";
            return 1;
        }
        logStage(verbose, "parsed " + tree.value().typeString() + " with " + std::to_string(tree.value().size()) +
                     " entries");

        std::cout << tree.value().dump(args.getIndent()) << "\n";
        return 0;
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n";
        std::cerr << "run 'jerry --help' for usage\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
}
