#pragma once

#include <jr/parser.h>
#include <string>

namespace jr {

// Command-line arguments of the jerry tool. Throws std::invalid_argument on
// unknown flags, missing flag values or a missing input file.
class CliArgs {
  public:
    enum class Action {
        HELP,    // Show help message
        PRINT,   // Parse and pretty-print the file (default)
        TOKENS   // Print the token stream only
    };

    CliArgs(int argc, const char* argv[]);

    Action getAction() const { return action_; }
    // "-" means standard input
    const std::string& getFilePath() const { return filePath_; }
    int getIndent() const { return indent_; }
    bool isVerbose() const { return verbose_; }
    const ParserOptions& getParserOptions() const { return parserOptions_; }

  private:
    Action action_ = Action::PRINT;
    std::string filePath_;
    int indent_ = 2;
    bool verbose_ = false;
    ParserOptions parserOptions_;
};

}  // namespace jr
