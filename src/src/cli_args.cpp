#include <ucfg/cli_args.h>
#include <ucfg/cli_utils.h>
#include <ucfg/errors.h>
#include <string>
#include <vector>

namespace ucfg {

CliArgs::CliArgs(int argc, const char* argv[]) {
    static const std::vector<std::string> valid_options = {
        "--help", "-h",
        "--in", "-i",
        "--out", "-o",
        "--schema", "-s",
        "--format", "-f",
        "--lowercase-keys",
        "--no-suffixes",
        "--verbose", "-v"
    };

    auto require_value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw UsageError(flag + " requires an argument");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" or arg == "-h") {
            help_ = true;
        } else if (arg == "--in" or arg == "-i") {
            in_ = require_value(i, arg);
        } else if (arg == "--out" or arg == "-o") {
            out_ = require_value(i, arg);
        } else if (arg == "--schema" or arg == "-s") {
            schema_ = require_value(i, arg);
        } else if (arg == "--format" or arg == "-f") {
            format_ = emit_mode_from_string(require_value(i, arg));
        } else if (arg == "--lowercase-keys") {
            options_.lowercase_keys = true;
        } else if (arg == "--no-suffixes") {
            options_.number_suffixes = false;
        } else if (arg == "--verbose" or arg == "-v") {
            verbose_ = true;
        } else {
            throw UsageError(cli_utils::unknown_option_message(arg, valid_options));
        }
    }
}

std::string CliArgs::usage() {
    return "usage: ucfg [--help] [-i|--in file] [-o|--out file] [-s|--schema file]\n"
           "            [-f|--format ucl|json|compact_json|yaml] [--lowercase-keys]\n"
           "            [--no-suffixes] [--verbose]\n"
           "\n"
           "Reads a configuration from --in (default: standard input) and writes it\n"
           "to --out (default: standard output) in the selected format.\n";
}

}  // namespace ucfg
