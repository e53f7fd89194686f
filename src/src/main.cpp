#include <ucfg/ucfg.h>
#include <ucfg/cli_args.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

namespace {
// sysexits.h values
constexpr int EXIT_USAGE = 64;
constexpr int EXIT_DATAERR = 65;
constexpr int EXIT_NOINPUT = 66;
constexpr int EXIT_SOFTWARE = 70;
constexpr int EXIT_CANTCREAT = 73;

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}
}

int main(int argc, const char* argv[]) {
    std::optional<ucfg::CliArgs> args;
    try {
        args.emplace(argc, argv);
    } catch (const ucfg::UsageError& e) {
        std::cerr << "error: " << e.what() << "\n" << ucfg::CliArgs::usage();
        return EXIT_USAGE;
    }

    if (args->helpRequested()) {
        std::cout << ucfg::CliArgs::usage();
        return 0;
    }
    const bool verbose = args->verbose();

    std::string content;
    std::string source = "<stdin>";
    if (args->inputPath()) {
        source = *args->inputPath();
        auto text = read_file(source);
        if (not text) {
            std::cerr << "error: cannot open file: " << source << "\n";
            return EXIT_NOINPUT;
        }
        content = std::move(*text);
    } else {
        content = read_stdin();
    }
    if (verbose) std::cerr << "ucfg: read " << content.size() << " bytes from " << source << "\n";

    try {
        auto tree = ucfg::load(content, args->parserOptions());
        if (verbose) std::cerr << "ucfg: parsed " << source << " as " << tree->typeString() << "\n";

        if (args->schemaPath()) {
            const std::string& schema_path = *args->schemaPath();
            auto schema_text = read_file(schema_path);
            if (not schema_text) {
                std::cerr << "error: cannot open schema: " << schema_path << "\n";
                return EXIT_NOINPUT;
            }
            auto schema = ucfg::parse(*schema_text, args->parserOptions());
            ucfg::validate(schema, *tree);
        }

        std::string out = *ucfg::dump(tree, args->format());
        if (out.empty() or out.back() != '\n') out.push_back('\n');
        if (verbose)
            std::cerr << "ucfg: emitting " << out.size() << " bytes as "
                      << ucfg::emit_mode_name(args->format()) << "\n";

        if (args->outputPath()) {
            std::ofstream out_file(*args->outputPath(), std::ios::binary);
            if (!out_file) {
                std::cerr << "error: cannot open output: " << *args->outputPath() << "\n";
                return EXIT_CANTCREAT;
            }
            out_file << out;
            if (!out_file) {
                std::cerr << "error: failed writing output: " << *args->outputPath() << "\n";
                return EXIT_CANTCREAT;
            }
        } else {
            std::cout << out;
        }
        return 0;
    } catch (const ucfg::ParseError& e) {
        std::cerr << "parse error: " << e.what() << "\n";
        return EXIT_DATAERR;
    } catch (const ucfg::NotImplementedError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return EXIT_SOFTWARE;
    } catch (const std::exception& e) {
        std::cerr << "internal error: " << e.what() << "\n";
        return EXIT_SOFTWARE;
    }
}
