#pragma once

#include <ucfg/emit.h>
#include <ucfg/parser.h>
#include <optional>
#include <string>

namespace ucfg {

// Command line of the `ucfg` tool. Throws UsageError on unknown options,
// missing option values and unknown output formats.
class CliArgs {
  public:
    CliArgs(int argc, const char* argv[]);

    bool helpRequested() const { return help_; }
    const std::optional<std::string>& inputPath() const { return in_; }
    const std::optional<std::string>& outputPath() const { return out_; }
    const std::optional<std::string>& schemaPath() const { return schema_; }
    EmitMode format() const { return format_; }
    const ParserOptions& parserOptions() const { return options_; }
    bool verbose() const { return verbose_; }

    static std::string usage();

  private:
    bool help_ = false;
    std::optional<std::string> in_;
    std::optional<std::string> out_;
    std::optional<std::string> schema_;
    EmitMode format_ = EmitMode::Native;
    ParserOptions options_;
    bool verbose_ = false;
};

}  // namespace ucfg
