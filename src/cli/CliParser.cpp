#include "CliParser.hpp"
#include <map>

namespace cleansheet {
namespace cli {

void setupCliParser(CLI::App& app, CliSettings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", CLEANSHEET_VERSION_STRING);

    app.add_option("input_file", settings.input_file,
                   "The input spreadsheet file (xlsx, xlsm, ods or csv).")
        ->required();
    app.add_option("output_file", settings.output_file,
                   "The output sanitized spreadsheet file.")
        ->required();

    app.add_flag("--remove-macros", settings.options.remove_macros,
                 "Remove VBA macros (xlsx/xlsm only).");
    app.add_flag("--remove-hidden-sheets", settings.options.remove_hidden_sheets,
                 "Remove hidden sheets (xlsx) and hidden tables (ods).");
    app.add_flag("--overwrite", settings.options.overwrite,
                 "Overwrite the output file if it exists.");
    app.add_flag("--no-verify", settings.no_verify,
                 "Skip CRC verification of entries copied verbatim.");
    app.add_flag("-q,--quiet", settings.quiet,
                 "No console logging.");

    app.add_option("--log-level", settings.log.level,
                   "Log level: trace, debug, info, warn, error.")
        ->default_str("info")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, Logger::Level>{
                {"trace", Logger::Level::TRACE},
                {"debug", Logger::Level::DEBUG},
                {"info", Logger::Level::INFO},
                {"warn", Logger::Level::WARN},
                {"error", Logger::Level::ERROR}
            }, CLI::ignore_case));

    app.add_option("--log-file", settings.log.log_file,
                   "Also write logs to PATH.");

    app.callback([&settings]() {
        settings.options.verify_entries = !settings.no_verify;
        settings.log.enable_console = !settings.quiet;
    });
}

int exitCodeFor(CLI::App& app, const CLI::ParseError& error) {
    int code = app.exit(error);
    return code == 0 ? 0 : 1;
}

}} // namespace cleansheet::cli
