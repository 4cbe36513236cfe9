#include "cleansheet/CleanSheet.hpp"
#include "cleansheet/core/FormatDispatcher.hpp"
#include "cleansheet/utils/ModuleLoggers.hpp"
#include "cli/CliParser.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    using namespace cleansheet;

    CLI::App app{"cleansheet: sanitizes spreadsheet files by removing macros and hidden sheets."};
    cli::CliSettings settings;
    cli::setupCliParser(app, settings);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli::exitCodeFor(app, e);
    }

    if (!initialize(settings.log)) {
        return core::toExitCode(core::ExitSignal::Failure);
    }

    core::ExitSignal exit_signal = core::ExitSignal::Failure;
    try {
        core::DiagnosticLog diagnostics;
        core::FormatDispatcher dispatcher(settings.options, diagnostics);
        exit_signal = dispatcher.run(core::Path(settings.input_file), core::Path(settings.output_file));
    } catch (const std::exception& e) {
        CLI_ERROR("An unexpected error occurred: {}", e.what());
        exit_signal = core::ExitSignal::Failure;
    }

    cleanup();
    return core::toExitCode(exit_signal);
}
