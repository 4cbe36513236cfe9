#include "cleansheet/CleanSheet.hpp"
#include "cleansheet/core/FormatDispatcher.hpp"
#include <iostream>

namespace cleansheet {

CLEANSHEET_API bool initialize(const LogSettings& settings) {
    try {
        Logger::getInstance().initialize(settings.log_file, settings.level, settings.enable_console);
        CLEANSHEET_LOG_DEBUG("CleanSheet {} initialized", getVersion());
        return true;
    } catch (const std::exception& e) {
        if (settings.enable_console) {
            std::cerr << "Failed to initialize CleanSheet: " << e.what() << std::endl;
        }
        return false;
    }
}

CLEANSHEET_API void cleanup() {
    Logger::getInstance().flush();
    Logger::getInstance().shutdown();
}

CLEANSHEET_API core::VoidResult sanitize(const core::Path& input,
                                         const core::Path& output,
                                         const core::SanitizeOptions& options,
                                         core::DiagnosticLog& diagnostics) {
    core::FormatDispatcher dispatcher(options, diagnostics);
    return dispatcher.dispatch(input, output);
}

CLEANSHEET_API core::VoidResult sanitize(const core::Path& input,
                                         const core::Path& output,
                                         const core::SanitizeOptions& options) {
    core::DiagnosticLog diagnostics;
    return sanitize(input, output, options, diagnostics);
}

} // namespace cleansheet
