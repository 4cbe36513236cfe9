#include "cleansheet/core/FormatDispatcher.hpp"
#include "cleansheet/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace cleansheet {
namespace core {

VoidResult FormatDispatcher::dispatch(const Path& input, const Path& output) {
    report_ = RunReport{};
    report_.family = opc::classify(input);

    switch (report_.family) {
        case opc::FileFamily::SpreadsheetML:
            return transcodeContainer(opc::FormatProfile::spreadsheetML(), input, output);

        case opc::FileFamily::OpenDocument:
            if (options_.remove_macros) {
                diagnostics_.warning(ErrorCode::CapabilityUnsupported,
                                     "Macro removal is not supported for ODS files, macros are kept");
            }
            return transcodeContainer(opc::FormatProfile::openDocument(), input, output);

        case opc::FileFamily::Tabular:
            return filterTabular(input, output);

        case opc::FileFamily::Unsupported:
            return makeError(ErrorCode::UnsupportedType,
                             fmt::format("Unsupported file type '{}'", input.filename()),
                             "Supported: .xlsx, .xlsm, .ods, .csv");
    }
    return makeError(ErrorCode::InternalError, "Unhandled file family");
}

VoidResult FormatDispatcher::transcodeContainer(const opc::FormatProfile& profile,
                                                const Path& input, const Path& output) {
    opc::ArchiveTranscoder transcoder(options_, profile, diagnostics_);
    auto stats = transcoder.transcode(input, output);
    if (!stats) {
        return stats.error();
    }
    report_.archive = stats.value();
    return success();
}

VoidResult FormatDispatcher::filterTabular(const Path& input, const Path& output) {
    auto stats = sanitizeCSVFile(input, output, CSVOptions::standard(), options_.overwrite);
    if (!stats) {
        return stats.error();
    }
    report_.csv = stats.value();
    return success();
}

ExitSignal FormatDispatcher::run(const Path& input, const Path& output) {
    VoidResult result = dispatch(input, output);
    if (!result) {
        diagnostics_.error(result.error().code, result.error().fullMessage());
        CORE_ERROR("Sanitization of {} failed", input.string());
        return ExitSignal::Failure;
    }

    switch (report_.family) {
        case opc::FileFamily::SpreadsheetML:
        case opc::FileFamily::OpenDocument:
            CORE_INFO("Successfully sanitized {} file. Output: {} "
                      "(entries: {} copied, {} replaced, {} dropped; hidden nodes removed: {})",
                      opc::toString(report_.family), output.string(),
                      report_.archive.copied, report_.archive.replaced,
                      report_.archive.dropped, report_.archive.nodes_removed);
            break;
        case opc::FileFamily::Tabular:
            CORE_INFO("Successfully sanitized CSV file. Output: {} (rows: {} read, {} kept, {} dropped)",
                      output.string(), report_.csv.rows_read, report_.csv.rows_kept, report_.csv.rows_dropped);
            break;
        case opc::FileFamily::Unsupported:
            break;
    }
    return ExitSignal::Success;
}

}} // namespace cleansheet::core
