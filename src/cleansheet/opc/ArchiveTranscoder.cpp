#include "cleansheet/opc/ArchiveTranscoder.hpp"
#include "cleansheet/opc/EntryTransformer.hpp"
#include "cleansheet/archive/ZipReader.hpp"
#include "cleansheet/archive/ZipWriter.hpp"
#include "cleansheet/utils/ModuleLoggers.hpp"
#include "cleansheet/utils/TempFile.hpp"
#include <fmt/format.h>

namespace cleansheet {
namespace opc {

namespace {

core::Error zipFailure(archive::ZipError error, const std::string& message, const std::string& context) {
    return core::makeError(ArchiveTranscoder::toErrorCode(error),
                           fmt::format("{}: {}", message, archive::toString(error)), context);
}

} // namespace

core::ErrorCode ArchiveTranscoder::toErrorCode(archive::ZipError error) noexcept {
    switch (error) {
        case archive::ZipError::Ok:
            return core::ErrorCode::Ok;
        case archive::ZipError::FileNotFound:
            return core::ErrorCode::NotFound;
        case archive::ZipError::BadFormat:
        case archive::ZipError::CrcMismatch:
        case archive::ZipError::TooLarge:
        case archive::ZipError::EndOfEntries:
            return core::ErrorCode::Corrupt;
        case archive::ZipError::IoFail:
        case archive::ZipError::CompressionFail:
            return core::ErrorCode::IoFailure;
        case archive::ZipError::InvalidParameter:
            return core::ErrorCode::InvalidArgument;
        case archive::ZipError::NotOpen:
        case archive::ZipError::InternalError:
            return core::ErrorCode::InternalError;
    }
    return core::ErrorCode::InternalError;
}

core::Result<TranscodeStats> ArchiveTranscoder::transcode(const core::Path& source, const core::Path& dest) {
    if (!source.exists()) {
        return core::makeError(core::ErrorCode::NotFound,
                               fmt::format("Input file '{}' not found", source.string()));
    }
    if (dest.exists() && !options_.overwrite) {
        return core::makeError(core::ErrorCode::AlreadyExists,
                               fmt::format("Output file '{}' already exists. Use --overwrite to replace it.",
                                           dest.string()));
    }

    archive::ZipReader reader(source);
    archive::ZipError err = reader.open();
    if (err != archive::ZipError::Ok) {
        if (err == archive::ZipError::FileNotFound) {
            return core::makeError(core::ErrorCode::NotFound,
                                   fmt::format("Input file '{}' not found", source.string()));
        }
        return zipFailure(err, fmt::format("Input file '{}' is not a valid {} container",
                                           source.string(), toString(profile_.family)),
                          source.string());
    }

    utils::TempFile temp(dest);
    archive::ZipWriter writer(temp.path());
    if (!writer.open()) {
        return core::makeError(core::ErrorCode::IoFailure,
                               fmt::format("Cannot create output file '{}'", temp.path().string()));
    }

    OPC_INFO("Transcoding {} -> {}", source.string(), dest.string());

    EntryTransformer transformer(options_, profile_, diagnostics_);
    TranscodeStats stats;

    err = reader.gotoFirstEntry();
    while (err == archive::ZipError::Ok) {
        auto processed = processEntry(reader, writer, transformer, stats);
        if (!processed) {
            writer.abandon();
            return processed.error();
        }
        err = reader.gotoNextEntry();
    }
    if (err != archive::ZipError::EndOfEntries) {
        writer.abandon();
        return zipFailure(err, "Cannot walk the central directory", source.string());
    }

    if (!writer.close()) {
        return core::makeError(core::ErrorCode::IoFailure,
                               fmt::format("Failed to finalize output file '{}'", temp.path().string()));
    }
    reader.close();

    if (!temp.commitTo(dest)) {
        return core::makeError(core::ErrorCode::IoFailure,
                               fmt::format("Cannot move '{}' to '{}'", temp.path().string(), dest.string()));
    }

    OPC_DEBUG("Wrote {} entries ({} copied, {} replaced, {} dropped)",
              stats.total_entries - stats.dropped, stats.copied, stats.replaced, stats.dropped);
    return stats;
}

core::VoidResult ArchiveTranscoder::processEntry(archive::ZipReader& reader,
                                                 archive::ZipWriter& writer,
                                                 const EntryTransformer& transformer,
                                                 TranscodeStats& stats) {
    archive::ZipReader::EntryInfo info;
    archive::ZipError err = reader.currentEntryInfo(info);
    if (err != archive::ZipError::Ok) {
        return zipFailure(err, "Cannot read entry header", reader.getPath().string());
    }
    stats.total_entries++;

    if (!info.is_directory && transformer.isTarget(info.path)) {
        std::vector<uint8_t> data;
        err = reader.readCurrentEntry(data);
        if (err != archive::ZipError::Ok) {
            return zipFailure(err, fmt::format("Cannot read entry {}", info.path), reader.getPath().string());
        }

        TransformOutcome outcome = transformer.transform(info.path, data);
        switch (outcome.action) {
            case TransformAction::Drop:
                stats.dropped++;
                return core::success();

            case TransformAction::Replace:
                err = writer.addEntry(info, outcome.bytes.data(), outcome.bytes.size());
                if (err != archive::ZipError::Ok) {
                    return zipFailure(err, fmt::format("Cannot write entry {}", info.path), writer.getPath().string());
                }
                stats.replaced++;
                stats.nodes_removed += outcome.nodes_removed;
                return core::success();

            case TransformAction::Unchanged:
                break;
        }
    } else if (options_.verify_entries && !info.is_directory) {
        err = reader.verifyCurrentEntry();
        if (err != archive::ZipError::Ok) {
            return zipFailure(err, fmt::format("Entry {} failed verification", info.path), reader.getPath().string());
        }
    }

    err = writer.copyFromReader(reader);
    if (err != archive::ZipError::Ok) {
        return zipFailure(err, fmt::format("Cannot copy entry {}", info.path), writer.getPath().string());
    }
    stats.copied++;
    return core::success();
}

}} // namespace cleansheet::opc
