#pragma once

#include "cleansheet/core/Expected.hpp"
#include "cleansheet/core/Path.hpp"
#include "cleansheet/core/SanitizeOptions.hpp"
#include "cleansheet/core/Diagnostics.hpp"
#include "cleansheet/archive/ZipError.hpp"
#include "cleansheet/opc/FormatProfile.hpp"
#include <cstddef>
#include <string>

namespace cleansheet {

namespace archive {
    class ZipReader;
    class ZipWriter;
}

namespace opc {

class EntryTransformer;

struct TranscodeStats {
    size_t total_entries = 0;
    size_t copied = 0;
    size_t replaced = 0;
    size_t dropped = 0;
    size_t nodes_removed = 0;
};

/**
 * @brief 容器转写器
 *
 * 按中央目录顺序把源容器的每个条目写入新容器：
 * 需要处理的条目交给 EntryTransformer，其余条目连同压缩数据和元数据原样搬运。
 *
 * 输出先写到目标旁边的临时文件，全部条目成功并完成中央目录后才改名为目标路径；
 * 任何失败都会删除临时文件，已存在的目标文件保持不变。
 *
 * ```cpp
 * core::DiagnosticLog diagnostics;
 * opc::ArchiveTranscoder transcoder(options, opc::FormatProfile::spreadsheetML(), diagnostics);
 * auto stats = transcoder.transcode(core::Path("in.xlsx"), core::Path("out.xlsx"));
 * ```
 */
class ArchiveTranscoder {
public:
    ArchiveTranscoder(const core::SanitizeOptions& options,
                      const FormatProfile& profile,
                      core::DiagnosticLog& diagnostics)
        : options_(options), profile_(profile), diagnostics_(diagnostics) {}

    /**
     * @return NotFound 源文件不存在；AlreadyExists 目标已存在且未允许覆盖；
     *         Corrupt 源容器损坏或 CRC 不符；IoFailure 写入或改名失败
     */
    core::Result<TranscodeStats> transcode(const core::Path& source, const core::Path& dest);

    /**
     * @brief ZipError 到运行错误码的映射
     */
    static core::ErrorCode toErrorCode(archive::ZipError error) noexcept;

private:
    const core::SanitizeOptions& options_;
    const FormatProfile& profile_;
    core::DiagnosticLog& diagnostics_;

    core::VoidResult processEntry(archive::ZipReader& reader,
                                  archive::ZipWriter& writer,
                                  const EntryTransformer& transformer,
                                  TranscodeStats& stats);
};

}} // namespace cleansheet::opc
