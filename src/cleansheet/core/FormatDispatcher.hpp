#pragma once

#include "cleansheet/core/Expected.hpp"
#include "cleansheet/core/Path.hpp"
#include "cleansheet/core/SanitizeOptions.hpp"
#include "cleansheet/core/Diagnostics.hpp"
#include "cleansheet/core/CSVProcessor.hpp"
#include "cleansheet/opc/FormatProfile.hpp"
#include "cleansheet/opc/ArchiveTranscoder.hpp"

namespace cleansheet {
namespace core {

enum class ExitSignal : int {
    Success = 0,
    Failure = 1
};

inline int toExitCode(ExitSignal signal) noexcept {
    return static_cast<int>(signal);
}

// 一次运行的结果汇总
struct RunReport {
    opc::FileFamily family = opc::FileFamily::Unsupported;
    opc::TranscodeStats archive;
    CSVSanitizeStats csv;
};

/**
 * @brief 按输入扩展名选择处理流程
 *
 * xlsx/xlsm 和 ods 走容器转写，csv 走行过滤，其他扩展名直接返回
 * UnsupportedType，不触碰文件系统。
 */
class FormatDispatcher {
public:
    FormatDispatcher(const SanitizeOptions& options, DiagnosticLog& diagnostics)
        : options_(options), diagnostics_(diagnostics) {}

    /**
     * @brief 执行清理并返回错误详情
     */
    VoidResult dispatch(const Path& input, const Path& output);

    /**
     * @brief 执行清理，记录结果并映射为退出信号
     */
    ExitSignal run(const Path& input, const Path& output);

    const RunReport& report() const { return report_; }

private:
    const SanitizeOptions& options_;
    DiagnosticLog& diagnostics_;
    RunReport report_;

    VoidResult transcodeContainer(const opc::FormatProfile& profile, const Path& input, const Path& output);
    VoidResult filterTabular(const Path& input, const Path& output);
};

}} // namespace cleansheet::core
