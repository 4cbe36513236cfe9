#pragma once

#include "cleansheet/CleanSheet.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace cleansheet {
namespace cli {

struct CliSettings {
    std::string input_file;
    std::string output_file;
    core::SanitizeOptions options;
    LogSettings log;
    bool quiet = false;
    bool no_verify = false;
};

/**
 * @brief 注册命令行参数，解析后由 app.callback 把开关折算进 options/log
 */
void setupCliParser(CLI::App& app, CliSettings& settings);

/**
 * @brief CLI11 的退出码折算：帮助和版本为 0，其余解析错误为 1
 */
int exitCodeFor(CLI::App& app, const CLI::ParseError& error);

}} // namespace cleansheet::cli
