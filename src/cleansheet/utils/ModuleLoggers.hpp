#pragma once
#include "cleansheet/utils/Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    CLEANSHEET_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     CLEANSHEET_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     CLEANSHEET_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    CLEANSHEET_LOG_ERROR("[ERR][core] " __VA_ARGS__)
#define CORE_CRITICAL(...) CLEANSHEET_LOG_CRITICAL("[CRT][core] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)    CLEANSHEET_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_INFO(...)     CLEANSHEET_LOG_INFO("[INF][xml ] " __VA_ARGS__)
#define XML_WARN(...)     CLEANSHEET_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)    CLEANSHEET_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...)    CLEANSHEET_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)     CLEANSHEET_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)     CLEANSHEET_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...)    CLEANSHEET_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 容器包模块 (opc)
#define OPC_DEBUG(...)    CLEANSHEET_LOG_DEBUG("[DBG][opc ] " __VA_ARGS__)
#define OPC_INFO(...)     CLEANSHEET_LOG_INFO("[INF][opc ] " __VA_ARGS__)
#define OPC_WARN(...)     CLEANSHEET_LOG_WARN("[WRN][opc ] " __VA_ARGS__)
#define OPC_ERROR(...)    CLEANSHEET_LOG_ERROR("[ERR][opc ] " __VA_ARGS__)

// CSV 模块 (csv)
#define CSV_DEBUG(...)    CLEANSHEET_LOG_DEBUG("[DBG][csv ] " __VA_ARGS__)
#define CSV_INFO(...)     CLEANSHEET_LOG_INFO("[INF][csv ] " __VA_ARGS__)
#define CSV_WARN(...)     CLEANSHEET_LOG_WARN("[WRN][csv ] " __VA_ARGS__)
#define CSV_ERROR(...)    CLEANSHEET_LOG_ERROR("[ERR][csv ] " __VA_ARGS__)

// 命令行 (cli)
#define CLI_DEBUG(...)    CLEANSHEET_LOG_DEBUG("[DBG][cli ] " __VA_ARGS__)
#define CLI_INFO(...)     CLEANSHEET_LOG_INFO("[INF][cli ] " __VA_ARGS__)
#define CLI_WARN(...)     CLEANSHEET_LOG_WARN("[WRN][cli ] " __VA_ARGS__)
#define CLI_ERROR(...)    CLEANSHEET_LOG_ERROR("[ERR][cli ] " __VA_ARGS__)
