/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_INTERNAL_LOGGER_H
#define LMSHAO_LMDECODE_INTERNAL_LOGGER_H

#include <mutex>

#include "lmdecode/lmdecode_logger.h"

namespace lmshao::lmdecode {

inline lmshao::lmcore::Logger &GetLmdecodeLoggerWithAutoInit()
{
    static std::once_flag initFlag;
    std::call_once(initFlag, []() {
        lmshao::lmcore::LoggerRegistry::RegisterModule<LmdecodeModuleTag>("LMDECODE");
        InitLmdecodeLogger();
    });
    return lmshao::lmcore::LoggerRegistry::GetLogger<LmdecodeModuleTag>();
}

#define LMDECODE_LOG_IMPL(level, fmt, ...)                                                                             \
    do {                                                                                                               \
        auto &logger = lmshao::lmdecode::GetLmdecodeLoggerWithAutoInit();                                              \
        if (logger.ShouldLog(level)) {                                                                                 \
            logger.LogWithModuleTag<lmshao::lmdecode::LmdecodeModuleTag>(level, __FILE__, __LINE__, __FUNCTION__, fmt, \
                                                                         ##__VA_ARGS__);                               \
        }                                                                                                              \
    } while (0)

#define LMDECODE_LOGD(fmt, ...) LMDECODE_LOG_IMPL(lmshao::lmcore::LogLevel::kDebug, fmt, ##__VA_ARGS__)
#define LMDECODE_LOGI(fmt, ...) LMDECODE_LOG_IMPL(lmshao::lmcore::LogLevel::kInfo, fmt, ##__VA_ARGS__)
#define LMDECODE_LOGW(fmt, ...) LMDECODE_LOG_IMPL(lmshao::lmcore::LogLevel::kWarn, fmt, ##__VA_ARGS__)
#define LMDECODE_LOGE(fmt, ...) LMDECODE_LOG_IMPL(lmshao::lmcore::LogLevel::kError, fmt, ##__VA_ARGS__)
#define LMDECODE_LOGF(fmt, ...) LMDECODE_LOG_IMPL(lmshao::lmcore::LogLevel::kFatal, fmt, ##__VA_ARGS__)

} // namespace lmshao::lmdecode

#endif // LMSHAO_LMDECODE_INTERNAL_LOGGER_H
