/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMDECODE_LMDECODE_LOGGER_H
#define LMSHAO_LMDECODE_LMDECODE_LOGGER_H

#include <lmcore/logger.h>

namespace lmshao::lmdecode {

// Module tag for Lmdecode
struct LmdecodeModuleTag {};

/**
 * @brief Initialize Lmdecode logger with specified settings
 */
inline void InitLmdecodeLogger(lmcore::LogLevel level =
#if defined(_DEBUG) || defined(DEBUG) || !defined(NDEBUG)
                                   lmcore::LogLevel::kDebug,
#else
                                   lmcore::LogLevel::kWarn,
#endif
                               lmcore::LogOutput output = lmcore::LogOutput::CONSOLE,
                               const std::string &filename = "")
{
    lmcore::LoggerRegistry::RegisterModule<LmdecodeModuleTag>("LMDECODE");
    lmcore::LoggerRegistry::InitLogger<LmdecodeModuleTag>(level, output, filename);
}

} // namespace lmshao::lmdecode

#endif // LMSHAO_LMDECODE_LMDECODE_LOGGER_H
