/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#include "lmdecode/decode_types.h"

#include <utility>

namespace lmshao::lmdecode {

const char *ErrorCodeName(ErrorCode code)
{
    switch (code) {
        case ErrorCode::kOk:
            return "ok";
        case ErrorCode::kFileAccess:
            return "file access error";
        case ErrorCode::kEmptyOrTooSmallInput:
            return "empty or too small input";
        case ErrorCode::kContainerParse:
            return "container parse error";
        case ErrorCode::kDecodeFailed:
            return "decode failed";
        case ErrorCode::kMemoryLimitExceeded:
            return "memory limit exceeded";
        case ErrorCode::kCancelled:
            return "cancelled";
        case ErrorCode::kWorkerUnresponsive:
            return "worker unresponsive";
        case ErrorCode::kCapacityExceeded:
            return "capacity exceeded";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
    }
    return "unknown";
}

DecodeOutcome DecodeOutcome::Decoded(std::vector<float> samples, uint32_t sample_rate, uint32_t channels)
{
    DecodeOutcome out;
    out.kind = Kind::kDecoded;
    out.samples = std::move(samples);
    out.sample_rate = sample_rate;
    out.channels = channels;
    if (sample_rate > 0 && channels > 0) {
        out.duration_us = static_cast<uint64_t>(out.samples.size() / channels) * 1000000ULL / sample_rate;
    }
    return out;
}

DecodeOutcome DecodeOutcome::NeedMoreData()
{
    DecodeOutcome out;
    out.kind = Kind::kNeedMoreData;
    return out;
}

DecodeOutcome DecodeOutcome::Fatal(const std::string &error)
{
    DecodeOutcome out;
    out.kind = Kind::kFatal;
    out.error = error;
    return out;
}

} // namespace lmshao::lmdecode
