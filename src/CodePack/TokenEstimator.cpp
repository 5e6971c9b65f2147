// =================================================================
// src/CodePack/TokenEstimator.cpp
// =================================================================
// Implementation for the byte-ratio token estimate.

#include "CodePack/TokenEstimator.hpp"
#include "CodePack/Logger.hpp"
#include <filesystem>
#include <stdexcept>
#include <cstdio>

namespace CodePack {

namespace fs = std::filesystem;

TokenEstimate TokenEstimator::estimate(const std::vector<std::string>& file_paths) {
    if (file_paths.empty()) {
        throw std::invalid_argument("No files selected for token estimation");
    }

    TokenEstimate result;
    for (const auto& path : file_paths) {
        std::error_code ec;
        auto size = fs::file_size(path, ec);
        if (ec) {
            LOG_DEBUG("TokenEstimator", "Cannot stat " + path, ec.message());
            continue;
        }
        result.total_bytes += static_cast<size_t>(size);
    }
    result.tokens = estimateTokens(result.total_bytes);
    return result;
}

size_t TokenEstimator::estimateTokens(size_t total_bytes) {
    return (total_bytes + BYTES_PER_TOKEN - 1) / BYTES_PER_TOKEN;
}

std::string TokenEstimator::formatTokens(size_t tokens) {
    char buffer[32];
    if (tokens >= 1000000) {
        std::snprintf(buffer, sizeof(buffer), "%.1fM", static_cast<double>(tokens) / 1000000.0);
    } else if (tokens >= 1000) {
        std::snprintf(buffer, sizeof(buffer), "%.1fK", static_cast<double>(tokens) / 1000.0);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%zu", tokens);
    }
    return buffer;
}

TokenWarning TokenEstimator::warningFor(size_t tokens) {
    if (tokens > CONTEXT_THRESHOLD) {
        return TokenWarning::ExceedsContext;
    }
    if (tokens > LARGE_THRESHOLD) {
        return TokenWarning::Large;
    }
    return TokenWarning::None;
}

std::string TokenEstimator::warningMessage(TokenWarning warning) {
    switch (warning) {
        case TokenWarning::Large:
            return "Large selection: more than 32K tokens";
        case TokenWarning::ExceedsContext:
            return "Selection exceeds 128K tokens and may not fit a model context window";
        default:
            return "";
    }
}

} // namespace CodePack
