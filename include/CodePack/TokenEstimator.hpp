// =================================================================
// include/CodePack/TokenEstimator.hpp
// =================================================================
// Header for the byte-ratio token estimate of a selection.

#pragma once

#include "CodePack/Types.hpp"
#include <string>
#include <vector>

namespace CodePack {

enum class TokenWarning {
    None,
    Large,           ///< Above LARGE_THRESHOLD
    ExceedsContext   ///< Above CONTEXT_THRESHOLD
};

/**
 * @brief Estimates LLM tokens as one token per four bytes, rounded up
 */
class TokenEstimator {
public:
    static const size_t BYTES_PER_TOKEN = 4;
    static const size_t LARGE_THRESHOLD = 32000;
    static const size_t CONTEXT_THRESHOLD = 128000;

    /**
     * @brief Estimate the selection size
     *
     * Throws std::invalid_argument for an empty list. Unreadable paths count
     * as zero bytes.
     */
    static TokenEstimate estimate(const std::vector<std::string>& file_paths);

    static size_t estimateTokens(size_t total_bytes);

    /**
     * @brief Human form: "500", "1.5K", "2.3M"
     */
    static std::string formatTokens(size_t tokens);

    static TokenWarning warningFor(size_t tokens);

    /**
     * @brief Message for a warning level; empty for TokenWarning::None
     */
    static std::string warningMessage(TokenWarning warning);
};

} // namespace CodePack
