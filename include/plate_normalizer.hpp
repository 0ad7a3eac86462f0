#pragma once

#include <cstddef>
#include <string>

/**
 * @file plate_normalizer.hpp
 * @brief License plate canonicalization and OCR-tolerant comparison.
 *
 * Driver-registered plates and sensor-read plates are compared through the
 * same normalized key, with a small edit-distance allowance for OCR noise.
 */

namespace parking {

/**
 * @brief Plate identity helpers. Stateless; all members are pure functions.
 */
class PlateNormalizer {
public:
    /**
     * @brief Largest edit distance still treated as the same plate, plus one.
     *
     * A pair of normalized plates matches iff distance < kFuzzyThreshold.
     */
    static constexpr std::size_t kFuzzyThreshold = 2;

    /**
     * @brief Canonicalizes a free-text plate.
     *
     * @param raw Plate as typed by a driver or read by OCR (e.g. "abc-123 ").
     * @return Upper-cased plate with everything outside [A-Z0-9] removed ("ABC123").
     *         Empty input yields an empty string.
     */
    static std::string normalize(const std::string& raw);

    /**
     * @brief Levenshtein distance (insert / delete / substitute, unit costs).
     *
     * @details Operates on the strings exactly as given; callers normalize first.
     * Uses a two-row dynamic programming table, O(|a|*|b|) time.
     */
    static std::size_t edit_distance(const std::string& a, const std::string& b);

    /**
     * @brief OCR-tolerant plate comparison.
     *
     * @return True iff both normalized plates are non-empty and either equal or
     *         within edit distance 1 of each other.
     *
     * @note An empty normalized plate never matches anything, so an unreadable
     *       OCR result can never be attributed to a vehicle.
     */
    static bool fuzzy_equals(const std::string& a, const std::string& b);

    /**
     * @brief Cleans raw OCR output before it is used as plate evidence.
     *
     * Same character filter as normalize(); kept separate so OCR-specific
     * cleanup can diverge from driver input normalization.
     */
    static std::string clean_ocr_text(const std::string& raw);
};

} // namespace parking
