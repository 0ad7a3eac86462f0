#include "plate_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace parking {

std::string PlateNormalizer::normalize(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (unsigned char c : raw) {
        const char up = static_cast<char>(std::toupper(c));
        if ((up >= 'A' && up <= 'Z') || (up >= '0' && up <= '9')) {
            out.push_back(up);
        }
    }
    return out;
}

std::size_t PlateNormalizer::edit_distance(const std::string& a, const std::string& b) {
    // Keep the shorter string on the inner loop so the rows stay small
    const std::string& longer = a.size() >= b.size() ? a : b;
    const std::string& shorter = a.size() >= b.size() ? b : a;

    if (shorter.empty()) return longer.size();

    std::vector<std::size_t> prev(shorter.size() + 1);
    std::vector<std::size_t> curr(shorter.size() + 1);
    for (std::size_t j = 0; j <= shorter.size(); ++j) prev[j] = j;

    for (std::size_t i = 0; i < longer.size(); ++i) {
        curr[0] = i + 1;
        for (std::size_t j = 0; j < shorter.size(); ++j) {
            const std::size_t insertion = prev[j + 1] + 1;
            const std::size_t deletion = curr[j] + 1;
            const std::size_t substitution = prev[j] + (longer[i] == shorter[j] ? 0 : 1);
            curr[j + 1] = std::min({insertion, deletion, substitution});
        }
        std::swap(prev, curr);
    }
    return prev[shorter.size()];
}

bool PlateNormalizer::fuzzy_equals(const std::string& a, const std::string& b) {
    const std::string na = normalize(a);
    const std::string nb = normalize(b);
    if (na.empty() || nb.empty()) return false;
    if (na == nb) return true;

    // Lengths differing by 2+ can never be within distance 1
    const std::size_t len_gap = na.size() > nb.size() ? na.size() - nb.size() : nb.size() - na.size();
    if (len_gap >= kFuzzyThreshold) return false;

    return edit_distance(na, nb) < kFuzzyThreshold;
}

std::string PlateNormalizer::clean_ocr_text(const std::string& raw) {
    return normalize(raw);
}

} // namespace parking
