/**
 * @file TitleSimilarity.hpp
 * @brief Token-order-insensitive string similarity for listing titles.
 */

#pragma once
#include <set>
#include <string>

namespace bidlens::domain {

/**
 * @class TitleSimilarity
 * @brief Token-set ratio in [0, 1].
 *
 * Both strings are lowercased and split on non-alphanumerics. With I the sorted
 * intersection and D1/D2 the sorted differences, the score is the best
 * normalized Indel similarity among (I, I+D1), (I, I+D2) and (I+D1, I+D2).
 * A title that contains every query token therefore scores 1.
 */
class TitleSimilarity {
public:
    static double TokenSetRatio(const std::string& a, const std::string& b);

    /** @brief 1 - indel_distance / (|a| + |b|); 1 for two empty strings. */
    static double Ratio(const std::string& a, const std::string& b);

    static std::set<std::string> Tokenize(const std::string& text);
};

} // namespace bidlens::domain
