#include "domain/TitleSimilarity.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <vector>

namespace bidlens::domain {

namespace {

std::string Join(const std::set<std::string>& tokens) {
    std::string out;
    for (const auto& token : tokens) {
        if (!out.empty()) out += " ";
        out += token;
    }
    return out;
}

std::string Concat(const std::string& head, const std::string& tail) {
    if (head.empty()) return tail;
    if (tail.empty()) return head;
    return head + " " + tail;
}

std::size_t LongestCommonSubsequence(const std::string& a, const std::string& b) {
    std::vector<std::size_t> prev(b.size() + 1, 0);
    std::vector<std::size_t> curr(b.size() + 1, 0);
    for (std::size_t i = 1; i <= a.size(); ++i) {
        for (std::size_t j = 1; j <= b.size(); ++j) {
            curr[j] = a[i - 1] == b[j - 1] ? prev[j - 1] + 1 : std::max(prev[j], curr[j - 1]);
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

} // namespace

std::set<std::string> TitleSimilarity::Tokenize(const std::string& text) {
    std::set<std::string> tokens;
    std::string current;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.insert(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.insert(current);
    return tokens;
}

double TitleSimilarity::Ratio(const std::string& a, const std::string& b) {
    const std::size_t total = a.size() + b.size();
    if (total == 0) return 1.0;
    const std::size_t lcs = LongestCommonSubsequence(a, b);
    return static_cast<double>(2 * lcs) / static_cast<double>(total);
}

double TitleSimilarity::TokenSetRatio(const std::string& a, const std::string& b) {
    const auto tokensA = Tokenize(a);
    const auto tokensB = Tokenize(b);
    if (tokensA.empty() || tokensB.empty()) return 0.0;

    std::set<std::string> common;
    std::set<std::string> onlyA;
    std::set<std::string> onlyB;
    std::set_intersection(tokensA.begin(), tokensA.end(), tokensB.begin(), tokensB.end(),
                          std::inserter(common, common.end()));
    std::set_difference(tokensA.begin(), tokensA.end(), tokensB.begin(), tokensB.end(),
                        std::inserter(onlyA, onlyA.end()));
    std::set_difference(tokensB.begin(), tokensB.end(), tokensA.begin(), tokensA.end(),
                        std::inserter(onlyB, onlyB.end()));

    const std::string intersection = Join(common);
    const std::string combinedA = Concat(intersection, Join(onlyA));
    const std::string combinedB = Concat(intersection, Join(onlyB));

    double best = Ratio(combinedA, combinedB);
    if (!intersection.empty()) {
        best = std::max({best, Ratio(intersection, combinedA), Ratio(intersection, combinedB)});
    }
    return best;
}

} // namespace bidlens::domain
