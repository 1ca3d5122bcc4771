/**
 * @file AttributeParser.hpp
 * @brief Regex/keyword extraction of item attributes from OCR and speech text.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/AuctionInfo.hpp"
#include "domain/CardIdentity.hpp"
#include "domain/Transcript.hpp"

namespace bidlens::domain {

/**
 * @class AttributeParser
 * @brief Stateless parsing rules shared by the text and speech channels.
 */
class AttributeParser {
public:
    /** @brief Full parse of recognized on-screen text. */
    static CardAttributes ParseCardAttributes(const std::string& text);

    /** @brief Parse of a transcript: grade/year/set/rookie plus a spoken price. */
    static SpokenAttributes ParseSpokenAttributes(const std::string& transcript);

    /** @brief +0.4 grade, +0.2 year, +0.2 set, +0.2 spoken price, capped at 1. */
    static double ScoreSpokenConfidence(const SpokenAttributes& attributes);

    /** @brief Current bid, timer and bid count from the price/timer region. */
    static AuctionInfo ParseAuctionInfo(const std::string& text);

    /** @brief Name 0.4, year 0.2, grade 0.2, active bid 0.2, capped at 1. */
    static double DetectionConfidence(const CardAttributes& attributes, const AuctionInfo& auction);

    /** @brief 4-digit year in 1950..2029, or empty. */
    static std::string ExtractYear(const std::string& text);

    /**
     * @brief "PSA 10", "BGS 9.5", "SGC 8" (case-insensitive, one decimal max).
     * @param companyOut Receives the uppercased grading company.
     * @return Normalized grade string, or empty.
     */
    static std::string ExtractGrade(const std::string& text, std::string& companyOut);

    static std::string ExtractItemNumber(const std::string& text);
    static bool HasRookieKeyword(const std::string& text);

    /** @brief First known set name, expanded to the surrounding word boundaries. */
    static std::string ExtractSetName(const std::string& text);

    /** @brief "First Last" or "F. Last", skipping grading/brand/auction words. */
    static std::string ExtractName(const std::string& text);

    /** @brief First number that is neither a year nor part of a grade. */
    static std::optional<double> ExtractSpokenPrice(const std::string& text);
};

} // namespace bidlens::domain
