#include "domain/AttributeParser.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <unordered_set>
#include <vector>

namespace bidlens::domain {

namespace {

const std::vector<std::string> kKnownSets = {
    "topps", "panini", "bowman", "prizm", "select", "optic",
    "donruss", "upper deck", "fleer", "mosaic", "chronicles"
};

// Words that look like names on an auction overlay but never are.
const std::unordered_set<std::string> kNameStopWords = {
    "psa", "bgs", "sgc", "card", "cards", "lot", "bid", "bids", "time", "rookie",
    "auto", "autograph", "topps", "panini", "bowman", "prizm", "select", "optic",
    "donruss", "upper", "deck", "fleer", "mosaic", "chronicles", "chrome", "refractor",
    "gem", "mint", "base", "parallel", "live", "sold", "buy", "now", "current",
    "starting", "auction", "grade", "graded", "shipping", "giveaway", "break", "box"
};

const std::regex kYearRe(R"(\b(19[5-9]\d|20[0-2]\d)\b)");
const std::regex kGradeRe(R"(\b(PSA|BGS|SGC)\s*(\d{1,2}(?:\.\d)?)\b)", std::regex::icase);
const std::regex kItemNumberRe(R"(#\s*([A-Za-z0-9]+(?:-[A-Za-z0-9]+)?))");
const std::regex kRookieRe(R"(\b(rookie|rc)\b)", std::regex::icase);
const std::regex kSpokenNumberRe(R"(\$?\b(\d{1,4}(?:\.\d{2})?)\b)");
const std::regex kYearLikeRe(R"(^(19|20)\d{2}$)");
const std::regex kBidRe(R"(\$\s*(\d+(?:,\d{3})*(?:\.\d{2})?))");
const std::regex kTimeRe(R"((\d+:\d{2}|\b\d+[hms]\b))");
const std::regex kBidCountRe(R"((\d+)\s*bids?\b)", std::regex::icase);

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

std::string StripPunctuation(const std::string& token) {
    size_t start = 0;
    size_t end = token.size();
    while (start < end && !IsWordChar(token[start])) ++start;
    while (end > start && !IsWordChar(token[end - 1]) && token[end - 1] != '.') --end;
    return token.substr(start, end - start);
}

bool IsCapitalizedWord(const std::string& token) {
    if (token.size() < 2) return false;
    if (!std::isupper(static_cast<unsigned char>(token[0]))) return false;
    bool hasLower = false;
    for (size_t i = 1; i < token.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(token[i]);
        if (std::islower(c)) {
            hasLower = true;
        } else if (c != '\'' && c != '-') {
            return false;
        }
    }
    return hasLower;
}

bool IsInitial(const std::string& token) {
    return token.size() == 2 && std::isupper(static_cast<unsigned char>(token[0])) && token[1] == '.';
}

bool IsStopWord(const std::string& token) {
    return kNameStopWords.count(ToLower(token)) > 0;
}

} // namespace

CardAttributes AttributeParser::ParseCardAttributes(const std::string& text) {
    CardAttributes attrs;
    if (text.empty()) return attrs;

    attrs.name = ExtractName(text);
    attrs.year = ExtractYear(text);
    attrs.grade = ExtractGrade(text, attrs.gradingCompany);
    attrs.itemNumber = ExtractItemNumber(text);
    attrs.rookie = HasRookieKeyword(text);
    attrs.setName = ExtractSetName(text);
    return attrs;
}

SpokenAttributes AttributeParser::ParseSpokenAttributes(const std::string& transcript) {
    SpokenAttributes attrs;
    if (transcript.empty()) return attrs;

    attrs.grade = ExtractGrade(transcript, attrs.gradingCompany);
    attrs.year = ExtractYear(transcript);
    attrs.setName = ExtractSetName(transcript);
    attrs.rookie = HasRookieKeyword(transcript);
    attrs.spokenPrice = ExtractSpokenPrice(transcript);
    return attrs;
}

double AttributeParser::ScoreSpokenConfidence(const SpokenAttributes& attributes) {
    double score = 0.0;
    if (!attributes.grade.empty()) score += 0.4;
    if (!attributes.year.empty()) score += 0.2;
    if (!attributes.setName.empty()) score += 0.2;
    if (attributes.spokenPrice) score += 0.2;
    return std::min(score, 1.0);
}

AuctionInfo AttributeParser::ParseAuctionInfo(const std::string& text) {
    AuctionInfo info;
    std::smatch match;

    if (std::regex_search(text, match, kBidRe)) {
        std::string digits = match[1].str();
        digits.erase(std::remove(digits.begin(), digits.end(), ','), digits.end());
        try {
            info.currentBid = std::stod(digits);
            info.bidSource = "ocr";
        } catch (const std::exception&) {
            info.currentBid = 0.0;
        }
    }

    if (std::regex_search(text, match, kTimeRe)) {
        info.timeRemaining = match[1].str();
    }

    if (std::regex_search(text, match, kBidCountRe)) {
        try {
            info.bidCount = std::stoi(match[1].str());
        } catch (const std::exception&) {
            info.bidCount = 0;
        }
    }
    return info;
}

double AttributeParser::DetectionConfidence(const CardAttributes& attributes, const AuctionInfo& auction) {
    double confidence = 0.0;
    if (!attributes.name.empty()) confidence += 0.4;
    if (!attributes.year.empty()) confidence += 0.2;
    if (!attributes.grade.empty()) confidence += 0.2;
    if (auction.hasActiveBid()) confidence += 0.2;
    return std::min(confidence, 1.0);
}

std::string AttributeParser::ExtractYear(const std::string& text) {
    std::smatch match;
    if (std::regex_search(text, match, kYearRe)) {
        return match[1].str();
    }
    return {};
}

std::string AttributeParser::ExtractGrade(const std::string& text, std::string& companyOut) {
    std::smatch match;
    if (std::regex_search(text, match, kGradeRe)) {
        companyOut = ToUpper(match[1].str());
        return companyOut + " " + match[2].str();
    }
    return {};
}

std::string AttributeParser::ExtractItemNumber(const std::string& text) {
    std::smatch match;
    if (std::regex_search(text, match, kItemNumberRe)) {
        return match[1].str();
    }
    return {};
}

bool AttributeParser::HasRookieKeyword(const std::string& text) {
    return std::regex_search(text, kRookieRe);
}

std::string AttributeParser::ExtractSetName(const std::string& text) {
    const std::string lower = ToLower(text);
    for (const auto& keyword : kKnownSets) {
        size_t pos = lower.find(keyword);
        if (pos == std::string::npos) continue;

        size_t start = pos;
        size_t end = pos + keyword.size();
        while (start > 0 && IsWordChar(text[start - 1])) --start;
        while (end < text.size() && IsWordChar(text[end])) ++end;
        return text.substr(start, end - start);
    }
    return {};
}

std::string AttributeParser::ExtractName(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream stream(text);
    std::string raw;
    while (stream >> raw) {
        std::string token = StripPunctuation(raw);
        if (!token.empty()) tokens.push_back(token);
    }

    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        const std::string& first = tokens[i];
        std::string second = tokens[i + 1];
        if (!second.empty() && second.back() == '.') second.pop_back();
        if (!IsCapitalizedWord(second) || IsStopWord(second)) continue;

        if (IsCapitalizedWord(first) && !IsStopWord(first)) {
            return first + " " + second;
        }
        if (IsInitial(first)) {
            return first + " " + second;
        }
    }
    return {};
}

std::optional<double> AttributeParser::ExtractSpokenPrice(const std::string& text) {
    // Spans of grade numbers ("psa 10") must not be read as prices.
    std::vector<std::pair<size_t, size_t>> gradeSpans;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), kGradeRe); it != std::sregex_iterator(); ++it) {
        size_t start = static_cast<size_t>(it->position(0));
        gradeSpans.emplace_back(start, start + static_cast<size_t>(it->length(0)));
    }

    for (auto it = std::sregex_iterator(text.begin(), text.end(), kSpokenNumberRe); it != std::sregex_iterator(); ++it) {
        const std::string number = (*it)[1].str();
        size_t numberPos = static_cast<size_t>(it->position(1));

        if (std::regex_match(number, kYearLikeRe)) continue;
        if (numberPos > 0 && text[numberPos - 1] == '#') continue;

        bool insideGrade = std::any_of(gradeSpans.begin(), gradeSpans.end(), [numberPos](const auto& span) {
            return numberPos >= span.first && numberPos < span.second;
        });
        if (insideGrade) continue;

        try {
            return std::stod(number);
        } catch (const std::exception&) {
            continue;
        }
    }
    return std::nullopt;
}

} // namespace bidlens::domain
