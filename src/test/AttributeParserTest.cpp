#include <cassert>
#include <cmath>
#include <iostream>
#include "domain/AttributeParser.hpp"

using bidlens::domain::AttributeParser;

namespace {

bool Near(double a, double b) { return std::fabs(a - b) < 1e-9; }

void TestCardOverlay() {
    std::cout << "[Test] Card overlay text..." << std::endl;
    auto attrs = AttributeParser::ParseCardAttributes("2023 Topps Chrome Mike Trout PSA 10 #27 RC");
    assert(attrs.name == "Mike Trout");
    assert(attrs.year == "2023");
    assert(attrs.setName == "Topps");
    assert(attrs.grade == "PSA 10");
    assert(attrs.gradingCompany == "PSA");
    assert(attrs.itemNumber == "27");
    assert(attrs.rookie);
    std::cout << "[PASS] Card overlay text" << std::endl;
}

void TestLowercaseGradeAndInitials() {
    std::cout << "[Test] Lowercase grade and initials..." << std::endl;
    auto attrs = AttributeParser::ParseCardAttributes("bgs 9.5 J. Rodriguez 2021 Bowman");
    assert(attrs.grade == "BGS 9.5");
    assert(attrs.gradingCompany == "BGS");
    assert(attrs.name == "J. Rodriguez");
    assert(attrs.setName == "Bowman");
    assert(!attrs.rookie);
    std::cout << "[PASS] Lowercase grade and initials" << std::endl;
}

void TestNoName() {
    std::cout << "[Test] Overlay without a name..." << std::endl;
    auto attrs = AttributeParser::ParseCardAttributes("Current Bid $45 Topps Chrome");
    assert(attrs.name.empty());
    assert(AttributeParser::ParseCardAttributes("").name.empty());
    std::cout << "[PASS] Overlay without a name" << std::endl;
}

void TestSpokenAttributes() {
    std::cout << "[Test] Spoken attributes..." << std::endl;
    auto spoken = AttributeParser::ParseSpokenAttributes("this is a 2019 prizm rookie psa 9 we are at 45 dollars");
    assert(spoken.grade == "PSA 9");
    assert(spoken.year == "2019");
    assert(spoken.setName == "prizm");
    assert(spoken.rookie);
    assert(spoken.spokenPrice && Near(*spoken.spokenPrice, 45.0));
    assert(Near(AttributeParser::ScoreSpokenConfidence(spoken), 1.0));

    auto gradeOnly = AttributeParser::ParseSpokenAttributes("gem mint psa 10 card number #12");
    assert(gradeOnly.grade == "PSA 10");
    assert(!gradeOnly.spokenPrice);
    assert(Near(AttributeParser::ScoreSpokenConfidence(gradeOnly), 0.4));

    auto empty = AttributeParser::ParseSpokenAttributes("");
    assert(empty.empty());
    assert(Near(AttributeParser::ScoreSpokenConfidence(empty), 0.0));
    std::cout << "[PASS] Spoken attributes" << std::endl;
}

void TestAuctionPanel() {
    std::cout << "[Test] Auction panel..." << std::endl;
    auto info = AttributeParser::ParseAuctionInfo("Current Bid $1,250.00 0:45 12 bids");
    assert(Near(info.currentBid, 1250.0));
    assert(info.bidSource == "ocr");
    assert(info.timeRemaining == "0:45");
    assert(info.bidCount == 12);
    assert(info.hasActiveBid());

    auto none = AttributeParser::ParseAuctionInfo("Starting soon");
    assert(!none.hasActiveBid());
    assert(none.bidSource.empty());
    std::cout << "[PASS] Auction panel" << std::endl;
}

void TestDetectionConfidence() {
    std::cout << "[Test] Detection confidence..." << std::endl;
    bidlens::domain::CardAttributes attrs;
    bidlens::domain::AuctionInfo auction;
    assert(Near(AttributeParser::DetectionConfidence(attrs, auction), 0.0));
    attrs.name = "Mike Trout";
    attrs.year = "2023";
    attrs.grade = "PSA 10";
    auction.currentBid = 40.0;
    assert(Near(AttributeParser::DetectionConfidence(attrs, auction), 1.0));
    std::cout << "[PASS] Detection confidence" << std::endl;
}

} // namespace

int main() {
    TestCardOverlay();
    TestLowercaseGradeAndInitials();
    TestNoName();
    TestSpokenAttributes();
    TestAuctionPanel();
    TestDetectionConfidence();
    std::cout << "[PASS] AttributeParserTest" << std::endl;
    return 0;
}
