/**
 * @file EbaySoldListingSearch.hpp
 * @brief eBay Finding API (findCompletedItems) adapter.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/SoldListingSearch.hpp"

namespace bidlens::infrastructure {

struct EbaySearchOptions {
    std::string appId;
    std::string host = "svcs.ebay.com";
    std::string categoryId = "212";    ///< Sports Trading Cards.
    int entriesPerPage = 25;
    int timeoutSeconds = 10;
};

/**
 * @class EbaySoldListingSearch
 * @brief Sold items only, most recently ended first, over HTTPS with JSON responses.
 *
 * Throws std::runtime_error on transport, HTTP or API errors and
 * nlohmann::json::exception on malformed payloads.
 */
class EbaySoldListingSearch : public domain::SoldListingSearch {
public:
    explicit EbaySoldListingSearch(EbaySearchOptions options);

    std::vector<domain::PriceComparable> search(const std::string& query) override;

    /** @brief Extracts (price, title, end time) from a findCompletedItems JSON body. */
    static std::vector<domain::PriceComparable> ParseResponse(const std::string& body);

private:
    EbaySearchOptions m_options;
};

} // namespace bidlens::infrastructure
