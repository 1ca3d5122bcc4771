#include "infrastructure/EbaySoldListingSearch.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

namespace bidlens::infrastructure {

using json = nlohmann::json;

namespace {

constexpr const char* kFindingPath = "/services/search/FindingService/v1";

// The Finding API wraps every scalar in a one-element array.
const json* First(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end()) return nullptr;
    if (it->is_array()) return it->empty() ? nullptr : &(*it)[0];
    return &(*it);
}

std::string FirstString(const json& node, const char* key) {
    const json* value = First(node, key);
    return (value && value->is_string()) ? value->get<std::string>() : std::string();
}

} // namespace

EbaySoldListingSearch::EbaySoldListingSearch(EbaySearchOptions options)
    : m_options(std::move(options)) {}

std::vector<domain::PriceComparable> EbaySoldListingSearch::search(const std::string& query) {
    httplib::Client cli("https://" + m_options.host);
    cli.set_connection_timeout(m_options.timeoutSeconds);
    cli.set_read_timeout(m_options.timeoutSeconds);

    httplib::Params params = {
        {"OPERATION-NAME", "findCompletedItems"},
        {"SERVICE-VERSION", "1.13.0"},
        {"SECURITY-APPNAME", m_options.appId},
        {"RESPONSE-DATA-FORMAT", "JSON"},
        {"REST-PAYLOAD", ""},
        {"keywords", query},
        {"categoryId", m_options.categoryId},
        {"sortOrder", "EndTimeSoonest"},
        {"itemFilter(0).name", "SoldItemsOnly"},
        {"itemFilter(0).value", "true"},
        {"itemFilter(1).name", "Condition"},
        {"itemFilter(1).value", "Used"},
        {"paginationInput.entriesPerPage", std::to_string(m_options.entriesPerPage)}
    };

    auto res = cli.Get(kFindingPath, params, httplib::Headers{});
    if (!res) {
        throw std::runtime_error("eBay connection failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw std::runtime_error("eBay HTTP " + std::to_string(res->status));
    }
    return ParseResponse(res->body);
}

std::vector<domain::PriceComparable> EbaySoldListingSearch::ParseResponse(const std::string& body) {
    const json j = json::parse(body);
    const json* response = First(j, "findCompletedItemsResponse");
    if (!response) {
        throw std::runtime_error("eBay response missing findCompletedItemsResponse");
    }

    const std::string ack = FirstString(*response, "ack");
    if (ack != "Success" && ack != "Warning") {
        std::string message = "unknown error";
        if (const json* errors = First(*response, "errorMessage")) {
            if (const json* error = First(*errors, "error")) {
                message = FirstString(*error, "message");
            }
        }
        throw std::runtime_error("eBay API error (" + ack + "): " + message);
    }

    std::vector<domain::PriceComparable> sales;
    const json* result = First(*response, "searchResult");
    if (!result || !result->contains("item") || !(*result)["item"].is_array()) {
        return sales;
    }

    for (const auto& item : (*result)["item"]) {
        const json* status = First(item, "sellingStatus");
        const json* price = status ? First(*status, "currentPrice") : nullptr;
        if (!price || !price->contains("__value__")) continue;

        domain::PriceComparable sale;
        const json& value = (*price)["__value__"];
        try {
            sale.price = value.is_string() ? std::stod(value.get<std::string>()) : value.get<double>();
        } catch (const std::exception& e) {
            std::cerr << "[EbaySoldListingSearch] Skipping unparsable price: " << e.what() << std::endl;
            continue;
        }
        if (sale.price <= 0.0) continue;

        sale.title = FirstString(item, "title");
        if (const json* listing = First(item, "listingInfo")) {
            sale.saleDate = FirstString(*listing, "endTime");
        }
        sales.push_back(std::move(sale));
    }
    return sales;
}

} // namespace bidlens::infrastructure
