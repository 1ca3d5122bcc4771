/**
 * @file SoldListingSearch.hpp
 * @brief Interface for the sold-listings marketplace search.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/PriceSnapshot.hpp"

namespace bidlens::domain {

/**
 * @class SoldListingSearch
 * @brief Returns completed sales for a keyword query, most recent first.
 *
 * Implementations may throw on transport, auth or parse failures.
 */
class SoldListingSearch {
public:
    virtual ~SoldListingSearch() = default;

    virtual std::vector<PriceComparable> search(const std::string& query) = 0;
};

} // namespace bidlens::domain
