#pragma once

#include "market/Listing.hpp"
#include "market/SearchQuery.hpp"

#include <vector>

namespace market {

class MarketClient {
public:
    virtual ~MarketClient() = default;

    // Ranked listings for one vehicle query. Throws std::runtime_error on failure.
    virtual std::vector<Listing> search(const SearchRequest& req) = 0;
};

} // namespace market
