#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

// Listing outcome. On a mid-walk failure `items` holds every page fetched
// before it, in server order, and `error` says why the walk stopped.
struct ListResult {
    std::vector<Document> items;
    std::optional<std::string> error;
    bool hit_page_cap = false;
    int pages = 0;

    bool complete() const { return !error && !hit_page_cap; }
};

// Offset/limit walk over a collection endpoint.
class PaginatedLister {
public:
    // Fetch one page starting at `offset`
    using PageFetcher = std::function<Result<std::vector<Document>>(int limit, int offset)>;

    PaginatedLister(PageFetcher fetch, int page_size, int max_pages);

    ListResult list_all(const std::string& label) const;

private:
    PageFetcher fetch_;
    int page_size_;
    int max_pages_;
};
