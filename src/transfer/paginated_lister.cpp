#include "paginated_lister.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

PaginatedLister::PaginatedLister(PageFetcher fetch, int page_size, int max_pages)
    : fetch_(std::move(fetch)),
      page_size_(std::max(1, page_size)),
      max_pages_(std::max(1, max_pages)) {}

ListResult PaginatedLister::list_all(const std::string& label) const {
    ListResult result;
    int offset = 0;

    while (true) {
        if (result.pages >= max_pages_) {
            docsync_warn(fmt::format("list {}: stopped at page cap ({} pages, {} items)",
                                     label, max_pages_, result.items.size()));
            result.hit_page_cap = true;
            break;
        }

        auto page = fetch_(page_size_, offset);
        if (page.is_err()) {
            docsync_error(fmt::format("list {}: page at offset {} failed, keeping {} items: {}",
                                      label, offset, result.items.size(), page.error));
            result.error = page.error;
            break;
        }

        ++result.pages;
        auto& docs = page.value;
        if (docs.empty()) break;

        size_t got = docs.size();
        result.items.insert(result.items.end(),
                            std::make_move_iterator(docs.begin()),
                            std::make_move_iterator(docs.end()));
        if (got < static_cast<size_t>(page_size_)) break;

        offset += page_size_;
    }

    docsync_log(fmt::format("list {}: {} items in {} page(s)", label, result.items.size(), result.pages));
    return result;
}
