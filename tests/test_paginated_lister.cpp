#include <gtest/gtest.h>
#include <transfer/paginated_lister.hpp>
#include <algorithm>

// Backing collection served in offset/limit slices
struct FakeCollection {
    std::vector<Document> docs;
    int fail_at_offset = -1;
    int fetches = 0;

    explicit FakeCollection(int n) {
        for (int i = 0; i < n; ++i) {
            docs.push_back({"id" + std::to_string(i), "file" + std::to_string(i), "pdf"});
        }
    }

    PaginatedLister::PageFetcher fetcher() {
        return [this](int limit, int offset) {
            ++fetches;
            if (offset == fail_at_offset) {
                return Result<std::vector<Document>>::Err("GET /documents failed with status 500");
            }
            std::vector<Document> page;
            for (int i = offset; i < std::min<int>(offset + limit, docs.size()); ++i) {
                page.push_back(docs[i]);
            }
            return Result<std::vector<Document>>::Ok(page);
        };
    }
};

static std::vector<std::string> ids(const std::vector<Document>& docs) {
    std::vector<std::string> out;
    for (const auto& d : docs) out.push_back(d.document_id);
    return out;
}

TEST(PaginatedLister, StopsOnShortPage) {
    FakeCollection c(25);
    PaginatedLister lister(c.fetcher(), 10, 500);
    auto r = lister.list_all("test");

    EXPECT_TRUE(r.complete());
    EXPECT_EQ(r.items.size(), 25u);
    EXPECT_EQ(r.pages, 3);
    EXPECT_EQ(c.fetches, 3);
    EXPECT_EQ(r.items.front().document_id, "id0");
    EXPECT_EQ(r.items.back().document_id, "id24");
}

TEST(PaginatedLister, StopsOnEmptyPage) {
    FakeCollection c(20);
    PaginatedLister lister(c.fetcher(), 10, 500);
    auto r = lister.list_all("test");

    EXPECT_TRUE(r.complete());
    EXPECT_EQ(r.items.size(), 20u);
    EXPECT_EQ(c.fetches, 3);
}

TEST(PaginatedLister, EmptyCollection) {
    FakeCollection c(0);
    PaginatedLister lister(c.fetcher(), 10, 500);
    auto r = lister.list_all("test");

    EXPECT_TRUE(r.complete());
    EXPECT_TRUE(r.items.empty());
    EXPECT_EQ(c.fetches, 1);
}

TEST(PaginatedLister, IdempotentForStableCollection) {
    FakeCollection c(37);
    PaginatedLister lister(c.fetcher(), 5, 500);

    auto first = lister.list_all("test");
    auto second = lister.list_all("test");
    EXPECT_EQ(ids(first.items), ids(second.items));
}

TEST(PaginatedLister, FailureReturnsStrictPrefix) {
    FakeCollection full(30);
    PaginatedLister full_lister(full.fetcher(), 10, 500);
    auto all = ids(full_lister.list_all("full").items);

    FakeCollection c(30);
    c.fail_at_offset = 20;
    PaginatedLister lister(c.fetcher(), 10, 500);
    auto r = lister.list_all("partial");

    ASSERT_TRUE(r.error.has_value());
    EXPECT_FALSE(r.complete());
    auto got = ids(r.items);
    ASSERT_EQ(got.size(), 20u);
    EXPECT_TRUE(std::equal(got.begin(), got.end(), all.begin()));
}

TEST(PaginatedLister, FailureOnFirstPageReturnsNothing) {
    FakeCollection c(5);
    c.fail_at_offset = 0;
    PaginatedLister lister(c.fetcher(), 10, 500);
    auto r = lister.list_all("test");

    EXPECT_TRUE(r.items.empty());
    ASSERT_TRUE(r.error.has_value());
    EXPECT_NE(r.error->find("500"), std::string::npos);
}

TEST(PaginatedLister, PageCapStopsRunawayPagination) {
    // Every page is full, so only the cap ends the walk
    int fetches = 0;
    PaginatedLister lister([&](int limit, int offset) {
        ++fetches;
        std::vector<Document> page;
        for (int i = 0; i < limit; ++i) {
            page.push_back({"id" + std::to_string(offset + i), "f", "pdf"});
        }
        return Result<std::vector<Document>>::Ok(page);
    }, 2, 7);

    auto r = lister.list_all("runaway");
    EXPECT_TRUE(r.hit_page_cap);
    EXPECT_FALSE(r.complete());
    EXPECT_FALSE(r.error.has_value());
    EXPECT_EQ(fetches, 7);
    EXPECT_EQ(r.items.size(), 14u);
}
