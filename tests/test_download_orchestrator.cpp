#include <gtest/gtest.h>
#include <transfer/download_orchestrator.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <sstream>
#include "fakes.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

static const std::string BASE = "http://svc";

static std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class DownloadOrchestratorTest : public ::testing::Test {
protected:
    fs::path out_dir;
    FakeTransport transport;
    FakeClock clock;
    std::unique_ptr<RequestExecutor> executor;
    std::unique_ptr<DocumentApi> api;
    TransferConfig transfer;

    std::mutex mutex;
    std::vector<std::pair<int, int>> progress;
    std::vector<std::pair<std::string, std::string>> errors;

    void SetUp() override {
        out_dir = fs::temp_directory_path() / "docsync_download_test";
        fs::remove_all(out_dir);

        executor = std::make_unique<RequestExecutor>(transport, clock, RetryPolicy{});
        ApiConfig cfg;
        cfg.base_url = BASE;
        api = std::make_unique<DocumentApi>(*executor, cfg, "secret");
    }

    void TearDown() override {
        fs::remove_all(out_dir);
    }

    static std::string listing_url(const std::string& dataset, int limit, int offset) {
        return BASE + "/documents?dataset=" + dataset + "&limit=" + std::to_string(limit)
             + "&offset=" + std::to_string(offset) + "&exclude_payload=true";
    }
    static std::string ocr_url(const std::string& id) {
        return BASE + "/document/" + id + "/download/ocr-url?hours=6";
    }
    static std::string std_url(const std::string& id) {
        return BASE + "/standardizations?document_id=" + id + "&limit=20&offset=0&exclude_payload=false";
    }

    // A document whose OCR URL, artifact and (empty) standardizations all resolve
    void serve(const std::string& id, const std::string& bytes) {
        transport.script("GET", ocr_url(id), {respond(200, json{{"url", "http://files/" + id}}.dump())});
        transport.script("GET", "http://files/" + id, {respond(200, bytes)});
        transport.script("GET", std_url(id), {respond(200, "[]")});
    }

    void list(const std::string& dataset, const json& docs) {
        transport.script("GET", listing_url(dataset, transfer.page_size, 0), {respond(200, docs.dump())});
    }

    static json doc(const std::string& id, const std::string& filename) {
        return {{"documentId", id}, {"filename", filename}, {"fileExtension", "pdf"}};
    }

    TransferSummary run(const std::string& dataset) {
        DownloadOrchestrator orchestrator(*api, transfer);
        return orchestrator.download_dataset(dataset, out_dir,
            [this](int c, int t) {
                std::lock_guard<std::mutex> lock(mutex);
                progress.emplace_back(c, t);
            },
            [this](const std::string& label, const std::string& err) {
                std::lock_guard<std::mutex> lock(mutex);
                errors.emplace_back(label, err);
            });
    }
};

TEST_F(DownloadOrchestratorTest, RetriedOcrUrlStillDownloadsEveryDocument) {
    list("invoices-2024", json::array({doc("doc1", "doc1.pdf"), doc("doc2", "doc2.pdf"), doc("doc3", "doc3.pdf")}));
    serve("doc1", "PDF-1");
    serve("doc2", "PDF-2");
    serve("doc3", "PDF-3");
    transport.script("GET", ocr_url("doc2"),
                     {respond(500), respond(500), respond(500),
                      respond(200, json{{"url", "http://files/doc2"}}.dump())});

    auto summary = run("invoices-2024");

    EXPECT_TRUE(errors.empty());
    EXPECT_TRUE(summary.all_ok());
    EXPECT_EQ(summary.succeeded, 3);
    EXPECT_EQ(read_all(out_dir / "doc1.pdf.pdf"), "PDF-1");
    EXPECT_EQ(read_all(out_dir / "doc2.pdf.pdf"), "PDF-2");
    EXPECT_EQ(read_all(out_dir / "doc3.pdf.pdf"), "PDF-3");

    EXPECT_EQ(transport.calls("GET", ocr_url("doc2")), 4);
    EXPECT_EQ(clock.sleeps(), (std::vector<double>{2, 4, 8}));

    ASSERT_EQ(progress.size(), 3u);
    EXPECT_EQ(progress.back(), std::make_pair(3, 3));
}

TEST_F(DownloadOrchestratorTest, FailureIsIsolatedToOneDocument) {
    list("ds", json::array({doc("a", "alpha"), doc("b", "beta"), doc("c", "gamma")}));
    serve("a", "A");
    serve("b", "B");
    serve("c", "C");
    transport.script("GET", ocr_url("b"), {respond(403, "forbidden")});

    auto summary = run("ds");

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].first, "beta (b)");
    EXPECT_NE(errors[0].second.find("403"), std::string::npos);
    EXPECT_TRUE(fs::exists(out_dir / "alpha.pdf"));
    EXPECT_FALSE(fs::exists(out_dir / "beta.pdf"));
    EXPECT_TRUE(fs::exists(out_dir / "gamma.pdf"));
    EXPECT_EQ(summary.failed, 1);
    ASSERT_EQ(progress.size(), 3u);
    EXPECT_EQ(progress.back(), std::make_pair(3, 3));
}

TEST_F(DownloadOrchestratorTest, MissingUrlFieldFailsDocument) {
    list("ds", json::array({doc("a", "alpha")}));
    serve("a", "A");
    transport.script("GET", ocr_url("a"), {respond(200, "{}")});

    run("ds");

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].second.find("No download URL found"), std::string::npos);
}

TEST_F(DownloadOrchestratorTest, WritesStandardizationJsonBesideArtifact) {
    list("ds", json::array({doc("a", "alpha"), doc("b", "beta")}));
    serve("a", "A");
    serve("b", "B");
    json data = {{"total", 42}, {"vendor", "Acme"}};
    transport.script("GET", std_url("a"), {respond(200, json::array({{{"data", data}}}).dump())});
    transport.script("GET", std_url("b"), {respond(200, json::array({{{"data", nullptr}}}).dump())});

    run("ds");

    EXPECT_TRUE(errors.empty());
    ASSERT_TRUE(fs::exists(out_dir / "alpha.json"));
    EXPECT_EQ(read_all(out_dir / "alpha.json"), data.dump(2));
    EXPECT_FALSE(fs::exists(out_dir / "beta.json"));
}

TEST_F(DownloadOrchestratorTest, OverwritesExistingFile) {
    fs::create_directories(out_dir);
    std::ofstream(out_dir / "alpha.pdf") << "old contents that are longer";
    list("ds", json::array({doc("a", "alpha")}));
    serve("a", "new");

    run("ds");

    EXPECT_EQ(read_all(out_dir / "alpha.pdf"), "new");
}

TEST_F(DownloadOrchestratorTest, EmptyDatasetSignalsZeroOfZero) {
    list("empty", json::array());

    auto summary = run("empty");

    ASSERT_EQ(progress.size(), 1u);
    EXPECT_EQ(progress[0], std::make_pair(0, 0));
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(summary.total, 0);
    EXPECT_TRUE(summary.all_ok());
    EXPECT_TRUE(fs::is_directory(out_dir));
}

TEST_F(DownloadOrchestratorTest, ListingFailureIsReportedAndTruncates) {
    transport.script("GET", listing_url("ds", transfer.page_size, 0), {respond(401, "bad key")});

    auto summary = run("ds");

    EXPECT_TRUE(summary.listing_truncated);
    EXPECT_FALSE(summary.all_ok());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].first, "dataset ds");
    EXPECT_EQ(progress, (std::vector<std::pair<int, int>>{{0, 0}}));
}

TEST_F(DownloadOrchestratorTest, PagesThroughListing) {
    transfer.page_size = 2;
    transport.script("GET", listing_url("ds", 2, 0),
                     {respond(200, json::array({doc("a", "a"), doc("b", "b")}).dump())});
    transport.script("GET", listing_url("ds", 2, 2),
                     {respond(200, json::array({doc("c", "c")}).dump())});
    serve("a", "A");
    serve("b", "B");
    serve("c", "C");

    auto summary = run("ds");

    EXPECT_EQ(summary.succeeded, 3);
    EXPECT_EQ(transport.calls("GET", listing_url("ds", 2, 4)), 0);
}

TEST_F(DownloadOrchestratorTest, CollidingFilenamesAreDisambiguated) {
    list("ds", json::array({doc("x1", "report"), doc("x2", "report"), doc("y", "summary")}));
    serve("x1", "ONE");
    serve("x2", "TWO");
    serve("y", "Y");

    run("ds");

    EXPECT_EQ(read_all(out_dir / "report__x1.pdf"), "ONE");
    EXPECT_EQ(read_all(out_dir / "report__x2.pdf"), "TWO");
    EXPECT_TRUE(fs::exists(out_dir / "summary.pdf"));
    EXPECT_FALSE(fs::exists(out_dir / "report.pdf"));
}

TEST(DownloadPlan, KeepsSharedNamesWhenDisambiguationIsOff) {
    std::vector<Document> docs = {{"1", "same", "pdf"}, {"2", "same", "pdf"}};
    auto tasks = DownloadOrchestrator::plan(docs, false);
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].stem, "same");
    EXPECT_EQ(tasks[1].stem, "same");
    EXPECT_EQ(tasks[0].index, 0u);
    EXPECT_EQ(tasks[1].index, 1u);
}

TEST(DownloadPlan, PathSeparatorsStayInsideOutputDir) {
    std::vector<Document> docs = {{"1", "../etc/passwd", "pdf"}};
    auto tasks = DownloadOrchestrator::plan(docs, true);
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].stem.find('/'), std::string::npos);
}

TEST_F(DownloadOrchestratorTest, ThrowingProgressCallbackDoesNotRecountDocument) {
    list("letters", json::array({doc("d1", "a.pdf"), doc("d2", "b.pdf"), doc("d3", "c.pdf")}));
    serve("d1", "A");
    serve("d2", "B");
    serve("d3", "C");
    transfer.workers = 1;

    int calls = 0;
    DownloadOrchestrator orchestrator(*api, transfer);
    auto summary = orchestrator.download_dataset("letters", out_dir,
        [&](int c, int t) {
            progress.emplace_back(c, t);
            if (calls++ == 0) throw std::runtime_error("ui glitch");
        },
        [&](const std::string& label, const std::string& err) { errors.emplace_back(label, err); });

    EXPECT_TRUE(errors.empty());
    ASSERT_EQ(progress.size(), 3u);
    EXPECT_EQ(progress.back(), std::make_pair(3, 3));
    EXPECT_EQ(summary.succeeded, 3);
    EXPECT_TRUE(summary.all_ok());
    EXPECT_EQ(read_all(out_dir / "c.pdf.pdf"), "C");
}
