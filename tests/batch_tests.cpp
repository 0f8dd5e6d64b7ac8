// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <folio/core/download_engine.hpp>
#include <folio/core/metadata_store.hpp>
#include <folio/queue/batch.hpp>
#include "fake_http_client.hpp"
#include "temp_dir.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>

using namespace folio;
using namespace folio::queue;
using folio::core::BookId;
using folio::testing::FakeHttpClient;
using folio::testing::TempDir;
using namespace std::chrono_literals;

namespace {

// Tracks the peak number of overlapping calls and the threads making them
class Concurrency {
public:
    void enter() {
        {
            std::lock_guard lock(mutex_);
            threads_.insert(std::this_thread::get_id());
        }
        auto now = ++current_;
        auto seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(15ms);
    }
    void leave() { --current_; }
    [[nodiscard]] int peak() const { return peak_.load(); }
    [[nodiscard]] std::size_t threads() const {
        std::lock_guard lock(mutex_);
        return threads_.size();
    }

private:
    mutable std::mutex mutex_;
    std::set<std::thread::id> threads_;
    std::atomic<int> current_{0};
    std::atomic<int> peak_{0};
};

class SlowCatalog final : public core::MetadataStore {
public:
    explicit SlowCatalog(Concurrency& c) : concurrency_(c) {}

    core::JsonCatalog inner;

    std::vector<std::string> download_urls(BookId id) const override {
        concurrency_.enter();
        auto urls = inner.download_urls(id);
        concurrency_.leave();
        return urls;
    }
    std::optional<std::string> title(BookId id) const override { return inner.title(id); }
    std::optional<core::DownloadRecord> record(BookId id) const override { return inner.record(id); }
    std::vector<core::DownloadRecord> records() const override { return inner.records(); }
    void update_record(const core::DownloadRecord& r) override { inner.update_record(r); }

private:
    Concurrency& concurrency_;
};

class SlowHttpClient final : public core::HttpClient {
public:
    SlowHttpClient(std::shared_ptr<FakeHttpClient> inner, Concurrency& c)
        : inner_(std::move(inner)), concurrency_(c) {}

    std::expected<core::HttpResponse, std::error_code> head(const std::string& url) noexcept override {
        return inner_->head(url);
    }

    std::expected<core::HttpResponse, std::error_code>
    get(const std::string& url, std::uint64_t offset,
        const core::ResponseHandler& on_response, const core::ChunkHandler& on_chunk) noexcept override {
        concurrency_.enter();
        auto result = inner_->get(url, offset, on_response, on_chunk);
        concurrency_.leave();
        return result;
    }

private:
    std::shared_ptr<FakeHttpClient> inner_;
    Concurrency& concurrency_;
};

std::string url_for(BookId id) {
    return "https://books.example.org/" + std::to_string(id) + ".epub";
}

} // namespace

TEST_CASE("enqueue_many resolves books with bounded concurrency", "[batch]") {
    TempDir dir;
    Concurrency concurrency;
    SlowCatalog catalog(concurrency);

    std::vector<BookId> ids;
    for (BookId id = 1; id <= 20; ++id) {
        ids.push_back(id);
        if (id != 13) {
            catalog.inner.add_book({id, "Book " + std::to_string(id), {url_for(id)}});
        }
    }

    QueueOptions options;
    options.state_file.clear();
    DownloadQueue queue(catalog, [](const DownloadTask&) { return std::error_code{}; }, options);

    auto summary = enqueue_many(queue, ids, Priority::low, dir.path(), 3);
    CHECK(summary.succeeded == 19);
    CHECK(summary.failed == 1);
    CHECK(queue.status().stats.queued == 19);
    CHECK(concurrency.peak() <= 3);
    CHECK(concurrency.peak() >= 2);
    CHECK(concurrency.threads() <= 3);
}

TEST_CASE("download_many reports counts instead of failing", "[batch]") {
    TempDir dir;
    Concurrency concurrency;
    auto fake = std::make_shared<FakeHttpClient>();
    auto http = std::make_shared<SlowHttpClient>(fake, concurrency);

    std::vector<BatchItem> items;
    for (BookId id = 1; id <= 12; ++id) {
        if (id % 4 != 0) {
            fake->serve_body(url_for(id), std::string(100 + id, 'x'));
        }
        items.push_back({id, url_for(id), dir / (std::to_string(id) + ".epub")});
    }

    core::DownloadEngine engine(http);
    engine.sleeper([](std::chrono::milliseconds) {});

    core::DownloadOptions options;
    options.use_mirrors = false;
    options.max_attempts = 1;

    SECTION("Partial success is counted") {
        auto summary = download_many(engine, items, options, 4);
        CHECK(summary.succeeded == 9);
        CHECK(summary.failed == 3);
        CHECK(concurrency.peak() <= 4);
        CHECK(concurrency.threads() <= 4);
        CHECK(std::filesystem::file_size(dir / "5.epub") == 105);
        CHECK(!std::filesystem::exists(dir / "4.epub"));
    }

    SECTION("Nothing starts after shutdown") {
        core::ShutdownContext shutdown;
        shutdown.request();
        auto summary = download_many(engine, items, options, 4, &shutdown);
        CHECK(summary.succeeded == 0);
        CHECK(summary.failed == items.size());
        CHECK(fake->requests().empty());
    }

    SECTION("Empty input") {
        auto summary = download_many(engine, {}, options, 4);
        CHECK(summary.succeeded == 0);
        CHECK(summary.failed == 0);
    }
}

TEST_CASE("download_many never uses more threads than items", "[batch]") {
    TempDir dir;
    Concurrency concurrency;
    auto fake = std::make_shared<FakeHttpClient>();
    auto http = std::make_shared<SlowHttpClient>(fake, concurrency);
    fake->serve_body(url_for(1), "one");
    fake->serve_body(url_for(2), "two");

    core::DownloadEngine engine(http);
    core::DownloadOptions options;
    options.use_mirrors = false;

    std::vector<BatchItem> items{{1, url_for(1), dir / "1.epub"}, {2, url_for(2), dir / "2.epub"}};
    auto summary = download_many(engine, items, options, 16);
    CHECK(summary.succeeded == 2);
    CHECK(concurrency.threads() <= 2);
}
