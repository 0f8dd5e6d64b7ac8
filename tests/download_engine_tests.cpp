// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <folio/core/download_engine.hpp>
#include <folio/core/metadata_store.hpp>
#include <folio/disk/error.hpp>
#include <folio/mirror/mirror_manager.hpp>
#include "fake_http_client.hpp"
#include "temp_dir.hpp"
#include <algorithm>
#include <filesystem>

using namespace folio;
using namespace folio::core;
using folio::testing::FakeHttpClient;
using folio::testing::FakeResponse;
using folio::testing::TempDir;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

constexpr auto SOURCE = "https://books.example.org/cache/epub/7/pg7.epub";

std::string make_body(std::size_t size) {
    std::string body(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        body[i] = static_cast<char>('a' + (i * 7) % 26);
    }
    return body;
}

struct EngineFixture {
    EngineFixture() : engine(http, nullptr, &catalog) {
        engine.sleeper([this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }

    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    JsonCatalog catalog;
    DownloadEngine engine;
    std::vector<std::chrono::milliseconds> sleeps;
    TempDir dir;
};

DownloadOptions direct() {
    DownloadOptions options;
    options.use_mirrors = false;
    return options;
}

mirror::MirrorSite site(std::string name, std::string url, std::uint32_t priority) {
    mirror::MirrorSite s;
    s.name = std::move(name);
    s.base_url = std::move(url);
    s.priority = priority;
    return s;
}

} // namespace

TEST_CASE_METHOD(EngineFixture, "DownloadEngine fresh download", "[engine]") {
    auto body = make_body(10000);
    http->serve_body(SOURCE, body);

    std::vector<std::pair<std::uint64_t, std::uint64_t>> progress;
    auto out = dir / "book.epub";
    auto ec = engine.download(7, SOURCE, out, direct(),
                              [&](std::uint64_t done, std::uint64_t total) { progress.emplace_back(done, total); });

    REQUIRE(!ec);
    CHECK(dir.read(out) == body);
    REQUIRE(!progress.empty());
    CHECK(progress.back() == std::pair<std::uint64_t, std::uint64_t>{10000, 10000});
    CHECK(std::is_sorted(progress.begin(), progress.end()));

    auto record = catalog.record(7);
    REQUIRE(record);
    CHECK(record->status == RecordStatus::completed);
    CHECK(record->bytes_downloaded == 10000);
    CHECK(record->total_bytes == 10000);
    CHECK(record->source_url == SOURCE);
    CHECK(record->download_path == out.string());
    CHECK(sleeps.empty());
}

TEST_CASE_METHOD(EngineFixture, "DownloadEngine resumes partial files", "[engine]") {
    auto body = make_body(10000);
    auto out = dir / "book.epub";

    SECTION("Honored range appends without rewriting existing bytes") {
        http->serve_body(SOURCE, body);
        dir.write("book.epub", std::string(3000, 'L'));

        std::uint64_t first_progress = 0;
        auto ec = engine.download(7, SOURCE, out, direct(), [&](std::uint64_t done, std::uint64_t total) {
            if (first_progress == 0) first_progress = done;
            CHECK(total == 10000);
        });

        REQUIRE(!ec);
        auto content = dir.read(out);
        CHECK(content.size() == 10000);
        CHECK(content == std::string(3000, 'L') + body.substr(3000));
        CHECK(first_progress > 3000);

        auto requests = http->requests();
        REQUIRE(requests.size() == 1);
        CHECK(requests[0].offset == 3000);
    }

    SECTION("Ignored range restarts from zero") {
        http->serve(SOURCE, FakeResponse{.body = body, .honor_range = false});
        dir.write("book.epub", std::string(3000, 'L'));

        REQUIRE(!engine.download(7, SOURCE, out, direct()));
        CHECK(dir.read(out) == body);
        CHECK(http->requests().size() == 1);
        CHECK(sleeps.empty());
    }

    SECTION("Non-resumable mode ignores the partial file") {
        http->serve_body(SOURCE, body);
        dir.write("book.epub", std::string(3000, 'L'));

        auto options = direct();
        options.resumable = false;
        REQUIRE(!engine.download(7, SOURCE, out, options));
        CHECK(dir.read(out) == body);
        CHECK(http->requests()[0].offset == 0);
    }

    SECTION("Rejected range discards a stale partial file and retries fresh") {
        http->serve_body(SOURCE, body.substr(0, 100));
        dir.write("book.epub", std::string(200, 'L'));

        REQUIRE(!engine.download(7, SOURCE, out, direct()));
        CHECK(dir.read(out) == body.substr(0, 100));

        auto requests = http->requests();
        REQUIRE(requests.size() == 2);
        CHECK(requests[0].offset == 200);
        CHECK(requests[1].offset == 0);
        CHECK(sleeps == std::vector<std::chrono::milliseconds>{1000ms});
    }
}

TEST_CASE_METHOD(EngineFixture, "DownloadEngine size verification", "[engine]") {
    auto out = dir / "book.epub";
    http->serve(SOURCE, FakeResponse{.body = make_body(5000), .announced_length = 6000});

    auto options = direct();
    options.max_attempts = 1;

    SECTION("Resumable mismatch keeps the partial file") {
        auto ec = engine.download(7, SOURCE, out, options);
        CHECK(ec == DownloadErrc::size_mismatch);
        REQUIRE(fs::exists(out));
        CHECK(fs::file_size(out) == 5000);
        CHECK(catalog.record(7)->status == RecordStatus::failed);
    }

    SECTION("Non-resumable mismatch deletes the file") {
        options.resumable = false;
        CHECK(engine.download(7, SOURCE, out, options) == DownloadErrc::size_mismatch);
        CHECK(!fs::exists(out));
    }

    SECTION("Verification can be disabled") {
        options.verify_size = false;
        CHECK(!engine.download(7, SOURCE, out, options));
        CHECK(fs::file_size(out) == 5000);
    }
}

TEST_CASE_METHOD(EngineFixture, "DownloadEngine retries with exponential backoff", "[engine]") {
    auto out = dir / "book.epub";

    SECTION("Transient errors recover") {
        http->enqueue(SOURCE, FakeResponse{.status = 500});
        http->enqueue(SOURCE, FakeResponse{.transport_error = make_error_code(DownloadErrc::timeout)});
        http->serve_body(SOURCE, make_body(2048));

        REQUIRE(!engine.download(7, SOURCE, out, direct()));
        CHECK(http->requests().size() == 3);
        CHECK(sleeps == std::vector<std::chrono::milliseconds>{1000ms, 2000ms});
        CHECK(catalog.record(7)->retry_count == 2);
    }

    SECTION("Exhausted attempts return the last error") {
        http->serve(SOURCE, FakeResponse{.status = 503});

        auto ec = engine.download(7, SOURCE, out, direct());
        CHECK(ec == DownloadErrc::server_error);
        CHECK(http->requests().size() == 3);
        CHECK(sleeps.size() == 2);

        auto record = catalog.record(7);
        REQUIRE(record);
        CHECK(record->status == RecordStatus::failed);
        CHECK(record->error_message == ec.message());
    }

    SECTION("Connection loss mid-body resumes on the next attempt") {
        auto body = make_body(20000);
        http->enqueue(SOURCE, FakeResponse{.body = body, .drop_after = 8192});
        http->serve_body(SOURCE, body);

        REQUIRE(!engine.download(7, SOURCE, out, direct()));
        CHECK(dir.read(out) == body);

        auto requests = http->requests();
        REQUIRE(requests.size() == 2);
        CHECK(requests[1].offset == 8192);
    }
}

TEST_CASE_METHOD(EngineFixture, "DownloadEngine does not retry local or terminal conditions", "[engine]") {
    SECTION("Disk errors stop immediately") {
        dir.write("blocker", "x");
        auto ec = engine.download(7, SOURCE, dir / "blocker" / "book.epub", direct());
        REQUIRE(ec);
        CHECK(ec.category() == disk::disk_category());
        CHECK(http->requests().empty());
    }

    SECTION("Missing source URL") {
        CHECK(engine.download(7, "", dir / "book.epub", direct()) == DownloadErrc::no_source_url);
    }

    SECTION("Completed books are skipped") {
        dir.write("book.epub", "done");
        DownloadRecord record;
        record.book_id = 7;
        record.status = RecordStatus::completed;
        catalog.update_record(record);

        CHECK(!engine.download(7, SOURCE, dir / "book.epub", direct()));
        CHECK(http->requests().empty());
    }

    SECTION("No new attempt once shutdown is requested") {
        ShutdownContext shutdown;
        DownloadEngine stopping(http, nullptr, &catalog, &shutdown);
        stopping.sleeper([this](std::chrono::milliseconds d) { sleeps.push_back(d); });
        http->serve(SOURCE, FakeResponse{.status = 503});
        shutdown.request();

        CHECK(stopping.download(7, SOURCE, dir / "book.epub", direct()) == DownloadErrc::server_error);
        CHECK(http->requests().size() == 1);
        CHECK(sleeps.empty());
    }
}

TEST_CASE("DownloadEngine mirror failover", "[engine][mirror]") {
    auto http = std::make_shared<FakeHttpClient>();
    JsonCatalog catalog;
    TempDir dir;
    std::vector<std::chrono::milliseconds> sleeps;

    mirror::MirrorManagerOptions options;
    options.seed = 42;
    options.save_on_close = false;

    SECTION("A 404 rotates to another mirror without backoff") {
        mirror::MirrorManager mirrors(http, {
            site("missing", "https://missing.example.org/", 1000),
            site("good", "https://good.example.org/", 1),
        }, options);
        DownloadEngine engine(http, &mirrors, &catalog);
        engine.sleeper([&](std::chrono::milliseconds d) { sleeps.push_back(d); });

        const std::string good_url = "https://good.example.org/cache/epub/7/pg7.epub";
        http->serve_body(good_url, make_body(4096));

        auto ec = engine.download(7, "", dir / "book.epub");
        REQUIRE(!ec);
        CHECK(sleeps.empty());

        auto requests = http->requests();
        REQUIRE(requests.size() == 2);
        CHECK(requests[0].url == "https://missing.example.org/cache/epub/7/pg7.epub");
        CHECK(requests[1].url == good_url);

        CHECK(mirrors.find("https://missing.example.org/")->failure_count == 1);
        CHECK(catalog.record(7)->source_url == good_url);

        // The mirror that served the book is preferred from now on
        for (int i = 0; i < 10; ++i) {
            CHECK(mirrors.select(7) == "https://good.example.org/");
        }
    }

    SECTION("Gives up when no other mirror is available") {
        mirror::MirrorManager mirrors(http, {site("only", "https://only.example.org/", 1)}, options);
        DownloadEngine engine(http, &mirrors, &catalog);
        engine.sleeper([&](std::chrono::milliseconds d) { sleeps.push_back(d); });

        CHECK(engine.download(7, "", dir / "book.epub") == DownloadErrc::not_found);
        CHECK(http->requests().size() == 1);
        CHECK(sleeps.empty());
    }

    SECTION("Server errors back off and report the host") {
        mirror::MirrorManager mirrors(http, {site("flaky", "https://flaky.example.org/", 1)}, options);
        DownloadEngine engine(http, &mirrors, &catalog);
        engine.sleeper([&](std::chrono::milliseconds d) { sleeps.push_back(d); });

        const std::string url = "https://flaky.example.org/cache/epub/7/pg7.epub";
        http->enqueue(url, FakeResponse{.status = 502});
        http->serve_body(url, make_body(100));

        REQUIRE(!engine.download(7, "", dir / "book.epub"));
        CHECK(sleeps.size() == 1);

        auto flaky = mirrors.find("https://flaky.example.org/");
        CHECK(flaky->failure_count == 0);
        CHECK(flaky->site.active);
    }
}

TEST_CASE_METHOD(EngineFixture, "DownloadEngine incomplete download recovery", "[engine]") {
    SECTION("find_incomplete_downloads flags small EPUB files only") {
        dir.write("small.epub", std::string(100, 'x'));
        dir.write("big.epub", std::string(20000, 'x'));
        dir.write("notes.txt", "x");
        fs::create_directories(dir / "nested");
        dir.write("nested/inner.epub", "x");

        auto found = engine.find_incomplete_downloads(dir.path());
        REQUIRE(found.size() == 1);
        CHECK(found[0] == dir / "small.epub");

        CHECK(engine.find_incomplete_downloads(dir / "absent").empty());
    }

    SECTION("resume_incomplete_downloads uses recorded sources") {
        auto body = make_body(12000);
        http->serve_body(SOURCE, body);
        dir.write("a.epub", body.substr(0, 500));
        dir.write("b.epub", "x");

        DownloadRecord record;
        record.book_id = 7;
        record.status = RecordStatus::downloading;
        record.download_path = (dir / "a.epub").string();
        record.source_url = SOURCE;
        catalog.update_record(record);

        auto partial = engine.find_incomplete_downloads(dir.path());
        REQUIRE(partial.size() == 2);

        auto results = engine.resume_incomplete_downloads(partial, engine.known_sources());
        CHECK(results[dir / "a.epub"]);
        CHECK(!results[dir / "b.epub"]);
        CHECK(dir.read(dir / "a.epub") == body);
        CHECK(http->requests().at(0).offset == 500);
        CHECK(catalog.record(7)->status == RecordStatus::completed);
    }
}

TEST_CASE_METHOD(EngineFixture, "DownloadEngine::verify_downloads", "[engine]") {
    auto add = [&](BookId id, const std::string& name, std::uint64_t total) {
        DownloadRecord r;
        r.book_id = id;
        r.status = RecordStatus::completed;
        r.download_path = (dir / name).string();
        r.total_bytes = total;
        catalog.update_record(r);
    };

    dir.write("ok.epub", std::string(50, 'x'));
    dir.write("short.epub", std::string(10, 'x'));
    add(1, "ok.epub", 50);
    add(2, "gone.epub", 50);
    add(3, "short.epub", 50);

    DownloadRecord pending;
    pending.book_id = 4;
    catalog.update_record(pending);

    auto report = engine.verify_downloads();
    CHECK(report.verified == std::vector<BookId>{1});
    CHECK(report.missing == std::vector<BookId>{2});
    CHECK(report.corrupted == std::vector<BookId>{3});
}

TEST_CASE("DownloadEngine writes finished records to the catalog file", "[engine][catalog]") {
    TempDir dir;
    auto http = std::make_shared<FakeHttpClient>();
    auto catalog_file = dir / "catalog.json";
    JsonCatalog catalog(catalog_file);
    DownloadEngine engine(http, nullptr, &catalog);
    engine.sleeper([](std::chrono::milliseconds) {});

    SECTION("Completed") {
        http->serve_body(SOURCE, make_body(4096));
        REQUIRE(!engine.download(7, SOURCE, dir / "book.epub", direct()));

        JsonCatalog reloaded(catalog_file);
        REQUIRE(!reloaded.load());
        auto record = reloaded.record(7);
        REQUIRE(record);
        CHECK(record->status == RecordStatus::completed);
        CHECK(record->bytes_downloaded == 4096);
        CHECK(record->source_url == SOURCE);
    }

    SECTION("Failed") {
        http->serve(SOURCE, FakeResponse{.status = 404});
        CHECK(engine.download(7, SOURCE, dir / "book.epub", direct()) == DownloadErrc::not_found);

        JsonCatalog reloaded(catalog_file);
        REQUIRE(!reloaded.load());
        auto record = reloaded.record(7);
        REQUIRE(record);
        CHECK(record->status == RecordStatus::failed);
        CHECK(!record->error_message.empty());
    }

    CHECK(!fs::exists(dir / "catalog.json.tmp"));
}
