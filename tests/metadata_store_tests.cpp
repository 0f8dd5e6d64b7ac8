// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <folio/core/metadata_store.hpp>
#include "temp_dir.hpp"

using namespace folio::core;
using folio::testing::TempDir;

namespace {

BookEntry sample_book() {
    return BookEntry{
        .id = 1342,
        .title = "Pride and Prejudice",
        .urls = {
            "https://www.gutenberg.org/ebooks/1342.epub3.images",
            "https://www.gutenberg.org/ebooks/1342.txt.utf-8",
            "https://www.gutenberg.org/cache/epub/1342/pg1342.epub",
            "https://www.gutenberg.org/ebooks/1342.html.images",
        },
    };
}

} // namespace

TEST_CASE("JsonCatalog lookups", "[catalog]") {
    JsonCatalog catalog;
    catalog.add_book(sample_book());

    SECTION("Only EPUB links are offered, in catalog order") {
        auto urls = catalog.download_urls(1342);
        REQUIRE(urls.size() == 2);
        CHECK(urls[0] == "https://www.gutenberg.org/ebooks/1342.epub3.images");
        CHECK(urls[1] == "https://www.gutenberg.org/cache/epub/1342/pg1342.epub");
    }

    SECTION("Unknown books have nothing") {
        CHECK(catalog.download_urls(11).empty());
        CHECK(!catalog.title(11));
        CHECK(!catalog.contains(11));
    }

    SECTION("Titles") {
        CHECK(catalog.contains(1342));
        CHECK(catalog.title(1342) == "Pride and Prejudice");
    }

    SECTION("Records replace earlier ones") {
        CHECK(!catalog.record(1342));
        CHECK(!catalog.is_completed(1342));

        DownloadRecord rec{.book_id = 1342, .status = RecordStatus::downloading, .bytes_downloaded = 10};
        catalog.update_record(rec);
        CHECK(catalog.record(1342)->bytes_downloaded == 10);

        rec.status = RecordStatus::completed;
        rec.bytes_downloaded = 20;
        catalog.update_record(rec);
        CHECK(catalog.is_completed(1342));
        CHECK(catalog.records().size() == 1);
    }

    SECTION("In-memory catalogs never touch disk") {
        CHECK(!catalog.load());
        CHECK(!catalog.save());
    }
}

TEST_CASE("JsonCatalog persistence", "[catalog]") {
    TempDir dir;

    SECTION("Books and records survive a reload") {
        {
            JsonCatalog catalog(dir / "data" / "catalog.json");
            catalog.add_book(sample_book());
            catalog.update_record(DownloadRecord{
                .book_id = 1342,
                .status = RecordStatus::failed,
                .bytes_downloaded = 512,
                .total_bytes = 4096,
                .download_path = "downloads/1342.epub",
                .source_url = "https://www.gutenberg.org/cache/epub/1342/pg1342.epub",
                .error_message = "Connection lost",
                .retry_count = 2,
            });
            REQUIRE(!catalog.save());
        }

        JsonCatalog reloaded(dir / "data" / "catalog.json");
        REQUIRE(!reloaded.load());
        CHECK(reloaded.title(1342) == "Pride and Prejudice");
        CHECK(reloaded.download_urls(1342).size() == 2);

        auto rec = reloaded.record(1342);
        REQUIRE(rec);
        CHECK(rec->status == RecordStatus::failed);
        CHECK(rec->bytes_downloaded == 512);
        CHECK(rec->total_bytes == 4096);
        CHECK(rec->download_path == "downloads/1342.epub");
        CHECK(rec->error_message == "Connection lost");
        CHECK(rec->retry_count == 2);
    }

    SECTION("Missing file loads as empty") {
        JsonCatalog catalog(dir / "absent.json");
        CHECK(!catalog.load());
        CHECK(catalog.records().empty());
    }

    SECTION("Malformed file is a parse error and keeps current contents") {
        dir.write("catalog.json", "{\"books\": [");
        JsonCatalog catalog(dir / "catalog.json");
        catalog.add_book(sample_book());

        CHECK(catalog.load() == DownloadErrc::parse_error);
        CHECK(catalog.contains(1342));
    }

    SECTION("Unknown record status reads as pending") {
        dir.write("catalog.json", R"({"books": [], "records": [{"book_id": 7, "status": "paused"}]})");
        JsonCatalog catalog(dir / "catalog.json");
        REQUIRE(!catalog.load());
        CHECK(catalog.record(7)->status == RecordStatus::pending);
    }
}

TEST_CASE("Record status names", "[catalog]") {
    for (auto status : {RecordStatus::pending, RecordStatus::downloading,
                        RecordStatus::completed, RecordStatus::failed}) {
        CHECK(parse_record_status(to_string(status)) == status);
    }
    CHECK(!parse_record_status("paused"));
}
