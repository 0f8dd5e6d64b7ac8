// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/cli/commands.hpp>
#include <folio/cli/progress_bar.hpp>
#include <folio/core/logger.hpp>
#include <folio/core/url.hpp>
#include <folio/queue/batch.hpp>
#include <folio/queue/download_queue.hpp>
#include <folio/version.hpp>
#include <fmt/format.h>
#include <charconv>
#include <iostream>

namespace folio::cli {

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds PROGRESS_INTERVAL{200};

std::optional<Command> parse_command(std::string_view word) noexcept {
    if (word == "download") return Command::download;
    if (word == "resume") return Command::resume;
    if (word == "fetch") return Command::fetch;
    if (word == "mirrors") return Command::mirrors;
    if (word == "verify") return Command::verify;
    return std::nullopt;
}

template<typename T>
std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

queue::QueueOptions queue_options(const Session& session) {
    const auto& s = session.settings();
    queue::QueueOptions options;
    options.max_workers = s.max_workers;
    options.max_retries = s.max_retries;
    options.state_file = s.queue_state_file;
    return options;
}

void print_summary(const queue::DownloadQueue& q) {
    auto done = q.completed();
    auto failed = q.failed();

    std::cout << "\nCompleted: " << done.size() << "  Failed: " << failed.size() << "\n";
    for (const auto& task : failed) {
        std::cout << fmt::format("  book {}: {} ({} attempts)\n",
                                 task.book_id, task.error_message, task.retry_count);
    }
}

// Runs the queue until it drains or shutdown is requested
int run_queue(Session& session, queue::DownloadQueue& q, std::size_t expected, bool quiet) {
    if (auto ec = q.start()) {
        std::cerr << "Error: cannot start download queue: " << ec.message() << std::endl;
        return 1;
    }

    ProgressBar bar(expected, "Books", ProgressBar::Unit::books);
    while (!q.wait_idle(PROGRESS_INTERVAL)) {
        if (session.shutdown().requested()) break;
        if (!quiet) {
            auto st = q.status();
            bar.update(st.stats.completed + st.stats.failed);
        }
    }

    if (session.shutdown().requested()) {
        (void)session.shutdown().wait_completed(core::SHUTDOWN_TIMEOUT * 2);
        if (!quiet) bar.clear();
        std::cout << "Interrupted, unfinished books saved to "
                  << session.settings().queue_state_file << std::endl;
        print_summary(q);
        return 1;
    }

    if (!quiet) {
        auto st = q.status();
        bar.update(st.stats.completed + st.stats.failed);
        bar.finish();
    }
    q.stop(true);
    print_summary(q);
    return q.failed().empty() ? 0 : 1;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto fail = [&args](std::string message) {
        if (args.error.empty()) args.error = std::move(message);
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        auto value = [&]() -> std::optional<std::string_view> {
            if (i + 1 < argc) return std::string_view(argv[++i]);
            fail(fmt::format("missing value for {}", arg));
            return std::nullopt;
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "--no-mirrors") {
            args.no_mirrors = true;
        } else if (arg == "--check") {
            args.check = true;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value()) args.config_path = *v;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value()) args.output_dir = *v;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = value()) args.output_file = *v;
        } else if (arg == "-p" || arg == "--priority") {
            if (auto v = value()) {
                auto p = queue::parse_priority(*v);
                if (p) {
                    args.priority = *p;
                } else {
                    fail(fmt::format("invalid priority '{}'", *v));
                }
            }
        } else if (arg == "-w" || arg == "--workers") {
            if (auto v = value()) {
                auto n = parse_number<std::uint32_t>(*v);
                if (n && *n > 0) {
                    args.workers = *n;
                } else {
                    fail(fmt::format("invalid worker count '{}'", *v));
                }
            }
        } else if (arg.starts_with("-")) {
            fail(fmt::format("unknown option {}", arg));
        } else if (args.command == Command::none) {
            if (auto cmd = parse_command(arg)) {
                args.command = *cmd;
            } else {
                fail(fmt::format("unknown command '{}'", arg));
            }
        } else if (args.command == Command::download) {
            auto id = parse_number<core::BookId>(arg);
            if (id && *id > 0) {
                args.books.push_back(*id);
            } else {
                fail(fmt::format("invalid book id '{}'", arg));
            }
        } else if (args.command == Command::fetch && args.url.empty()) {
            args.url = arg;
        } else {
            fail(fmt::format("unexpected argument '{}'", arg));
        }
    }

    if (args.error.empty() && args.command == Command::download && args.books.empty()) {
        fail("download needs at least one book id");
    }
    if (args.error.empty() && args.command == Command::fetch && args.url.empty()) {
        fail("fetch needs a URL");
    }

    return args;
}

void apply_overrides(const CliArgs& args, core::Settings& settings) {
    if (!args.output_dir.empty()) settings.download_dir = args.output_dir;
    if (args.workers > 0) settings.max_workers = args.workers;
    if (args.no_mirrors) settings.use_mirrors = false;
}

//=============================================================================
// Session
//=============================================================================

Session::Session(core::Settings settings, core::ShutdownContext& shutdown)
    : settings_(std::move(settings))
    , shutdown_(shutdown) {
    core::HttpOptions http_options;
    http_options.user_agent = settings_.user_agent;
    http_options.connect_timeout_sec = settings_.timeout_sec;
    http_options.stall_timeout_sec = settings_.timeout_sec;
    http_ = std::make_shared<core::CurlHttpClient>(std::move(http_options));

    mirror::MirrorManagerOptions mirror_options;
    mirror_options.config_path = settings_.mirrors_file;
    mirror_options.primary_site = settings_.primary_site;
    mirrors_ = std::make_shared<mirror::MirrorManager>(http_, std::move(mirror_options));

    catalog_ = std::make_shared<core::JsonCatalog>(settings_.catalog_file);
    if (auto ec = catalog_->load()) {
        FOLIO_LOG_WARN("Catalog {} not loaded: {}", settings_.catalog_file, ec.message());
    }

    engine_ = std::make_shared<core::DownloadEngine>(
        http_, settings_.use_mirrors ? mirrors_ : nullptr, catalog_, &shutdown_);
}

Session::~Session() {
    if (auto ec = catalog_->save()) {
        FOLIO_LOG_ERROR("Failed to save catalog {}: {}", settings_.catalog_file, ec.message());
    }
}

void Session::ensure_book(core::BookId book) {
    if (catalog_->contains(book)) return;
    catalog_->add_book({book, {}, {mirrors_->build_url(book, settings_.primary_site)}});
    FOLIO_LOG_DEBUG("Book {} not in catalog, using primary site", book);
}

core::DownloadOptions Session::download_options() const {
    core::DownloadOptions options;
    options.resumable = settings_.resumable;
    options.verify_size = settings_.verify_size;
    options.use_mirrors = settings_.use_mirrors;
    return options;
}

//=============================================================================
// Commands
//=============================================================================

CliResult run(Session& session, const CliArgs& args) {
    switch (args.command) {
        case Command::download: return download_books(session, args);
        case Command::resume:   return resume(session, args);
        case Command::fetch:    return fetch(session, args);
        case Command::mirrors:  return list_mirrors(session, args);
        case Command::verify:   return verify(session);
        case Command::none:     break;
    }
    return std::unexpected(make_error_code(core::DownloadErrc::invalid_state));
}

CliResult download_books(Session& session, const CliArgs& args) {
    for (auto book : args.books) {
        session.ensure_book(book);
    }

    const auto& settings = session.settings();
    auto& engine = session.engine();

    queue::DownloadQueue q(session.shared_catalog(),
                           queue::engine_runner(session.shared_engine(), session.download_options()),
                           queue_options(session),
                           &session.shutdown());

    auto batch = queue::enqueue_many(q, args.books, args.priority, settings.download_dir,
                                     settings.metadata_concurrency);
    if (batch.succeeded == 0) {
        std::cerr << "Error: none of the requested books could be queued" << std::endl;
        return 1;
    }

    if (!args.quiet) {
        std::cout << "Downloading " << batch.succeeded << " books to "
                  << settings.download_dir << " with " << settings.max_workers << " workers\n";
    }

    int code = run_queue(session, q, batch.succeeded, args.quiet);
    return batch.failed == 0 ? code : 1;
}

CliResult resume(Session& session, const CliArgs& args) {
    const auto& settings = session.settings();
    auto& engine = session.engine();
    queue::DownloadQueue q(session.shared_catalog(),
                           queue::engine_runner(session.shared_engine(), session.download_options()),
                           queue_options(session),
                           &session.shutdown());

    auto restored = q.load_state();
    if (!restored) {
        return std::unexpected(restored.error());
    }

    int code = 0;

    auto partial = engine.find_incomplete_downloads(settings.download_dir, settings.incomplete_threshold);
    if (!partial.empty()) {
        std::cout << "Resuming " << partial.size() << " incomplete downloads\n";
        auto results = engine.resume_incomplete_downloads(partial, engine.known_sources());
        for (const auto& [path, ok] : results) {
            std::cout << (ok ? "  resumed " : "  failed  ") << path.string() << "\n";
            if (!ok) code = 1;
        }
    }

    if (*restored > 0) {
        std::cout << "Restored " << *restored << " queued books\n";
        if (run_queue(session, q, *restored, args.quiet) != 0) {
            code = 1;
        }
    }

    if (partial.empty() && *restored == 0) {
        std::cout << "Nothing to resume\n";
    }
    return code;
}

CliResult fetch(Session& session, const CliArgs& args) {
    auto url = core::Url::parse(args.url);
    if (!url) {
        return std::unexpected(url.error());
    }

    fs::path output = args.output_file;
    if (output.empty()) {
        auto name = url->filename();
        output = fs::path(session.settings().download_dir) / (name.empty() ? "download.epub" : name);
    }

    // No mirrors or catalog bookkeeping for arbitrary URLs
    core::DownloadEngine engine(session.http(), nullptr, nullptr, &session.shutdown());
    auto options = session.download_options();
    options.use_mirrors = false;
    options.skip_completed = false;

    ProgressBar bar(0, output.filename().string());
    core::ProgressCallback progress;
    if (!args.quiet) {
        progress = [&bar](std::uint64_t done, std::uint64_t total) {
            if (total > 0) bar.total(total);
            bar.update(done);
        };
    }

    if (auto ec = engine.download(0, url->full(), output, options, progress)) {
        if (!args.quiet) bar.clear();
        return std::unexpected(ec);
    }

    if (!args.quiet) {
        bar.finish();
        std::cout << "Saved to " << output.string() << std::endl;
    }
    return 0;
}

CliResult list_mirrors(Session& session, const CliArgs& args) {
    auto& mirrors = session.mirrors();

    if (args.check) {
        auto total = mirrors.mirrors().size();
        std::cout << "Checking " << total << " mirrors...\n";
        auto healthy = mirrors.check_all();
        std::cout << healthy << " of " << total << " mirrors healthy\n\n";
    }

    std::cout << fmt::format("{:<30} {:<48} {:<3} {:>4} {:>7} {:>5}  {}\n",
                             "NAME", "URL", "CC", "PRIO", "HEALTH", "FAILS", "STATE");
    for (const auto& m : mirrors.mirrors()) {
        std::cout << fmt::format("{:<30} {:<48} {:<3} {:>4} {:>7.2f} {:>5}  {}\n",
                                 m.site.name, m.site.base_url, m.site.country, m.site.priority,
                                 m.site.health_score, m.failure_count,
                                 m.site.active ? "active" : "inactive");
    }

    return mirrors.active_count() > 0 ? 0 : 1;
}

CliResult verify(Session& session) {
    auto report = session.engine().verify_downloads();

    std::cout << "Verified:  " << report.verified.size() << "\n";
    std::cout << "Missing:   " << report.missing.size() << "\n";
    for (auto id : report.missing) {
        std::cout << "  book " << id << "\n";
    }
    std::cout << "Corrupted: " << report.corrupted.size() << "\n";
    for (auto id : report.corrupted) {
        std::cout << "  book " << id << "\n";
    }

    return report.missing.empty() && report.corrupted.empty() ? 0 : 1;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "folio " << folio::version << " - bulk EPUB downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <COMMAND> [ARGS]\n";
    std::cout << "\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  download <ID>...        Download books by catalog id\n";
    std::cout << "  resume                  Continue saved queue and partial files\n";
    std::cout << "  fetch <URL>             Download a single URL\n";
    std::cout << "  mirrors                 List mirrors and their health\n";
    std::cout << "  verify                  Check completed downloads on disk\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             No progress output\n";
    std::cout << "  -c, --config <FILE>     Settings file (default: ~/.folio/config.json)\n";
    std::cout << "  -d, --directory <DIR>   Download directory\n";
    std::cout << "  -o, --output <FILE>     Output file for fetch\n";
    std::cout << "  -p, --priority <P>      high, normal, low or 1, 5, 10\n";
    std::cout << "  -w, --workers <N>       Concurrent downloads\n";
    std::cout << "      --no-mirrors        Always use the source URL\n";
    std::cout << "      --check             Probe mirrors before listing\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " download 1342 84 -p high\n";
    std::cout << "  " << program_name << " mirrors --check\n";
    std::cout << "  " << program_name << " fetch https://www.gutenberg.org/ebooks/11.epub -o alice.epub\n";
}

void print_version() noexcept {
    std::cout << "folio " << folio::version << std::endl;
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann_json\n";
}

} // namespace folio::cli
