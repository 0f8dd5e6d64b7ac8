// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/download_engine.hpp>
#include <folio/core/http_client.hpp>
#include <folio/core/metadata_store.hpp>
#include <folio/core/settings.hpp>
#include <folio/core/shutdown.hpp>
#include <folio/mirror/mirror_manager.hpp>
#include <folio/queue/download_task.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace folio::cli {

// Process exit code, or the error that stopped the command
using CliResult = std::expected<int, std::error_code>;

enum class Command {
    none,
    download,
    resume,
    fetch,
    mirrors,
    verify
};

struct CliArgs {
    Command command{Command::none};
    std::vector<core::BookId> books;
    std::string url;
    std::string output_file;
    std::string config_path;
    std::string output_dir;
    queue::Priority priority{queue::Priority::normal};
    std::uint32_t workers{0};
    bool no_mirrors{false};
    bool check{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;  // first parse problem, empty when the line is valid
};

[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Applies command line overrides on top of loaded settings
void apply_overrides(const CliArgs& args, core::Settings& settings);

// Components shared by every command; saves the catalog on destruction.
// Queue workers hold the shared_ handles, so an abandoned worker keeps
// the catalog and engine alive after the session is gone.
class Session {
public:
    Session(core::Settings settings, core::ShutdownContext& shutdown);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Adds a catalog entry pointing at the primary site for unknown books
    void ensure_book(core::BookId book);

    [[nodiscard]] const core::Settings& settings() const noexcept { return settings_; }
    [[nodiscard]] core::ShutdownContext& shutdown() noexcept { return shutdown_; }
    [[nodiscard]] std::shared_ptr<core::HttpClient> http() const { return http_; }
    [[nodiscard]] mirror::MirrorManager& mirrors() noexcept { return *mirrors_; }
    [[nodiscard]] core::JsonCatalog& catalog() noexcept { return *catalog_; }
    [[nodiscard]] core::DownloadEngine& engine() noexcept { return *engine_; }
    [[nodiscard]] std::shared_ptr<core::JsonCatalog> shared_catalog() const { return catalog_; }
    [[nodiscard]] std::shared_ptr<core::DownloadEngine> shared_engine() const { return engine_; }

    [[nodiscard]] core::DownloadOptions download_options() const;

private:
    core::Settings settings_;
    core::ShutdownContext& shutdown_;
    std::shared_ptr<core::HttpClient> http_;
    std::shared_ptr<mirror::MirrorManager> mirrors_;
    std::shared_ptr<core::JsonCatalog> catalog_;
    std::shared_ptr<core::DownloadEngine> engine_;
};

[[nodiscard]] CliResult run(Session& session, const CliArgs& args);

// Queue the given books and wait for them
[[nodiscard]] CliResult download_books(Session& session, const CliArgs& args);

// Reload saved queue state and resume partial files
[[nodiscard]] CliResult resume(Session& session, const CliArgs& args);

// Single transfer of an arbitrary URL
[[nodiscard]] CliResult fetch(Session& session, const CliArgs& args);

[[nodiscard]] CliResult list_mirrors(Session& session, const CliArgs& args);

[[nodiscard]] CliResult verify(Session& session);

void print_help(std::string_view program_name) noexcept;

void print_version() noexcept;

} // namespace folio::cli
