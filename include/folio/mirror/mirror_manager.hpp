// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/config.hpp>
#include <folio/core/download_record.hpp>
#include <folio/core/error.hpp>
#include <folio/core/http_client.hpp>
#include <folio/mirror/mirror_site.hpp>
#include <folio/mirror/url_layout.hpp>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace folio::mirror {

// Health scoring constants
struct MirrorPolicy {
    double failure_decay{core::FAILURE_DECAY};
    double success_boost{core::SUCCESS_BOOST};
    double success_bonus{core::SUCCESS_BONUS};
    double probe_recovery{core::PROBE_RECOVERY};
    double probe_decay{core::PROBE_DECAY};
    double transport_decay{core::TRANSPORT_DECAY};
    std::uint32_t failure_threshold{core::FAILURE_THRESHOLD};
    std::size_t recent_capacity{core::RECENT_CAPACITY};
    std::size_t recent_exclusion{core::RECENT_EXCLUSION};
};

struct MirrorManagerOptions {
    std::filesystem::path config_path;       // empty disables persistence
    std::string primary_site{core::PRIMARY_SITE};
    MirrorPolicy policy;
    std::optional<std::uint32_t> seed;       // fixed seed for reproducible selection
    bool save_on_close{true};
};

struct MirrorStatus {
    MirrorSite site;
    std::uint32_t failure_count{0};
};

// Tracks mirror health and picks a host per request.
// All operations are thread-safe; health probes run outside the lock.
class MirrorManager {
public:
    // Loads options.config_path, falling back to the built-in list
    explicit MirrorManager(std::shared_ptr<core::HttpClient> http,
                           MirrorManagerOptions options = {});

    MirrorManager(std::shared_ptr<core::HttpClient> http,
                  std::vector<MirrorSite> sites,
                  MirrorManagerOptions options = {});

    ~MirrorManager();

    MirrorManager(const MirrorManager&) = delete;
    MirrorManager& operator=(const MirrorManager&) = delete;

    // Replaces the mirror list from the config file; on failure the built-in list is used
    [[nodiscard]] std::error_code load();

    [[nodiscard]] std::error_code save() const;

    // Weighted random choice among active mirrors; primary site if none are active
    [[nodiscard]] std::string select(std::optional<core::BookId> book = std::nullopt);

    [[nodiscard]] std::string build_url(core::BookId book, std::string_view base_url) const;

    // select() followed by build_url()
    [[nodiscard]] std::pair<std::string, std::string> url_for(core::BookId book);

    void report_failure(std::string_view base_url);
    void report_success(std::string_view base_url);

    // Keep a mirror out of the next select() call only
    void exclude_next(std::string_view base_url);

    // HEAD probe of the mirror's base URL; returns true if healthy
    bool check_health(std::string_view base_url);

    // Probes every mirror concurrently; returns healthy count
    std::size_t check_all();

    // Updates the mirror with the same base URL or appends a new one
    void add_mirror(MirrorSite site);

    bool remove_mirror(std::string_view base_url);

    void record_availability(core::BookId book, std::string_view base_url);

    [[nodiscard]] std::error_code add_layout(std::string domain, std::string path_template);

    [[nodiscard]] std::vector<MirrorStatus> mirrors() const;
    [[nodiscard]] std::optional<MirrorStatus> find(std::string_view base_url) const;
    [[nodiscard]] std::size_t active_count() const;

    // Normalized selection probabilities select() would use right now
    [[nodiscard]] std::vector<std::pair<std::string, double>>
    selection_weights(std::optional<core::BookId> book = std::nullopt) const;

    [[nodiscard]] const std::string& primary_site() const noexcept { return primary_site_; }
    [[nodiscard]] const MirrorPolicy& policy() const noexcept { return options_.policy; }

private:
    struct Entry {
        MirrorSite site;
        std::uint32_t failures{0};
    };

    enum class ProbeOutcome { healthy, http_error, transport_error };

    [[nodiscard]] Entry* find_locked(const std::string& base_url);
    [[nodiscard]] const Entry* find_locked(const std::string& base_url) const;
    [[nodiscard]] std::vector<const Entry*> candidates_locked(std::optional<core::BookId> book) const;
    [[nodiscard]] std::vector<double> weights_locked(const std::vector<const Entry*>& candidates) const;
    void record_failure_locked(Entry& entry, double new_score);
    void apply_probe(const std::string& base_url, ProbeOutcome outcome);
    void use_defaults_locked();

    std::shared_ptr<core::HttpClient> http_;
    MirrorManagerOptions options_;
    std::string primary_site_;
    UrlLayoutTable layouts_;

    std::vector<Entry> entries_;
    std::deque<std::string> recent_;
    std::set<std::string> excluded_next_;
    std::map<core::BookId, std::set<std::string>> availability_;
    std::mt19937 rng_;
    mutable std::mutex mutex_;
};

} // namespace folio::mirror
