// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/mirror/mirror_manager.hpp>
#include <folio/core/logger.hpp>
#include <folio/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <future>
#include <iterator>
#include <numeric>

namespace folio::mirror {

namespace fs = std::filesystem;

namespace {

nlohmann::json timestamp_to_json(const std::optional<core::Timestamp>& tp) {
    if (!tp) return nullptr;
    return core::to_iso8601(*tp);
}

// Accepts ISO 8601 strings and epoch seconds
std::optional<core::Timestamp> timestamp_from_json(const nlohmann::json& j) {
    if (j.is_string()) {
        return core::from_iso8601(j.get<std::string>());
    }
    if (j.is_number()) {
        auto secs = std::chrono::duration<double>(j.get<double>());
        return core::Timestamp(std::chrono::duration_cast<core::Clock::duration>(secs));
    }
    return std::nullopt;
}

nlohmann::json site_to_json(const MirrorSite& site) {
    return {
        {"name", site.name},
        {"base_url", site.base_url},
        {"priority", site.priority},
        {"country", site.country.empty() ? nlohmann::json(nullptr) : nlohmann::json(site.country)},
        {"active", site.active},
        {"health_score", site.health_score},
        {"last_checked", timestamp_to_json(site.last_checked)},
        {"last_success", timestamp_to_json(site.last_success)},
    };
}

MirrorSite site_from_json(const nlohmann::json& j) {
    MirrorSite site;
    site.name = j.at("name").get<std::string>();
    site.base_url = normalize_base_url(j.at("base_url").get<std::string>());
    site.priority = std::max<std::uint32_t>(1, j.value("priority", std::uint32_t{1}));
    if (auto it = j.find("country"); it != j.end() && it->is_string()) {
        site.country = it->get<std::string>();
    }
    site.active = j.value("active", true);
    site.health_score = std::clamp(j.value("health_score", core::HEALTH_MAX),
                                   core::HEALTH_MIN, core::HEALTH_MAX);
    if (auto it = j.find("last_checked"); it != j.end()) {
        site.last_checked = timestamp_from_json(*it);
    }
    if (auto it = j.find("last_success"); it != j.end()) {
        site.last_success = timestamp_from_json(*it);
    }
    return site;
}

std::mt19937 make_rng(const std::optional<std::uint32_t>& seed) {
    if (seed) return std::mt19937(*seed);
    std::random_device rd;
    return std::mt19937(rd());
}

} // namespace

//=============================================================================
// MirrorManager
//=============================================================================

MirrorManager::MirrorManager(std::shared_ptr<core::HttpClient> http, MirrorManagerOptions options)
    : http_(std::move(http))
    , options_(std::move(options))
    , primary_site_(normalize_base_url(options_.primary_site))
    , layouts_(UrlLayoutTable::defaults())
    , rng_(make_rng(options_.seed)) {
    if (auto ec = load()) {
        FOLIO_LOG_WARN("Using built-in mirror list: {}", ec.message());
    }
}

MirrorManager::MirrorManager(std::shared_ptr<core::HttpClient> http,
                             std::vector<MirrorSite> sites,
                             MirrorManagerOptions options)
    : http_(std::move(http))
    , options_(std::move(options))
    , primary_site_(normalize_base_url(options_.primary_site))
    , layouts_(UrlLayoutTable::defaults())
    , rng_(make_rng(options_.seed)) {
    for (auto& site : sites) {
        add_mirror(std::move(site));
    }
}

MirrorManager::~MirrorManager() {
    if (options_.save_on_close && !options_.config_path.empty()) {
        if (auto ec = save()) {
            FOLIO_LOG_WARN("Failed to save mirrors on close: {}", ec.message());
        }
    }
}

void MirrorManager::use_defaults_locked() {
    entries_.clear();
    for (auto& site : default_mirrors()) {
        entries_.push_back(Entry{std::move(site), 0});
    }
}

std::error_code MirrorManager::load() {
    std::vector<Entry> loaded;
    std::error_code result;

    if (!options_.config_path.empty()) {
        std::error_code fs_ec;
        if (fs::exists(options_.config_path, fs_ec)) {
            try {
                std::ifstream file(options_.config_path);
                auto j = nlohmann::json::parse(file);
                for (const auto& item : j) {
                    loaded.push_back(Entry{site_from_json(item), 0});
                }
                FOLIO_LOG_INFO("Loaded {} mirrors from {}", loaded.size(), options_.config_path.string());
            } catch (const std::exception& e) {
                FOLIO_LOG_WARN("Error loading mirrors from {}: {}", options_.config_path.string(), e.what());
                loaded.clear();
                result = make_error_code(core::DownloadErrc::parse_error);
            }
        } else {
            FOLIO_LOG_DEBUG("Mirror file not found: {}", options_.config_path.string());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    recent_.clear();
    excluded_next_.clear();
    if (loaded.empty()) {
        use_defaults_locked();
    } else {
        entries_ = std::move(loaded);
    }
    return result;
}

std::error_code MirrorManager::save() const {
    if (options_.config_path.empty()) {
        return make_error_code(disk::DiskErrc::invalid_path);
    }

    try {
        auto j = nlohmann::json::array();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& e : entries_) {
                j.push_back(site_to_json(e.site));
            }
        }

        const auto& path = options_.config_path;
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
        file << j.dump(2) << '\n';
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
        FOLIO_LOG_DEBUG("Saved {} mirrors to {}", j.size(), path.string());
        return {};
    } catch (const std::exception& e) {
        FOLIO_LOG_WARN("Error saving mirrors: {}", e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

MirrorManager::Entry* MirrorManager::find_locked(const std::string& base_url) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.site.base_url == base_url; });
    return it == entries_.end() ? nullptr : &*it;
}

const MirrorManager::Entry* MirrorManager::find_locked(const std::string& base_url) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.site.base_url == base_url; });
    return it == entries_.end() ? nullptr : &*it;
}

std::vector<const MirrorManager::Entry*>
MirrorManager::candidates_locked(std::optional<core::BookId> book) const {
    std::vector<const Entry*> pool;
    for (const auto& e : entries_) {
        if (e.site.active) pool.push_back(&e);
    }
    if (pool.empty()) return pool;

    auto narrow = [&pool](auto&& keep) {
        std::vector<const Entry*> filtered;
        std::copy_if(pool.begin(), pool.end(), std::back_inserter(filtered), keep);
        if (!filtered.empty()) pool = std::move(filtered);
    };

    // Prefer mirrors known to have the book
    if (book) {
        auto it = availability_.find(*book);
        if (it != availability_.end() && !it->second.empty()) {
            narrow([&](const Entry* e) { return it->second.contains(e->site.base_url); });
        }
    }

    if (!excluded_next_.empty()) {
        narrow([&](const Entry* e) { return !excluded_next_.contains(e->site.base_url); });
    }

    // Small pools must not starve
    const auto exclusion = options_.policy.recent_exclusion;
    if (exclusion > 0 && pool.size() > exclusion) {
        auto first = recent_.size() > exclusion ? recent_.end() - static_cast<std::ptrdiff_t>(exclusion)
                                                : recent_.begin();
        std::set<std::string> recent(first, recent_.end());
        narrow([&](const Entry* e) { return !recent.contains(e->site.base_url); });
    }

    return pool;
}

std::vector<double> MirrorManager::weights_locked(const std::vector<const Entry*>& candidates) const {
    std::vector<double> weights;
    weights.reserve(candidates.size());
    for (const auto* e : candidates) {
        double failures = static_cast<double>(e->failures);
        double w = static_cast<double>(e->site.priority) * e->site.health_score / (1.0 + failures * failures);
        weights.push_back(std::max(0.0, w));
    }

    double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (total > 0.0) {
        for (auto& w : weights) w /= total;
    } else {
        std::fill(weights.begin(), weights.end(), 1.0 / static_cast<double>(weights.size()));
    }
    return weights;
}

std::string MirrorManager::select(std::optional<core::BookId> book) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto candidates = candidates_locked(book);
    excluded_next_.clear();

    if (candidates.empty()) {
        FOLIO_LOG_WARN("No active mirrors available, using primary site {}", primary_site_);
        return primary_site_;
    }

    auto weights = weights_locked(candidates);
    std::discrete_distribution<std::size_t> dist(weights.begin(), weights.end());
    const Entry* chosen = candidates[dist(rng_)];

    recent_.push_back(chosen->site.base_url);
    while (recent_.size() > options_.policy.recent_capacity) {
        recent_.pop_front();
    }

    FOLIO_LOG_DEBUG("Selected mirror: {} ({})", chosen->site.name, chosen->site.base_url);
    return chosen->site.base_url;
}

std::string MirrorManager::build_url(core::BookId book, std::string_view base_url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return layouts_.build(book, base_url);
}

std::pair<std::string, std::string> MirrorManager::url_for(core::BookId book) {
    auto base = select(book);
    auto url = build_url(book, base);
    return {std::move(base), std::move(url)};
}

void MirrorManager::record_failure_locked(Entry& entry, double new_score) {
    entry.failures++;
    entry.site.health_score = std::clamp(new_score, core::HEALTH_MIN, core::HEALTH_MAX);

    if (entry.failures > options_.policy.failure_threshold && entry.site.active) {
        entry.site.active = false;
        FOLIO_LOG_WARN("Mirror {} deactivated after {} failures", entry.site.name, entry.failures);
    }
}

void MirrorManager::report_failure(std::string_view base_url) {
    auto key = normalize_base_url(base_url);
    std::lock_guard<std::mutex> lock(mutex_);

    auto* entry = find_locked(key);
    if (!entry) {
        FOLIO_LOG_DEBUG("Failure reported for unknown mirror {}", key);
        return;
    }

    record_failure_locked(*entry, entry->site.health_score * options_.policy.failure_decay);
    FOLIO_LOG_DEBUG("Mirror {} failure {} (health {:.2f})",
                    entry->site.name, entry->failures, entry->site.health_score);
}

void MirrorManager::report_success(std::string_view base_url) {
    auto key = normalize_base_url(base_url);
    std::lock_guard<std::mutex> lock(mutex_);

    auto* entry = find_locked(key);
    if (!entry) return;

    const auto& policy = options_.policy;
    entry->failures = 0;
    entry->site.health_score = std::clamp(
        entry->site.health_score * policy.success_boost + policy.success_bonus,
        core::HEALTH_MIN, core::HEALTH_MAX);
    entry->site.last_success = core::Clock::now();

    if (!entry->site.active) {
        entry->site.active = true;
        FOLIO_LOG_INFO("Mirror {} reactivated", entry->site.name);
    }
}

void MirrorManager::exclude_next(std::string_view base_url) {
    auto key = normalize_base_url(base_url);
    std::lock_guard<std::mutex> lock(mutex_);
    excluded_next_.insert(std::move(key));
}

void MirrorManager::apply_probe(const std::string& base_url, ProbeOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto* entry = find_locked(base_url);
    if (!entry) return;  // removed while probing

    const auto& policy = options_.policy;
    auto now = core::Clock::now();
    entry->site.last_checked = now;

    switch (outcome) {
        case ProbeOutcome::healthy:
            entry->site.health_score = std::min(core::HEALTH_MAX, entry->site.health_score + policy.probe_recovery);
            entry->failures = 0;
            entry->site.last_success = now;
            if (!entry->site.active) {
                entry->site.active = true;
                FOLIO_LOG_INFO("Mirror {} is healthy again", entry->site.name);
            }
            break;
        case ProbeOutcome::http_error:
            record_failure_locked(*entry, entry->site.health_score - policy.probe_decay);
            break;
        case ProbeOutcome::transport_error:
            record_failure_locked(*entry, entry->site.health_score - policy.transport_decay);
            break;
    }
}

bool MirrorManager::check_health(std::string_view base_url) {
    auto key = normalize_base_url(base_url);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!find_locked(key)) return false;
    }

    auto result = http_->head(key);

    ProbeOutcome outcome = ProbeOutcome::healthy;
    if (!result) {
        outcome = core::is_http_status_error(result.error()) ? ProbeOutcome::http_error
                                                              : ProbeOutcome::transport_error;
        FOLIO_LOG_WARN("Health check failed for {}: {}", key, result.error().message());
    }

    apply_probe(key, outcome);
    return outcome == ProbeOutcome::healthy;
}

std::size_t MirrorManager::check_all() {
    std::vector<std::string> urls;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& e : entries_) {
            urls.push_back(e.site.base_url);
        }
    }

    std::vector<std::future<bool>> probes;
    probes.reserve(urls.size());
    for (const auto& url : urls) {
        probes.push_back(std::async(std::launch::async, [this, url] { return check_health(url); }));
    }

    std::size_t healthy = 0;
    for (auto& p : probes) {
        if (p.get()) ++healthy;
    }

    FOLIO_LOG_INFO("Health check: {}/{} mirrors healthy", healthy, urls.size());
    return healthy;
}

void MirrorManager::add_mirror(MirrorSite site) {
    site.base_url = normalize_base_url(site.base_url);
    site.health_score = std::clamp(site.health_score, core::HEALTH_MIN, core::HEALTH_MAX);
    site.priority = std::max<std::uint32_t>(1, site.priority);

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* entry = find_locked(site.base_url)) {
        entry->site.name = std::move(site.name);
        entry->site.priority = site.priority;
        entry->site.country = std::move(site.country);
        entry->site.active = true;
        FOLIO_LOG_INFO("Updated mirror: {} ({})", entry->site.name, entry->site.base_url);
        return;
    }

    FOLIO_LOG_DEBUG("Added mirror: {} ({})", site.name, site.base_url);
    entries_.push_back(Entry{std::move(site), 0});
}

bool MirrorManager::remove_mirror(std::string_view base_url) {
    auto key = normalize_base_url(base_url);
    std::lock_guard<std::mutex> lock(mutex_);

    auto removed = std::erase_if(entries_, [&](const Entry& e) { return e.site.base_url == key; });
    if (removed == 0) return false;

    std::erase(recent_, key);
    excluded_next_.erase(key);
    for (auto& [book, hosts] : availability_) {
        hosts.erase(key);
    }

    FOLIO_LOG_INFO("Removed mirror {}", key);
    return true;
}

void MirrorManager::record_availability(core::BookId book, std::string_view base_url) {
    auto key = normalize_base_url(base_url);
    std::lock_guard<std::mutex> lock(mutex_);
    availability_[book].insert(std::move(key));
}

std::error_code MirrorManager::add_layout(std::string domain, std::string path_template) {
    std::lock_guard<std::mutex> lock(mutex_);
    return layouts_.add(std::move(domain), std::move(path_template));
}

std::vector<MirrorStatus> MirrorManager::mirrors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MirrorStatus> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
        out.push_back(MirrorStatus{e.site, e.failures});
    }
    return out;
}

std::optional<MirrorStatus> MirrorManager::find(std::string_view base_url) const {
    auto key = normalize_base_url(base_url);
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto* e = find_locked(key)) {
        return MirrorStatus{e->site, e->failures};
    }
    return std::nullopt;
}

std::size_t MirrorManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
                                                  [](const Entry& e) { return e.site.active; }));
}

std::vector<std::pair<std::string, double>>
MirrorManager::selection_weights(std::optional<core::BookId> book) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto candidates = candidates_locked(book);
    if (candidates.empty()) return {};

    auto weights = weights_locked(candidates);
    std::vector<std::pair<std::string, double>> out;
    out.reserve(candidates.size());
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        out.emplace_back(candidates[i]->site.base_url, weights[i]);
    }
    return out;
}

} // namespace folio::mirror
