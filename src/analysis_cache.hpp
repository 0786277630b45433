#ifndef ANALYSIS_CACHE_HPP
#define ANALYSIS_CACHE_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

using json = nlohmann::json;

// Stores finished analysis responses keyed by media source
class ResultCache {
public:
    virtual ~ResultCache() = default;

    virtual std::optional<json> get(const std::string& key) = 0;
    virtual bool put(const std::string& key, const json& result) = 0;
    virtual json stats() const = 0;

    // Stable key for a media URL
    static std::string keyFor(const std::string& url);
};

// In-process TTL cache. Evicts the oldest entry once full.
class AnalysisCache : public ResultCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit AnalysisCache(size_t max_entries = 100, std::chrono::seconds ttl = std::chrono::seconds(3600));

    std::optional<json> get(const std::string& key) override;
    bool put(const std::string& key, const json& result) override;
    json stats() const override;

    size_t size() const;

    // Reads and writes at an explicit time point
    std::optional<json> getAt(const std::string& key, Clock::time_point now);
    void putAt(const std::string& key, const json& result, Clock::time_point now);

private:
    struct Entry {
        json result;
        Clock::time_point stored_at;
        std::list<std::string>::iterator order;
    };

    size_t max_entries_;
    std::chrono::seconds ttl_;
    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> insertion_order_;
    mutable std::mutex mutex_;
    size_t hits_;
    size_t misses_;

    void erase(const std::string& key);
};

#endif // ANALYSIS_CACHE_HPP
