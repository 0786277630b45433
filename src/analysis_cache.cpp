#include "analysis_cache.hpp"
#include <functional>
#include <iterator>
#include <iomanip>
#include <sstream>

std::string ResultCache::keyFor(const std::string& url) {
    std::ostringstream key;
    key << std::hex << std::setw(16) << std::setfill('0') << std::hash<std::string>{}(url);
    return key.str();
}

AnalysisCache::AnalysisCache(size_t max_entries, std::chrono::seconds ttl)
    : max_entries_(max_entries), ttl_(ttl), hits_(0), misses_(0) {
}

void AnalysisCache::erase(const std::string& key) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        insertion_order_.erase(it->second.order);
        entries_.erase(it);
    }
}

std::optional<json> AnalysisCache::getAt(const std::string& key, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }
    if (now - it->second.stored_at >= ttl_) {
        erase(key);
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return it->second.result;
}

void AnalysisCache::putAt(const std::string& key, const json& result, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    erase(key);

    while (!entries_.empty() && entries_.size() >= max_entries_) {
        erase(insertion_order_.front());
    }
    if (max_entries_ == 0) {
        return;
    }

    insertion_order_.push_back(key);
    Entry entry;
    entry.result = result;
    entry.stored_at = now;
    entry.order = std::prev(insertion_order_.end());
    entries_.emplace(key, std::move(entry));
}

std::optional<json> AnalysisCache::get(const std::string& key) {
    return getAt(key, Clock::now());
}

bool AnalysisCache::put(const std::string& key, const json& result) {
    putAt(key, result, Clock::now());
    return true;
}

size_t AnalysisCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

json AnalysisCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return json{
        {"backend", "memory"},
        {"entries", entries_.size()},
        {"max_entries", max_entries_},
        {"ttl_seconds", ttl_.count()},
        {"hits", hits_},
        {"misses", misses_}
    };
}
