#ifndef REDIS_CACHE_HPP
#define REDIS_CACHE_HPP

#include "analysis_cache.hpp"
#include <string>
#include <mutex>
#include <optional>
#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct RedisEndpoint {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password;
};

// Shared analysis result cache in Redis, entries expire through SETEX
class RedisCache : public ResultCache {
public:
    explicit RedisCache(int ttl_seconds = 3600);
    ~RedisCache();

    RedisCache(const RedisCache&) = delete;
    RedisCache& operator=(const RedisCache&) = delete;

    // Initialize connection to Redis
    bool initialize(const std::string& host = "127.0.0.1", int port = 6379, const std::string& password = "");

    // redis://[user:][password@]host[:port][/db]; anything else yields the defaults
    static RedisEndpoint parseUrl(const std::string& redis_url);

    std::optional<json> get(const std::string& key) override;
    bool put(const std::string& key, const json& result) override;
    json stats() const override;

    // Check if Redis connection is healthy
    bool isConnected() const;

    std::string getConnectionStatus() const;

private:
    redisContext* context;
    std::string host_;
    int port_;
    std::string password_;
    int ttl_seconds_;
    bool connected_;
    mutable std::mutex mutex_;

    bool reconnect();
    void cleanup();

    static const std::string KEY_PREFIX;
    std::string redisKey(const std::string& key) const;
};

#endif // REDIS_CACHE_HPP
