#include "redis_cache.hpp"
#include <iostream>

const std::string RedisCache::KEY_PREFIX = "fakescan:analysis:";

RedisCache::RedisCache(int ttl_seconds)
    : context(nullptr), port_(6379), ttl_seconds_(ttl_seconds), connected_(false) {
}

RedisCache::~RedisCache() {
    cleanup();
}

RedisEndpoint RedisCache::parseUrl(const std::string& redis_url) {
    RedisEndpoint endpoint;
    std::string url = redis_url;

    if (url.find("redis://") == 0) {
        url = url.substr(8);
    } else if (url.find("rediss://") == 0) {
        url = url.substr(9);
    } else {
        return endpoint;
    }

    // Drop the database part (/db)
    size_t db_pos = url.find('/');
    if (db_pos != std::string::npos) {
        url = url.substr(0, db_pos);
    }

    // username:password or :password
    size_t at_pos = url.rfind('@');
    if (at_pos != std::string::npos) {
        std::string auth_part = url.substr(0, at_pos);
        url = url.substr(at_pos + 1);

        size_t colon_pos = auth_part.find(':');
        endpoint.password = colon_pos != std::string::npos ? auth_part.substr(colon_pos + 1) : auth_part;
    }

    // [ipv6]:port
    if (!url.empty() && url[0] == '[') {
        size_t close = url.find(']');
        if (close != std::string::npos) {
            endpoint.host = url.substr(1, close - 1);
            url = url.substr(close + 1);
            if (!url.empty() && url[0] == ':') {
                try {
                    endpoint.port = std::stoi(url.substr(1));
                } catch (const std::exception&) {
                    endpoint.port = 6379;
                }
            }
            return endpoint;
        }
    }

    size_t colon_pos = url.find(':');
    if (colon_pos != std::string::npos) {
        endpoint.host = url.substr(0, colon_pos);
        try {
            endpoint.port = std::stoi(url.substr(colon_pos + 1));
        } catch (const std::exception&) {
            endpoint.port = 6379;
        }
    } else if (!url.empty()) {
        endpoint.host = url;
    }
    return endpoint;
}

bool RedisCache::initialize(const std::string& host, int port, const std::string& password) {
    std::lock_guard<std::mutex> lock(mutex_);
    host_ = host;
    port_ = port;
    password_ = password;

    cleanup();

    context = redisConnect(host_.c_str(), port_);
    if (context == nullptr || context->err) {
        if (context) {
            std::cerr << "Redis connection error: " << context->errstr << std::endl;
            redisFree(context);
            context = nullptr;
        } else {
            std::cerr << "Redis connection error: Can't allocate redis context" << std::endl;
        }
        connected_ = false;
        return false;
    }

    if (!password.empty()) {
        redisReply* reply = (redisReply*)redisCommand(context, "AUTH %s", password.c_str());
        if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
            std::cerr << "Redis authentication failed";
            if (reply && reply->str) {
                std::cerr << ": " << reply->str;
            }
            std::cerr << std::endl;

            if (reply) freeReplyObject(reply);
            cleanup();
            return false;
        }
        freeReplyObject(reply);
    }

    redisReply* ping_reply = (redisReply*)redisCommand(context, "PING");
    if (ping_reply == nullptr || ping_reply->type != REDIS_REPLY_STATUS ||
        std::string(ping_reply->str) != "PONG") {
        std::cerr << "Redis PING test failed" << std::endl;
        if (ping_reply) freeReplyObject(ping_reply);
        cleanup();
        return false;
    }
    freeReplyObject(ping_reply);

    connected_ = true;
    std::cout << "Redis connection established successfully to " << host_ << ":" << port_ << std::endl;
    return true;
}

bool RedisCache::put(const std::string& key, const json& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_ && !reconnect()) {
        std::cerr << "Redis not connected" << std::endl;
        return false;
    }

    std::string redis_key = redisKey(key);
    std::string payload = result.dump();
    redisReply* reply = (redisReply*)redisCommand(context, "SETEX %s %d %b",
                                                  redis_key.c_str(), ttl_seconds_,
                                                  payload.data(), payload.size());

    if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
        std::cerr << "Failed to store analysis in Redis";
        if (reply && reply->str) {
            std::cerr << ": " << reply->str;
        }
        std::cerr << std::endl;

        if (reply) {
            freeReplyObject(reply);
        } else {
            cleanup();
        }
        return false;
    }

    bool success = reply->type == REDIS_REPLY_STATUS && std::string(reply->str) == "OK";
    freeReplyObject(reply);
    return success;
}

std::optional<json> RedisCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_ && !reconnect()) {
        return std::nullopt;
    }

    std::string redis_key = redisKey(key);
    redisReply* reply = (redisReply*)redisCommand(context, "GET %s", redis_key.c_str());
    if (reply == nullptr) {
        std::cerr << "Redis GET command failed" << std::endl;
        cleanup();
        return std::nullopt;
    }

    if (reply->type != REDIS_REPLY_STRING) {
        if (reply->type != REDIS_REPLY_NIL) {
            std::cerr << "Unexpected Redis reply type for analysis: " << reply->type << std::endl;
        }
        freeReplyObject(reply);
        return std::nullopt;
    }

    std::string payload(reply->str, reply->len);
    freeReplyObject(reply);

    try {
        return json::parse(payload);
    } catch (const json::parse_error& e) {
        std::cerr << "Discarding unreadable cached analysis " << key << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

json RedisCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return json{
        {"backend", "redis"},
        {"connected", connected_ && context != nullptr && context->err == 0},
        {"endpoint", host_ + ":" + std::to_string(port_)},
        {"ttl_seconds", ttl_seconds_}
    };
}

bool RedisCache::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_ && context != nullptr && context->err == 0;
}

std::string RedisCache::getConnectionStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_ || !context) {
        return "Disconnected";
    }
    if (context->err != 0) {
        return std::string("Error: ") + context->errstr;
    }
    return "Connected to " + host_ + ":" + std::to_string(port_);
}

// Caller holds mutex_
bool RedisCache::reconnect() {
    cleanup();
    context = redisConnect(host_.c_str(), port_);
    if (context == nullptr || context->err) {
        cleanup();
        return false;
    }
    if (!password_.empty()) {
        redisReply* reply = (redisReply*)redisCommand(context, "AUTH %s", password_.c_str());
        bool ok = reply != nullptr && reply->type != REDIS_REPLY_ERROR;
        if (reply) freeReplyObject(reply);
        if (!ok) {
            cleanup();
            return false;
        }
    }
    connected_ = true;
    std::cout << "Redis connection re-established to " << host_ << ":" << port_ << std::endl;
    return true;
}

void RedisCache::cleanup() {
    if (context) {
        redisFree(context);
        context = nullptr;
    }
    connected_ = false;
}

std::string RedisCache::redisKey(const std::string& key) const {
    return KEY_PREFIX + key;
}
