#include "store/redis_store.h"
#include "utils/errors.h"
#include "utils/logger.h"
#include "utils/url.h"

#include <sw/redis++/redis++.h>

#include <stdexcept>

namespace shroud {
namespace store {

namespace {

// INCRBY and open the window when this call created the key (or it lost its TTL)
const char* kIncrementWindowedScript =
    "local v = redis.call('INCRBY', KEYS[1], ARGV[1]) "
    "if v == tonumber(ARGV[1]) or redis.call('TTL', KEYS[1]) == -1 then "
    "redis.call('EXPIRE', KEYS[1], ARGV[2]) end "
    "return v";

} // namespace

RedisStore::RedisStore(const Config& config)
    : config_(config) {
    utils::Url url;
    try {
        url = utils::Url::parse(config.url);
    } catch (const std::invalid_argument& e) {
        throw utils::StoreError(std::string("Invalid Redis URL: ") + e.what());
    }
    if (url.scheme != "redis") {
        throw utils::StoreError("Unsupported Redis URL scheme: " + url.scheme);
    }
    host_ = url.host;
    user_ = url.user;
    password_ = url.password;
    try {
        port_ = std::stoi(url.port);
    } catch (const std::exception&) {
        throw utils::StoreError("Invalid Redis port: " + url.port);
    }

    std::string db = url.path;
    while (!db.empty() && db.front() == '/') db.erase(0, 1);
    if (!db.empty()) {
        try {
            size_t pos = 0;
            db_ = std::stoi(db, &pos);
            if (pos != db.size() || db_ < 0) throw std::invalid_argument(db);
        } catch (const std::exception&) {
            throw utils::StoreError("Invalid Redis database index: " + db);
        }
    }

    sw::redis::ConnectionOptions options;
    options.host = host_;
    options.port = port_;
    if (!user_.empty()) options.user = user_;
    options.password = password_;
    options.db = db_;
    options.connect_timeout = std::chrono::milliseconds(config_.connect_timeout_ms);
    options.socket_timeout = std::chrono::milliseconds(config_.command_timeout_ms);

    sw::redis::ConnectionPoolOptions pool_options;
    pool_options.size = config_.pool_size > 0 ? config_.pool_size : 1;
    pool_options.wait_timeout = std::chrono::milliseconds(config_.command_timeout_ms);

    // Connections are opened lazily on first use
    redis_ = std::make_unique<sw::redis::Redis>(options, pool_options);
}

RedisStore::~RedisStore() = default;

template<typename Fn>
auto RedisStore::run(const char* cmd, Fn&& fn) -> decltype(fn(std::declval<sw::redis::Redis&>())) {
    if (!redis_) {
        throw utils::StoreError(std::string("Redis store is closed (") + cmd + ")");
    }
    for (int attempt = 0; ; ++attempt) {
        try {
            return fn(*redis_);
        } catch (const sw::redis::TimeoutError& e) {
            throw utils::StoreError(std::string("Redis ") + cmd + " timed out: " + e.what());
        } catch (const sw::redis::IoError& e) {
            if (attempt >= 1) {
                throw utils::StoreError(std::string("Redis ") + cmd + " failed: " + e.what());
            }
            SHROUD_WARN("Redis connection lost ({}), reconnecting", e.what());
        } catch (const sw::redis::ClosedError& e) {
            if (attempt >= 1) {
                throw utils::StoreError(std::string("Redis ") + cmd + " failed: " + e.what());
            }
            SHROUD_WARN("Redis connection closed ({}), reconnecting", e.what());
        } catch (const sw::redis::Error& e) {
            throw utils::StoreError(std::string("Redis error on ") + cmd + ": " + e.what());
        }
    }
}

void RedisStore::connect() {
    run("PING", [](sw::redis::Redis& r) { return r.ping(); });
    SHROUD_INFO("Connected to Redis at {}:{} (db {})", host_, port_, db_);
}

std::optional<std::string> RedisStore::get(const std::string& key) {
    auto value = run("GET", [&](sw::redis::Redis& r) { return r.get(key); });
    if (!value) return std::nullopt;
    return std::string(*value);
}

void RedisStore::set(const std::string& key, const std::string& value,
                     std::optional<std::chrono::seconds> ttl) {
    run("SET", [&](sw::redis::Redis& r) {
        if (ttl) {
            return r.set(key, value, std::chrono::milliseconds(*ttl));
        }
        return r.set(key, value);
    });
}

int64_t RedisStore::incr(const std::string& key) {
    return run("INCR", [&](sw::redis::Redis& r) { return r.incr(key); });
}

int64_t RedisStore::incrBy(const std::string& key, int64_t by) {
    return run("INCRBY", [&](sw::redis::Redis& r) { return r.incrby(key, by); });
}

bool RedisStore::expire(const std::string& key, std::chrono::seconds ttl) {
    return run("EXPIRE", [&](sw::redis::Redis& r) { return r.expire(key, ttl); });
}

int64_t RedisStore::incrementWindowed(const std::string& key, int64_t by, std::chrono::seconds ttl) {
    const std::string by_arg = std::to_string(by);
    const std::string ttl_arg = std::to_string(ttl.count());
    return run("EVAL", [&](sw::redis::Redis& r) {
        return r.eval<long long>(kIncrementWindowedScript, {key}, {by_arg, ttl_arg});
    });
}

int64_t RedisStore::hincrby(const std::string& key, const std::string& field, int64_t by) {
    return run("HINCRBY", [&](sw::redis::Redis& r) { return r.hincrby(key, field, by); });
}

std::optional<std::string> RedisStore::hget(const std::string& key, const std::string& field) {
    auto value = run("HGET", [&](sw::redis::Redis& r) { return r.hget(key, field); });
    if (!value) return std::nullopt;
    return std::string(*value);
}

int64_t RedisStore::del(const std::string& key) {
    return run("DEL", [&](sw::redis::Redis& r) { return r.del(key); });
}

void RedisStore::close() {
    if (!redis_) return;
    redis_.reset();
    SHROUD_INFO("Redis connection closed");
}

} // namespace store
} // namespace shroud
