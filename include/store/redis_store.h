#pragma once

#include "store/kv_store.h"

#include <chrono>
#include <utility>
#include <memory>
#include <string>

namespace sw { namespace redis { class Redis; } }

namespace shroud {
namespace store {

/**
 * @brief Redis-backed store on top of redis-plus-plus
 *
 * URL form: redis://[[user]:password@]host[:port][/db]. The client keeps a
 * small connection pool; AUTH and SELECT are part of every pooled
 * connection's handshake. A command that fails on a broken connection is
 * retried once; any other failure surfaces as utils::StoreError.
 */
class RedisStore : public IKeyValueStore {
public:
    struct Config {
        std::string url;
        uint32_t connect_timeout_ms = 2000;
        uint32_t command_timeout_ms = 2000;
        size_t pool_size = 4;
    };

    explicit RedisStore(const Config& config);
    ~RedisStore() override;

    /// PINGs the server so startup fails fast; throws utils::StoreError
    void connect();

    std::string name() const override { return "redis"; }

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value,
             std::optional<std::chrono::seconds> ttl) override;
    int64_t incr(const std::string& key) override;
    int64_t incrBy(const std::string& key, int64_t by) override;
    bool expire(const std::string& key, std::chrono::seconds ttl) override;
    int64_t incrementWindowed(const std::string& key, int64_t by, std::chrono::seconds ttl) override;
    int64_t hincrby(const std::string& key, const std::string& field, int64_t by) override;
    std::optional<std::string> hget(const std::string& key, const std::string& field) override;
    int64_t del(const std::string& key) override;
    void close() override;

    const std::string& host() const { return host_; }
    int port() const { return port_; }
    int db() const { return db_; }

private:
    template<typename Fn>
    auto run(const char* cmd, Fn&& fn) -> decltype(fn(std::declval<sw::redis::Redis&>()));

    Config config_;
    std::string host_;
    int port_ = 6379;
    std::string user_;
    std::string password_;
    int db_ = 0;

    std::unique_ptr<sw::redis::Redis> redis_;
};

} // namespace store
} // namespace shroud
