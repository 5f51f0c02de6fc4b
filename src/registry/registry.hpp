/**
 * Mahilo Registry
 *
 * Owns and wires the routing core:
 * - Store (SQLite by default)
 * - Policy evaluator with the configured LLM judge
 * - Delivery dispatcher, retry queue and scheduler
 * - Message router and connection registration
 * - Reactor (epoll loop driving the retry tick)
 */
#pragma once
#include <atomic>
#include <memory>
#include <string>
#include "core/config.hpp"
#include "delivery/retry_scheduler.hpp"
#include "net/url_validator.hpp"
#include "policy/rules.hpp"
#include "router/connection_service.hpp"
#include "router/message_router.hpp"

namespace mahilo::store {
class Store;
} // namespace mahilo::store

namespace mahilo::util {
class Clock;
} // namespace mahilo::util

namespace mahilo::net {
class HttpClient;
} // namespace mahilo::net

namespace mahilo::services::llm {
class LLMProvider;
} // namespace mahilo::services::llm

namespace mahilo::policy {
class PolicyEvaluator;
class PolicyJudge;
} // namespace mahilo::policy

namespace mahilo::registry {

struct RegistryContext;
class Reactor;

class Registry {
public:
    using Config = core::RegistryConfig;

    // Anything left empty is built from the config
    struct Dependencies {
        std::unique_ptr<Reactor> reactor;
        std::unique_ptr<store::Store> store;
        std::unique_ptr<util::Clock> clock;
        std::unique_ptr<net::HttpClient> http_client;
        std::unique_ptr<services::llm::LLMProvider> llm_client;
        std::unique_ptr<policy::PolicyJudge> policy_judge;
        net::HostResolver resolver;
    };

    Registry();
    explicit Registry(const Config& config);
    Registry(const Config& config, Dependencies deps);
    ~Registry();

    // Non-copyable
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Initialize reactor, retry timer and signal handlers
    bool init();

    // Run the registry (blocks until shutdown)
    void run();

    // Request shutdown
    void shutdown();

    bool is_running() const { return running_; }

    // One retry tick; run() calls this every retry_tick_ms
    delivery::TickStats tick();

    router::SendResult send_message(const std::string& sender_id, const router::SendRequest& request);
    std::optional<router::GroupStatus> group_status(const std::string& message_id);
    router::HistoryResult history(const router::HistoryRequest& request);
    router::RegisterResult register_connection(const std::string& user_id,
                                               const router::RegisterRequest& request);
    policy::ContentCheck validate_policy(const std::string& policy_type, const std::string& content) const;

    store::Store& store();
    RegistryContext& context();

    const Config& get_config() const { return config_; }

private:
    Config config_;
    std::atomic<bool> running_{false};

    std::unique_ptr<Reactor> reactor_;
    std::unique_ptr<store::Store> store_;
    std::unique_ptr<util::Clock> clock_;
    std::unique_ptr<net::HttpClient> http_client_;
    std::unique_ptr<services::llm::LLMProvider> llm_client_;
    std::unique_ptr<policy::PolicyJudge> policy_judge_;
    std::unique_ptr<net::UrlValidator> url_validator_;
    std::unique_ptr<policy::PolicyEvaluator> evaluator_;
    std::unique_ptr<delivery::RetryQueue> retry_queue_;
    std::unique_ptr<delivery::DeliveryDispatcher> dispatcher_;
    std::unique_ptr<delivery::RetryScheduler> scheduler_;
    std::unique_ptr<router::MessageRouter> router_;
    std::unique_ptr<router::ConnectionService> connection_service_;
    std::unique_ptr<RegistryContext> context_;
};

} // namespace mahilo::registry
