#include "registry/registry.hpp"
#include "registry/context.hpp"
#include "registry/reactor.hpp"
#include "delivery/dispatcher.hpp"
#include "delivery/retry_queue.hpp"
#include "net/http_client.hpp"
#include "policy/evaluator.hpp"
#include "policy/llm_judge.hpp"
#include "services/llm/client.hpp"
#include "store/sqlite_store.hpp"
#include "util/clock.hpp"
#include <spdlog/spdlog.h>
#include <csignal>

namespace mahilo::registry {

// Global registry pointer for signal handling
static Registry* g_registry = nullptr;

static void signal_handler(int signum) {
    spdlog::info("Received signal {}, shutting down...", signum);
    if (g_registry) {
        g_registry->shutdown();
    }
}

Registry::Registry()
    : Registry(Config{}) {}

Registry::Registry(const Config& config)
    : Registry(config, Dependencies{}) {}

Registry::Registry(const Config& config, Dependencies deps)
    : config_(config)
{
    reactor_ = std::move(deps.reactor);
    store_ = std::move(deps.store);
    clock_ = std::move(deps.clock);
    http_client_ = std::move(deps.http_client);
    llm_client_ = std::move(deps.llm_client);
    policy_judge_ = std::move(deps.policy_judge);

    if (!reactor_) {
        reactor_ = std::make_unique<Reactor>();
    }
    if (!store_) {
        store_ = std::make_unique<store::SqliteStore>(config_.database_path);
    }
    if (!clock_) {
        clock_ = std::make_unique<util::SystemClock>();
    }
    if (!http_client_) {
        http_client_ = std::make_unique<net::HttplibClient>();
    }
    if (!llm_client_) {
        services::llm::LLMConfig llm_config;
        llm_config.api_key = config_.llm.api_key;
        llm_config.model = config_.llm.model;
        llm_config.api_host = config_.llm.api_host;
        llm_config.timeout_ms = config_.llm.timeout_ms;
        llm_config.max_tokens = config_.llm.max_tokens;
        llm_client_ = std::make_unique<services::llm::LLMClient>(llm_config);
    }
    if (!policy_judge_) {
        if (llm_client_->is_configured()) {
            policy_judge_ = std::make_unique<policy::LlmPolicyJudge>(*llm_client_, config_.llm.fail_open);
        } else {
            policy_judge_ = std::make_unique<policy::DisabledPolicyJudge>();
        }
    }

    net::UrlPolicy url_policy;
    url_policy.production = config_.is_production();
    url_policy.allow_private_ips = config_.allow_private_ips;
    if (deps.resolver) {
        url_validator_ = std::make_unique<net::UrlValidator>(url_policy, std::move(deps.resolver));
    } else {
        url_validator_ = std::make_unique<net::UrlValidator>(url_policy);
    }

    delivery::DispatchOptions dispatch;
    dispatch.max_retries = config_.max_retries;
    dispatch.timeout_ms = config_.callback_timeout_ms;

    router::RouterOptions routing;
    routing.trusted_mode = config_.trusted_mode;
    routing.max_payload_size = config_.max_payload_size;

    evaluator_ = std::make_unique<policy::PolicyEvaluator>(*store_, *store_, *policy_judge_);
    retry_queue_ = std::make_unique<delivery::RetryQueue>();
    dispatcher_ = std::make_unique<delivery::DeliveryDispatcher>(
        *store_, *store_, *http_client_, *retry_queue_, *clock_, dispatch);
    scheduler_ = std::make_unique<delivery::RetryScheduler>(
        *retry_queue_, *dispatcher_, *store_, *clock_);
    router_ = std::make_unique<router::MessageRouter>(
        *store_, *store_, *store_, *evaluator_, *dispatcher_, *clock_, routing);
    connection_service_ = std::make_unique<router::ConnectionService>(
        *store_, *url_validator_, *clock_);

    context_ = std::make_unique<RegistryContext>(RegistryContext{
        config_,
        *reactor_,
        *store_,
        *clock_,
        *retry_queue_,
        *dispatcher_,
        *scheduler_,
        *evaluator_,
        *url_validator_,
        *router_,
        *connection_service_
    });
}

Registry::~Registry() {
    if (g_registry == this) {
        g_registry = nullptr;
    }
}

bool Registry::init() {
    spdlog::info("Initializing Mahilo registry...");

    if (!reactor_->init()) {
        spdlog::error("Failed to initialize reactor");
        return false;
    }

    int timer_fd = reactor_->add_timer(config_.retry_tick_ms, [this]() { tick(); });
    if (timer_fd < 0) {
        spdlog::error("Failed to start retry timer");
        return false;
    }

    // Set up signal handlers
    g_registry = this;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    spdlog::info("Registry initialized successfully");
    spdlog::info("Environment: {}", config_.environment);
    spdlog::info("Mode: {}", config_.trusted_mode ? "trusted (policies enforced)" : "end-to-end");
    spdlog::info("LLM judge: {} ({})",
        llm_client_->is_configured() ? "configured" : "not configured",
        config_.llm.model);
    spdlog::info("Retries: max {} (tick {}ms)", config_.max_retries, config_.retry_tick_ms);
    return true;
}

void Registry::run() {
    running_ = true;
    spdlog::info("Mahilo registry running");
    spdlog::info("Press Ctrl+C to exit");

    while (running_) {
        int n = reactor_->poll(100);
        if (n < 0) {
            spdlog::error("Reactor error, exiting");
            break;
        }
    }

    spdlog::info("Registry shutting down...");
    if (retry_queue_->size() > 0) {
        spdlog::warn("{} outstanding retries dropped", retry_queue_->size());
    }
    spdlog::info("Registry stopped");
}

void Registry::shutdown() {
    running_ = false;
}

delivery::TickStats Registry::tick() {
    return scheduler_->process_due();
}

router::SendResult Registry::send_message(const std::string& sender_id, const router::SendRequest& request) {
    return router_->send(sender_id, request);
}

std::optional<router::GroupStatus> Registry::group_status(const std::string& message_id) {
    return router_->group_status(message_id);
}

router::HistoryResult Registry::history(const router::HistoryRequest& request) {
    return router_->history(request);
}

router::RegisterResult Registry::register_connection(const std::string& user_id,
                                                     const router::RegisterRequest& request) {
    return connection_service_->register_connection(user_id, request);
}

policy::ContentCheck Registry::validate_policy(const std::string& policy_type,
                                               const std::string& content) const {
    return policy::validate_policy_content(policy_type, content);
}

store::Store& Registry::store() {
    return *store_;
}

RegistryContext& Registry::context() {
    return *context_;
}

} // namespace mahilo::registry
