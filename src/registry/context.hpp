#pragma once

#include "core/config.hpp"

namespace mahilo::store {
class Store;
} // namespace mahilo::store

namespace mahilo::util {
class Clock;
} // namespace mahilo::util

namespace mahilo::delivery {
class RetryQueue;
class DeliveryDispatcher;
class RetryScheduler;
} // namespace mahilo::delivery

namespace mahilo::policy {
class PolicyEvaluator;
} // namespace mahilo::policy

namespace mahilo::net {
class UrlValidator;
} // namespace mahilo::net

namespace mahilo::router {
class MessageRouter;
class ConnectionService;
} // namespace mahilo::router

namespace mahilo::registry {

class Reactor;

struct RegistryContext {
    core::RegistryConfig& config;
    Reactor& reactor;
    store::Store& store;
    util::Clock& clock;
    delivery::RetryQueue& retry_queue;
    delivery::DeliveryDispatcher& dispatcher;
    delivery::RetryScheduler& scheduler;
    policy::PolicyEvaluator& evaluator;
    net::UrlValidator& url_validator;
    router::MessageRouter& router;
    router::ConnectionService& connections;
};

} // namespace mahilo::registry
