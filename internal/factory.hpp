#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/service/service_context.hpp"

namespace alo::delivery {
class DeliveryQueue;
class DeliveryEngine;
class DeliveryWorker;
}
namespace alo::push {
class PushTransport;
}
namespace alo::scheduler {
class PeriodicLoop;
}

namespace alo::factory {

/*
  Application

  Owns all long-lived singletons used by the daemon.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  Application();
  ~Application();

  Application(Application&&) noexcept;
  Application& operator=(Application&&) noexcept;

  service::ServiceContext context;

  std::shared_ptr<delivery::DeliveryQueue>  queue;
  std::shared_ptr<push::PushTransport>      transport;
  std::shared_ptr<delivery::DeliveryEngine> engine;
  std::shared_ptr<delivery::DeliveryWorker> delivery_worker; // null when delivery is disabled

  std::vector<std::unique_ptr<scheduler::PeriodicLoop>> loops;
  std::vector<std::unique_ptr<::grpc::Service>>         grpc_services;

  void StartBackground();
  void StopBackground();
};

std::shared_ptr<db::Repository> BuildRepository(const alo::runtime::config::RuntimeConfig& config);

std::shared_ptr<push::PushTransport> BuildTransport(const alo::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config. This is the
  composition root: the only place that knows concrete backend types.
  Background work starts with StartBackground().
*/
Application Build(const alo::runtime::config::RuntimeConfig& config);

} // namespace alo::factory
