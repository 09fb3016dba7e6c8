#pragma once

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/engine_options.hpp"

namespace availability::db {
class Repository;
}
namespace availability::core {
class AvailabilityEngine;
class BookingAdmission;
} // namespace availability::core

namespace availability::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<core::AvailabilityEngine>     engine;
  std::shared_ptr<core::BookingAdmission>       admission;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

// Policy section of the config as engine options. Throws
// std::invalid_argument on unsupported values.
core::EngineOptions BuildEngineOptions(const availability::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const availability::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows concrete storage, cache and
  clock types.
*/
Application Build(const availability::runtime::config::RuntimeConfig& config);

} // namespace availability::factory
