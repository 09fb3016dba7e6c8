#pragma once

#include <memory>

namespace availability::core {
class AvailabilityEngine;
class BookingAdmission;
} // namespace availability::core

namespace availability::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<availability::core::AvailabilityEngine> engine;
  std::shared_ptr<availability::core::BookingAdmission>   admission;
};

} // namespace availability::service
