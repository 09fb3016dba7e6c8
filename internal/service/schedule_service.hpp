#pragma once

#include "availability/engine/v1.hpp"
#include "service_context.hpp"

namespace availability::service {

/*
  Instructor-facing schedule surface. Translates wire messages to engine
  calls; all validation and policy live in the engine.
*/
class ScheduleService {
 public:
  explicit ScheduleService(ServiceContext ctx);

  availability::engine::v1::GetWeekResponse GetWeek(const availability::engine::v1::GetWeekRequest& req);

  availability::engine::v1::SaveWeekResponse SaveWeek(const availability::engine::v1::SaveWeekRequest& req);

  availability::engine::v1::SaveWeekResponse AddSpecificDate(const availability::engine::v1::AddSpecificDateRequest& req);

  availability::engine::v1::WeekOperationResponse CopyWeek(const availability::engine::v1::CopyWeekRequest& req);

  availability::engine::v1::WeekOperationResponse ApplyPattern(const availability::engine::v1::ApplyPatternRequest& req);

  availability::engine::v1::GetSummaryResponse GetSummary(const availability::engine::v1::GetSummaryRequest& req);

  availability::engine::v1::AddBlackoutDateResponse AddBlackoutDate(const availability::engine::v1::AddBlackoutDateRequest& req);

  availability::engine::v1::ListBlackoutDatesResponse ListBlackoutDates(const availability::engine::v1::ListBlackoutDatesRequest& req);

  void DeleteBlackoutDate(const availability::engine::v1::DeleteBlackoutDateRequest& req);

  availability::engine::v1::PurgeRetentionResponse PurgeRetention(const availability::engine::v1::PurgeRetentionRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace availability::service
