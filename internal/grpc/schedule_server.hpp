#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "availability/engine/v1.hpp"
#include "internal/service/schedule_service.hpp"

namespace availability::grpc {

class ScheduleServer final : public availability::engine::v1::ScheduleService::Service {
 public:
  explicit ScheduleServer(std::shared_ptr<availability::service::ScheduleService> svc);

  ::grpc::Status GetWeek(::grpc::ServerContext*, const availability::engine::v1::GetWeekRequest*, availability::engine::v1::GetWeekResponse*) override;

  ::grpc::Status SaveWeek(::grpc::ServerContext*, const availability::engine::v1::SaveWeekRequest*, availability::engine::v1::SaveWeekResponse*) override;

  ::grpc::Status AddSpecificDate(::grpc::ServerContext*, const availability::engine::v1::AddSpecificDateRequest*, availability::engine::v1::SaveWeekResponse*) override;

  ::grpc::Status CopyWeek(::grpc::ServerContext*, const availability::engine::v1::CopyWeekRequest*, availability::engine::v1::WeekOperationResponse*) override;

  ::grpc::Status ApplyPattern(::grpc::ServerContext*, const availability::engine::v1::ApplyPatternRequest*, availability::engine::v1::WeekOperationResponse*) override;

  ::grpc::Status GetSummary(::grpc::ServerContext*, const availability::engine::v1::GetSummaryRequest*, availability::engine::v1::GetSummaryResponse*) override;

  ::grpc::Status AddBlackoutDate(::grpc::ServerContext*, const availability::engine::v1::AddBlackoutDateRequest*, availability::engine::v1::AddBlackoutDateResponse*) override;

  ::grpc::Status ListBlackoutDates(::grpc::ServerContext*, const availability::engine::v1::ListBlackoutDatesRequest*, availability::engine::v1::ListBlackoutDatesResponse*) override;

  ::grpc::Status DeleteBlackoutDate(::grpc::ServerContext*, const availability::engine::v1::DeleteBlackoutDateRequest*, google::protobuf::Empty*) override;

  ::grpc::Status PurgeRetention(::grpc::ServerContext*, const availability::engine::v1::PurgeRetentionRequest*, availability::engine::v1::PurgeRetentionResponse*) override;

 private:
  std::shared_ptr<availability::service::ScheduleService> service_;
};

} // namespace availability::grpc
