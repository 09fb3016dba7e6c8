#include "schedule_server.hpp"

#include "grpc_error.hpp"

namespace availability::grpc {

ScheduleServer::ScheduleServer(std::shared_ptr<availability::service::ScheduleService> svc) : service_(std::move(svc)) {
}

::grpc::Status ScheduleServer::GetWeek(::grpc::ServerContext*, const availability::engine::v1::GetWeekRequest* req, availability::engine::v1::GetWeekResponse* resp) {
  try {
    *resp = service_->GetWeek(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ScheduleServer::SaveWeek(::grpc::ServerContext*, const availability::engine::v1::SaveWeekRequest* req, availability::engine::v1::SaveWeekResponse* resp) {
  try {
    *resp = service_->SaveWeek(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ScheduleServer::AddSpecificDate(::grpc::ServerContext*, const availability::engine::v1::AddSpecificDateRequest* req, availability::engine::v1::SaveWeekResponse* resp) {
  try {
    *resp = service_->AddSpecificDate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ScheduleServer::CopyWeek(::grpc::ServerContext*, const availability::engine::v1::CopyWeekRequest* req, availability::engine::v1::WeekOperationResponse* resp) {
  try {
    *resp = service_->CopyWeek(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ScheduleServer::ApplyPattern(::grpc::ServerContext*, const availability::engine::v1::ApplyPatternRequest* req, availability::engine::v1::WeekOperationResponse* resp) {
  try {
    *resp = service_->ApplyPattern(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ScheduleServer::GetSummary(::grpc::ServerContext*, const availability::engine::v1::GetSummaryRequest* req, availability::engine::v1::GetSummaryResponse* resp) {
  try {
    *resp = service_->GetSummary(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ScheduleServer::AddBlackoutDate(::grpc::ServerContext*, const availability::engine::v1::AddBlackoutDateRequest* req, availability::engine::v1::AddBlackoutDateResponse* resp) {
  try {
    *resp = service_->AddBlackoutDate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ScheduleServer::ListBlackoutDates(::grpc::ServerContext*, const availability::engine::v1::ListBlackoutDatesRequest* req, availability::engine::v1::ListBlackoutDatesResponse* resp) {
  try {
    *resp = service_->ListBlackoutDates(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ScheduleServer::DeleteBlackoutDate(::grpc::ServerContext*, const availability::engine::v1::DeleteBlackoutDateRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteBlackoutDate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ScheduleServer::PurgeRetention(::grpc::ServerContext*, const availability::engine::v1::PurgeRetentionRequest* req, availability::engine::v1::PurgeRetentionResponse* resp) {
  try {
    *resp = service_->PurgeRetention(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace availability::grpc
