#include "schedule_service.hpp"

#include <stdexcept>

#include "internal/bitmap/bit_codec.hpp"
#include "internal/core/availability_engine.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/date.hpp"

namespace availability::service {

using namespace availability::engine::v1;

namespace {

void FillDay(DayWindows* out, util::Date date, const std::vector<bitmap::Window>& windows) {
  out->set_date(util::FormatIsoDate(date));
  for (const auto& window : windows) {
    auto* w = out->add_windows();
    w->set_start_time(bitmap::FormatTimeOfDay(window.start_minute));
    w->set_end_time(bitmap::FormatTimeOfDay(window.end_minute));
  }
}

void FillWeek(google::protobuf::RepeatedPtrField<DayWindows>* out, const core::WeekView& week) {
  for (const auto& day : week.days) {
    FillDay(out->Add(), day.date, day.windows);
  }
}

SaveWeekResponse ToResponse(const core::SaveWeekResult& result) {
  SaveWeekResponse resp;
  resp.set_days_written(result.days_written);
  resp.set_rows_written(result.rows_written);
  resp.set_version(result.version);
  resp.set_skipped_past_forbidden(result.skipped.past_forbidden);
  resp.set_skipped_past_window(result.skipped.past_window);
  FillWeek(resp.mutable_week(), result.week);
  return resp;
}

WeekOperationResponse ToResponse(const core::WeekOperationResult& result) {
  WeekOperationResponse resp;
  resp.set_weeks_written(result.weeks_written);
  resp.set_days_written(result.days_written);
  resp.set_skipped_past_forbidden(result.skipped.past_forbidden);
  resp.set_skipped_past_window(result.skipped.past_window);
  return resp;
}

BlackoutDate ToBlackout(const db::model::BlackoutRecord& record) {
  BlackoutDate out;
  out.set_id(record.id);
  out.set_instructor_id(record.instructor_id);
  out.set_date(record.day_date);
  out.set_reason(record.reason);
  out.set_created_at_ms(record.created_at_ms);
  return out;
}

} // namespace

ScheduleService::ScheduleService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.engine) {
    throw std::invalid_argument("ScheduleService requires an engine");
  }
}

GetWeekResponse ScheduleService::GetWeek(const GetWeekRequest& req) {
  return ObserveRpc("ScheduleService.GetWeek", req.instructor_id(), [&] {
    const auto week_start = util::ParseIsoDate(req.week_start());
    const auto week       = ctx_.engine->GetWeekAvailability(req.instructor_id(), week_start, !req.bypass_cache());

    GetWeekResponse resp;
    FillWeek(resp.mutable_days(), week);
    resp.set_version(week.version);
    if (auto last_modified = ctx_.engine->GetWeekLastModified(req.instructor_id(), week_start)) {
      resp.set_last_modified_ms(*last_modified);
    }
    return resp;
  });
}

SaveWeekResponse ScheduleService::SaveWeek(const SaveWeekRequest& req) {
  return ObserveRpc("ScheduleService.SaveWeek", req.instructor_id(), [&] {
    core::SaveWeekRequest request;
    request.instructor_id = req.instructor_id();
    request.week_start    = util::ParseIsoDate(req.week_start());
    for (const auto& day : req.days()) {
      core::DaySubmission submission;
      submission.date = util::ParseIsoDate(day.date());
      for (const auto& window : day.windows()) {
        submission.windows.push_back(core::RawWindow{window.start_time(), window.end_time()});
      }
      request.days.push_back(std::move(submission));
    }
    if (req.has_base_version()) {
      request.base_version = req.base_version();
    }
    request.override       = req.override();
    request.clear_existing = req.clear_existing();
    for (const auto& date : req.clear_dates()) {
      request.clear_dates.insert(util::ParseIsoDate(date));
    }
    request.ignore_existing = req.ignore_existing();
    request.actor_id        = req.actor_id();

    return ToResponse(ctx_.engine->SaveWeekBits(request));
  });
}

SaveWeekResponse ScheduleService::AddSpecificDate(const AddSpecificDateRequest& req) {
  return ObserveRpc("ScheduleService.AddSpecificDate", req.instructor_id(), [&] {
    const auto date = util::ParseIsoDate(req.date());
    return ToResponse(ctx_.engine->AddSpecificDateAvailability(
        req.instructor_id(), date, core::RawWindow{req.window().start_time(), req.window().end_time()}, req.actor_id()));
  });
}

WeekOperationResponse ScheduleService::CopyWeek(const CopyWeekRequest& req) {
  return ObserveRpc("ScheduleService.CopyWeek", req.instructor_id(), [&] {
    return ToResponse(ctx_.engine->CopyWeek(req.instructor_id(), util::ParseIsoDate(req.from_week_start()),
                                            util::ParseIsoDate(req.to_week_start()), req.actor_id()));
  });
}

WeekOperationResponse ScheduleService::ApplyPattern(const ApplyPatternRequest& req) {
  return ObserveRpc("ScheduleService.ApplyPattern", req.instructor_id(), [&] {
    return ToResponse(ctx_.engine->ApplyPatternToRange(req.instructor_id(), util::ParseIsoDate(req.from_week_start()),
                                                       util::ParseIsoDate(req.start_date()), util::ParseIsoDate(req.end_date()),
                                                       req.actor_id()));
  });
}

GetSummaryResponse ScheduleService::GetSummary(const GetSummaryRequest& req) {
  return ObserveRpc("ScheduleService.GetSummary", req.instructor_id(), [&] {
    const auto counts =
        ctx_.engine->GetAvailabilitySummary(req.instructor_id(), util::ParseIsoDate(req.start_date()), util::ParseIsoDate(req.end_date()));

    GetSummaryResponse resp;
    for (const auto& [date, count] : counts) {
      (*resp.mutable_window_counts())[util::FormatIsoDate(date)] = count;
    }
    return resp;
  });
}

AddBlackoutDateResponse ScheduleService::AddBlackoutDate(const AddBlackoutDateRequest& req) {
  return ObserveRpc("ScheduleService.AddBlackoutDate", req.instructor_id(), [&] {
    AddBlackoutDateResponse resp;
    const auto              record = ctx_.engine->AddBlackoutDate(req.instructor_id(), util::ParseIsoDate(req.date()), req.reason());
    if (record) {
      *resp.mutable_blackout() = ToBlackout(*record);
    } else {
      resp.set_skipped(true);
    }
    return resp;
  });
}

ListBlackoutDatesResponse ScheduleService::ListBlackoutDates(const ListBlackoutDatesRequest& req) {
  return ObserveRpc("ScheduleService.ListBlackoutDates", req.instructor_id(), [&] {
    ListBlackoutDatesResponse resp;
    for (const auto& record : ctx_.engine->ListBlackoutDates(req.instructor_id())) {
      *resp.add_blackouts() = ToBlackout(record);
    }
    return resp;
  });
}

void ScheduleService::DeleteBlackoutDate(const DeleteBlackoutDateRequest& req) {
  ObserveRpc("ScheduleService.DeleteBlackoutDate", req.instructor_id(),
             [&] { ctx_.engine->DeleteBlackoutDate(req.instructor_id(), req.id()); });
}

PurgeRetentionResponse ScheduleService::PurgeRetention(const PurgeRetentionRequest& req) {
  return ObserveRpc("ScheduleService.PurgeRetention", "", [&] {
    std::optional<bool> dry_run;
    if (req.has_dry_run()) {
      dry_run = req.dry_run();
    }
    const auto result = ctx_.engine->PurgeRetention(dry_run);

    PurgeRetentionResponse resp;
    resp.set_rows_purged(result.rows_purged);
    resp.set_cutoff_date(util::FormatIsoDate(result.cutoff));
    resp.set_dry_run(result.dry_run);
    return resp;
  });
}

} // namespace availability::service
