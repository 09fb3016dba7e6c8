#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "availability/engine/v1.hpp"

using namespace availability::engine::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  availctl <addr> get-week <instructor> <week_start> [--no-cache]\n"
            << "  availctl <addr> save-week <instructor> <week_start> [<date>=<HH:MM-HH:MM>[,...]]... [--replace] [--clear <date>]\n"
            << "                  [--ignore-existing] [--base <version>] [--override] [--actor <id>]\n"
            << "  availctl <addr> add-date <instructor> <date> <start> <end>\n"
            << "  availctl <addr> copy-week <instructor> <from_week_start> <to_week_start>\n"
            << "  availctl <addr> apply-pattern <instructor> <from_week_start> <start_date> <end_date>\n"
            << "  availctl <addr> summary <instructor> <start_date> <end_date>\n"
            << "  availctl <addr> blackout-add <instructor> <date> [reason]\n"
            << "  availctl <addr> blackout-list <instructor>\n"
            << "  availctl <addr> blackout-delete <instructor> <id>\n"
            << "  availctl <addr> purge [--dry-run|--execute]\n"
            << "  availctl <addr> check <instructor> <date> <start> <end>\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  if (status.error_code() == grpc::StatusCode::ABORTED && !status.error_details().empty()) {
    std::cerr << "current_version=" << status.error_details() << "\n";
  }
  return 2;
}

static void PrintDays(const google::protobuf::RepeatedPtrField<DayWindows>& days) {
  for (const auto& day : days) {
    std::cout << day.date() << ":";
    for (const auto& window : day.windows()) {
      std::cout << " " << window.start_time() << "-" << window.end_time();
    }
    std::cout << "\n";
  }
}

// "2024-06-10=09:00-12:00,13:00-15:00"; an empty list after '=' clears the day.
static bool ParseDaySpec(const std::string& spec, DayWindows* out) {
  const auto eq = spec.find('=');
  if (eq == std::string::npos) {
    return false;
  }
  out->set_date(spec.substr(0, eq));

  std::string rest = spec.substr(eq + 1);
  while (!rest.empty()) {
    const auto comma = rest.find(',');
    const auto item  = rest.substr(0, comma);
    const auto dash  = item.find('-');
    if (dash == std::string::npos) {
      return false;
    }
    auto* window = out->add_windows();
    window->set_start_time(item.substr(0, dash));
    window->set_end_time(item.substr(dash + 1));
    rest = comma == std::string::npos ? "" : rest.substr(comma + 1);
  }
  return true;
}

static void PrintWeekOperation(const WeekOperationResponse& resp) {
  std::cout << "weeks_written=" << resp.weeks_written() << "\n";
  std::cout << "days_written=" << resp.days_written() << "\n";
  std::cout << "skipped_past_forbidden=" << resp.skipped_past_forbidden() << "\n";
  std::cout << "skipped_past_window=" << resp.skipped_past_window() << "\n";
}

static void PrintSaveWeek(const SaveWeekResponse& resp) {
  std::cout << "days_written=" << resp.days_written() << "\n";
  std::cout << "rows_written=" << resp.rows_written() << "\n";
  std::cout << "skipped_past_forbidden=" << resp.skipped_past_forbidden() << "\n";
  std::cout << "skipped_past_window=" << resp.skipped_past_window() << "\n";
  std::cout << "version=" << resp.version() << "\n";
  PrintDays(resp.week());
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto schedule_stub  = ScheduleService::NewStub(channel);
  auto admission_stub = BookingAdmissionService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "get-week") {
    if (argc < 5) return 1;

    GetWeekRequest req;
    req.set_instructor_id(argv[3]);
    req.set_week_start(argv[4]);
    req.set_bypass_cache(argc >= 6 && std::string(argv[5]) == "--no-cache");

    GetWeekResponse resp;
    auto            status = schedule_stub->GetWeek(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "version=" << resp.version() << "\n";
    std::cout << "last_modified_ms=" << resp.last_modified_ms() << "\n";
    PrintDays(resp.days());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "save-week") {
    if (argc < 5) return 1;

    SaveWeekRequest req;
    req.set_instructor_id(argv[3]);
    req.set_week_start(argv[4]);
    for (int i = 5; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--replace") {
        req.set_clear_existing(true);
      } else if (arg == "--ignore-existing") {
        req.set_ignore_existing(true);
      } else if (arg == "--override") {
        req.set_override(true);
      } else if (arg == "--base" && i + 1 < argc) {
        req.set_base_version(argv[++i]);
      } else if (arg == "--clear" && i + 1 < argc) {
        req.add_clear_dates(argv[++i]);
      } else if (arg == "--actor" && i + 1 < argc) {
        req.set_actor_id(argv[++i]);
      } else if (!ParseDaySpec(arg, req.add_days())) {
        std::cerr << "invalid day spec: " << arg << "\n";
        return 1;
      }
    }

    SaveWeekResponse resp;
    auto             status = schedule_stub->SaveWeek(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintSaveWeek(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "add-date") {
    if (argc < 7) return 1;

    AddSpecificDateRequest req;
    req.set_instructor_id(argv[3]);
    req.set_date(argv[4]);
    req.mutable_window()->set_start_time(argv[5]);
    req.mutable_window()->set_end_time(argv[6]);

    SaveWeekResponse resp;
    auto             status = schedule_stub->AddSpecificDate(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintSaveWeek(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "copy-week") {
    if (argc < 6) return 1;

    CopyWeekRequest req;
    req.set_instructor_id(argv[3]);
    req.set_from_week_start(argv[4]);
    req.set_to_week_start(argv[5]);

    WeekOperationResponse resp;
    auto                  status = schedule_stub->CopyWeek(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintWeekOperation(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "apply-pattern") {
    if (argc < 7) return 1;

    ApplyPatternRequest req;
    req.set_instructor_id(argv[3]);
    req.set_from_week_start(argv[4]);
    req.set_start_date(argv[5]);
    req.set_end_date(argv[6]);

    WeekOperationResponse resp;
    auto                  status = schedule_stub->ApplyPattern(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintWeekOperation(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "summary") {
    if (argc < 6) return 1;

    GetSummaryRequest req;
    req.set_instructor_id(argv[3]);
    req.set_start_date(argv[4]);
    req.set_end_date(argv[5]);

    GetSummaryResponse resp;
    auto               status = schedule_stub->GetSummary(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    // Sorted by date for stable output.
    const std::map<std::string, int32_t> counts(resp.window_counts().begin(), resp.window_counts().end());
    for (const auto& [date, count] : counts) {
      std::cout << date << "=" << count << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "blackout-add") {
    if (argc < 5) return 1;

    AddBlackoutDateRequest req;
    req.set_instructor_id(argv[3]);
    req.set_date(argv[4]);
    if (argc >= 6) req.set_reason(argv[5]);

    AddBlackoutDateResponse resp;
    auto                    status = schedule_stub->AddBlackoutDate(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.skipped()) {
      std::cout << "skipped\n";
    } else {
      std::cout << "id=" << resp.blackout().id() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "blackout-list") {
    if (argc < 4) return 1;

    ListBlackoutDatesRequest req;
    req.set_instructor_id(argv[3]);

    ListBlackoutDatesResponse resp;
    auto                      status = schedule_stub->ListBlackoutDates(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& blackout : resp.blackouts()) {
      std::cout << blackout.date() << " " << blackout.id() << " " << blackout.reason() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "blackout-delete") {
    if (argc < 5) return 1;

    DeleteBlackoutDateRequest req;
    req.set_instructor_id(argv[3]);
    req.set_id(argv[4]);

    google::protobuf::Empty resp;
    auto                    status = schedule_stub->DeleteBlackoutDate(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "purge") {
    PurgeRetentionRequest req;
    if (argc >= 4) {
      const std::string mode = argv[3];
      if (mode == "--dry-run") {
        req.set_dry_run(true);
      } else if (mode == "--execute") {
        req.set_dry_run(false);
      } else {
        Usage();
        return 1;
      }
    }

    PurgeRetentionResponse resp;
    auto                   status = schedule_stub->PurgeRetention(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cutoff=" << resp.cutoff_date() << "\n";
    std::cout << "rows=" << resp.rows_purged() << "\n";
    std::cout << "dry_run=" << (resp.dry_run() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "check") {
    if (argc < 7) return 1;

    CheckAdmissionRequest req;
    req.set_instructor_id(argv[3]);
    req.set_date(argv[4]);
    req.set_start_time(argv[5]);
    req.set_end_time(argv[6]);

    CheckAdmissionResponse resp;
    auto                   status = admission_stub->CheckAdmission(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.available() ? "available" : "unavailable") << " reason=" << AdmissionReason_Name(resp.reason()) << "\n";
    return 0;
  }

  Usage();
  return 1;
}
