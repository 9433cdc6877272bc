#include "lifeline/core/config.hpp"
#include "lifeline/core/logging.hpp"
#include "lifeline/session/session_guard.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

using namespace lifeline;

namespace {

void print_usage() {
    std::cerr << "Usage: lifeline [--config <path>] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  status <session>        checkpoint count, last checkpoint and risk\n"
              << "  list <session>          checkpoints of a session, newest first\n"
              << "  resume-check <session>  show the resume decision without consuming it\n"
              << "  cleanup [days]          delete checkpoints and signal history older than days\n";
}

// Stored text is not guaranteed to be valid UTF-8
void print_json(const core::Json& j) {
    std::cout << j.dump(2, ' ', false, core::Json::error_handler_t::replace) << "\n";
}

int fail(const core::Error& error) {
    std::cerr << "error: " << error.full_message() << "\n";
    return 1;
}

int cmd_status(session::SessionGuard& guard, const std::string& session_id) {
    auto status = guard.session_status(session_id);
    if (status.is_err()) {
        return fail(status.error());
    }
    print_json(status.value().to_json());
    return 0;
}

int cmd_list(session::SessionGuard& guard, const std::string& session_id) {
    auto headers = guard.store().list_headers(session_id);
    if (headers.is_err()) {
        return fail(headers.error());
    }

    core::Json out = core::Json::array();
    for (const auto& h : headers.value()) {
        core::Json row{
            {"id", h.id},
            {"checkpoint_number", h.checkpoint_number},
            {"created_at", core::to_millis(h.created_at)},
            {"triggered_by", std::string(checkpoint::trigger_to_string(h.triggered_by))},
            {"crash_risk", std::string(signals::crash_risk_to_string(h.crash_risk))},
            {"operation", h.operation},
            {"progress", h.progress},
            {"compressed_size", h.compressed_size},
            {"restored", h.is_restored()}
        };
        out.push_back(std::move(row));
    }
    print_json(out);
    return 0;
}

int cmd_resume_check(session::SessionGuard& guard, const std::string& session_id) {
    auto decision = guard.detector().check_resume_needed(session_id);
    print_json(decision.to_json());
    if (decision.prompt) {
        std::cout << "\n" << decision.prompt->render() << "\n";
    }
    return 0;
}

int cmd_cleanup(session::SessionGuard& guard, int days) {
    auto checkpoints = guard.store().cleanup(days);
    if (checkpoints.is_err()) {
        return fail(checkpoints.error());
    }
    auto history = guard.store().cleanup_signal_history(days);
    if (history.is_err()) {
        return fail(history.error());
    }

    session::MaintenanceReport report;
    report.checkpoints_deleted = checkpoints.value();
    report.signal_records_deleted = history.value();
    print_json(report.to_json());
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    core::fs::path config_path = core::Config::default_path();
    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            config_path = core::expand_path(args[++i]);
        } else if (args[i] == "-h" || args[i] == "--help") {
            print_usage();
            return 0;
        } else {
            positional.push_back(args[i]);
        }
    }

    if (positional.empty()) {
        print_usage();
        return 2;
    }

    core::Config config = core::Config::load_or_default(config_path);
    core::configure_logging(config.observability);

    auto guard = session::SessionGuard::open(config);
    if (guard.is_err()) {
        return fail(guard.error());
    }

    const std::string& command = positional[0];
    if (command == "status" || command == "list" || command == "resume-check") {
        if (positional.size() < 2) {
            print_usage();
            return 2;
        }
        if (command == "status") {
            return cmd_status(*guard.value(), positional[1]);
        }
        if (command == "list") {
            return cmd_list(*guard.value(), positional[1]);
        }
        return cmd_resume_check(*guard.value(), positional[1]);
    }

    if (command == "cleanup") {
        int days = config.checkpoint.retention_days;
        if (positional.size() >= 2) {
            try {
                days = std::stoi(positional[1]);
            } catch (const std::exception&) {
                std::cerr << "error: invalid day count '" << positional[1] << "'\n";
                return 2;
            }
        }
        return cmd_cleanup(*guard.value(), days);
    }

    spdlog::error("Unknown command: {}", command);
    print_usage();
    return 2;
}
