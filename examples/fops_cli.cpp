/**
 * @file fops_cli.cpp
 * @brief Command-line front end for the operation engine
 *
 * USAGE:
 *   fops_cli copy   [options] SOURCE... DESTINATION
 *   fops_cli move   [options] SOURCE... DESTINATION
 *   fops_cli delete [options] SOURCE...
 *   fops_cli --request request.json
 *
 * OPTIONS:
 *   --policy stop|skip|overwrite|rename   conflict policy (default: stop, asks on stdin)
 *   --dry-run                             report what would happen, write nothing
 *   --sort name|extension|size|modified   copy order within each folder
 *   --descending                          reverse the --sort order
 *   --no-sync                             skip the filesystem flush after success
 *   --config FILE                         OperationConfig as JSON
 *   --json                                print every event as a JSON line
 *   --log-level LEVEL                     trace|debug|info|warn|error
 *
 * Ctrl+C cancels the running operation and rolls it back.
 */

#include "fops/core/logging.hpp"
#include "fops/events/components.hpp"
#include "fops/events/event_bus.hpp"
#include "fops/ops/registry.hpp"
#include "fops/ops/request_codec.hpp"
#include "fops/volume/manager.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cctype>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_interrupted = true;
    }
}

void print_usage() {
    std::cerr << "usage: fops_cli <copy|move|delete> [--policy P] [--dry-run] [--config FILE] [--json]\n"
                 "                [--sort COLUMN] [--descending] [--no-sync] [--log-level L] SOURCE... [DESTINATION]\n"
                 "       fops_cli --request FILE\n";
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

/// o/s/r/t answer one conflict; upper case applies the answer to all remaining ones
std::pair<fops::ops::ConflictResolution, bool> ask_user(const json& conflict) {
    std::cout << "\nConflict: " << conflict.value("destinationPath", std::string{}) << " already exists\n"
              << "  source " << fops::format_bytes(conflict.value("sourceSize", std::uint64_t{0}))
              << ", existing " << fops::format_bytes(conflict.value("destinationSize", std::uint64_t{0}))
              << (conflict.value("destinationIsNewer", false) ? " (newer)" : "") << "\n"
              << "[o]verwrite [s]kip [r]ename s[t]op (capital letter = apply to all): " << std::flush;

    std::string answer;
    if (!std::getline(std::cin, answer) || answer.empty()) {
        return {fops::ops::ConflictResolution::Stop, false};
    }
    const bool all = std::isupper(static_cast<unsigned char>(answer[0])) != 0;
    switch (std::tolower(static_cast<unsigned char>(answer[0]))) {
        case 'o': return {fops::ops::ConflictResolution::Overwrite, all};
        case 's': return {fops::ops::ConflictResolution::Skip, all};
        case 'r': return {fops::ops::ConflictResolution::Rename, all};
        default: return {fops::ops::ConflictResolution::Stop, false};
    }
}

} // namespace

int main(int argc, char* argv[]) {
    fops::logging::init(spdlog::level::info);

    fops::ops::StartRequest request;
    std::optional<std::string> kind_name;
    std::optional<std::string> request_file;
    std::optional<std::string> config_file;
    std::optional<std::string> policy_name;
    std::optional<std::string> sort_name;
    bool descending = false;
    bool no_sync = false;
    std::vector<std::string> positional;
    bool dry_run = false;
    bool print_json = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--policy" && i + 1 < argc) {
            policy_name = argv[++i];
        } else if (arg == "--dry-run") {
            dry_run = true;
        } else if (arg == "--sort" && i + 1 < argc) {
            sort_name = argv[++i];
        } else if (arg == "--descending") {
            descending = true;
        } else if (arg == "--no-sync") {
            no_sync = true;
        } else if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--request" && i + 1 < argc) {
            request_file = argv[++i];
        } else if (arg == "--json") {
            print_json = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            spdlog::set_level(fops::logging::level_from_string(argv[++i]));
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (!kind_name) {
            kind_name = arg;
        } else {
            positional.push_back(arg);
        }
    }

    if (request_file) {
        auto text = read_file(*request_file);
        if (!text) {
            spdlog::error("Cannot read request file {}", *request_file);
            return 2;
        }
        auto parsed = fops::ops::parse_start_request(*text);
        if (parsed.is_error()) {
            spdlog::error("{}", parsed.error().message());
            return 2;
        }
        request = parsed.value();
    } else {
        if (!kind_name) {
            print_usage();
            return 2;
        }
        auto kind = fops::ops::operation_kind_from_string(*kind_name);
        if (!kind) {
            print_usage();
            return 2;
        }
        request.kind = *kind;

        if (config_file) {
            auto text = read_file(*config_file);
            json payload = json::parse(text.value_or(std::string{}), nullptr, false);
            if (payload.is_discarded()) {
                spdlog::error("Invalid config file {}", *config_file);
                return 2;
            }
            auto config = fops::ops::config_from_json(payload);
            if (config.is_error()) {
                spdlog::error("{}", config.error().message());
                return 2;
            }
            request.config = config.value();
        }

        if (request.kind != fops::ops::OperationKind::Delete) {
            if (positional.size() < 2) {
                print_usage();
                return 2;
            }
            request.destination = positional.back();
            positional.pop_back();
        }
        for (const auto& source : positional) {
            request.sources.emplace_back(source);
        }
    }

    if (policy_name) {
        auto policy = fops::ops::conflict_resolution_from_string(*policy_name);
        if (!policy) {
            spdlog::error("Unknown policy {}", *policy_name);
            return 2;
        }
        request.config.conflict_resolution = *policy;
    }
    if (dry_run) {
        request.config.dry_run = true;
    }
    if (sort_name) {
        auto column = fops::ops::sort_column_from_string(*sort_name);
        if (!column) {
            spdlog::error("Unknown sort column {}", *sort_name);
            return 2;
        }
        request.config.sort_column = *column;
    }
    if (descending) {
        request.config.sort_order = fops::ops::SortOrder::Descending;
    }
    if (no_sync) {
        request.config.sync_on_complete = false;
    }

    std::signal(SIGINT, signal_handler);

    fops::events::EventBus event_bus;
    fops::events::LoggerComponent logger(event_bus);
    fops::events::MetricsComponent metrics(event_bus);
    fops::events::EventMailbox mailbox(event_bus);

    fops::ops::OperationRegistry registry(event_bus, std::make_shared<fops::volume::VolumeManager>());

    auto started = registry.start(request);
    if (started.is_error()) {
        spdlog::error("{}", started.error().message());
        return 2;
    }
    const std::string id = started.value();

    std::string outcome;
    auto handle = [&](const json& event) {
        if (print_json) {
            std::cout << event.dump() << std::endl;
        }
        const auto type = event.value("type", std::string{});
        if (type == "conflictDetected") {
            auto [resolution, all] = ask_user(event);
            auto answered = registry.resolve(id, resolution, all);
            if (answered.is_error()) {
                spdlog::warn("{}", answered.error().message());
            }
        } else if (type == "operationCompleted" || type == "operationCancelled" || type == "operationFailed") {
            outcome = type;
        }
    };

    bool cancel_sent = false;
    while (!registry.wait(id, std::chrono::milliseconds(100))) {
        if (g_interrupted && !cancel_sent) {
            spdlog::warn("Interrupted, cancelling {}", id);
            registry.cancel_all(true);
            cancel_sent = true;
        }
        for (const auto& event : mailbox.drain()) {
            handle(event);
        }
    }
    for (const auto& event : mailbox.drain()) {
        handle(event);
    }

    metrics.print_stats();
    return outcome == "operationCompleted" ? 0 : 1;
}
