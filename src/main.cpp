#include "config/config_loader.hpp"
#include "core/request_context.hpp"
#include "core/signal_watcher.hpp"
#include "core/utils.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "model/json.hpp"
#include "spanstore/pg_span_reader.hpp"

#include <nlohmann/json.hpp>

#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

using namespace tracestore;

namespace {

void signal_handler(int /*signal*/) {
    SignalWatcher::notify();
}

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} <config.toml> <command> [args]\n"
        "\n"
        "Commands:\n"
        "  services\n"
        "  operations [--service NAME]\n"
        "  trace <hex-trace-id>\n"
        "  find [--service S] [--operation O] [--start-min US] [--start-max US]\n"
        "       [--duration-min US] [--duration-max US] [--tag key=value]... [--limit N]\n"
        "  deps [--end US] [--lookback US]\n"
        "\n"
        "Times and durations are microseconds (since the Unix epoch for times).\n",
        argv0);
}

/// Simple "--flag value" scanner over the arguments after the command
class ArgList {
public:
    ArgList(int argc, char* argv[], int first) {
        for (int i = first; i < argc; ++i) args_.emplace_back(argv[i]);
    }

    /// Consumes pairs; returns false on an unknown flag or a missing value
    template<typename Handler>
    bool for_each_flag(Handler&& handler) const {
        for (size_t i = 0; i < args_.size(); ++i) {
            if (!args_[i].starts_with("--") || i + 1 >= args_.size()) {
                utils::log::error(std::format("Unexpected argument '{}'", args_[i]));
                return false;
            }
            if (!handler(args_[i], args_[i + 1])) {
                utils::log::error(std::format("Invalid value for {}: '{}'", args_[i], args_[i + 1]));
                return false;
            }
            ++i;
        }
        return true;
    }

    [[nodiscard]] const std::vector<std::string>& raw() const { return args_; }

private:
    std::vector<std::string> args_;
};

std::optional<int64_t> parse_micros(const std::string& value) {
    return utils::try_parse_int<int64_t>(value);
}

bool parse_find_flag(TraceQueryParameters& query, const std::string& flag, const std::string& value) {
    if (flag == "--service") { query.service_name = value; return true; }
    if (flag == "--operation") { query.operation_name = value; return true; }
    if (flag == "--tag") {
        const auto eq = value.find('=');
        if (eq == std::string::npos || eq == 0) return false;
        query.tags[value.substr(0, eq)] = value.substr(eq + 1);
        return true;
    }
    if (flag == "--limit") {
        const auto n = utils::try_parse_int<int>(value);
        if (!n) return false;
        query.num_traces = *n;
        return true;
    }

    const auto us = parse_micros(value);
    if (!us) return false;
    if (flag == "--start-min") { query.start_time_min = utils::from_unix_micros(*us); return true; }
    if (flag == "--start-max") { query.start_time_max = utils::from_unix_micros(*us); return true; }
    if (flag == "--duration-min") { query.duration_min = std::chrono::microseconds(*us); return true; }
    if (flag == "--duration-max") { query.duration_max = std::chrono::microseconds(*us); return true; }
    return false;
}

/// Prints the value (or the partial value) as JSON; logs and fails on error
template<typename T>
int emit(const Result<T>& result) {
    if (result.has_value()) {
        std::cout << nlohmann::json{{"data", result.value()}}.dump(2) << "\n";
    }
    if (result.is_error()) {
        utils::log::error(std::format("[{}] {}",
            error_category_to_string(result.error_category()), result.describe()));
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int run_command(ISpanReader& reader, const RequestContext& ctx,
                const std::string& command, const ArgList& args) {
    if (command == "services") {
        return emit(reader.get_services(ctx));
    }

    if (command == "operations") {
        OperationQueryParameters params;
        const bool ok = args.for_each_flag([&](const std::string& flag, const std::string& value) {
            if (flag != "--service") return false;
            params.service_name = value;
            return true;
        });
        if (!ok) return EXIT_FAILURE;
        return emit(reader.get_operations(ctx, params));
    }

    if (command == "trace") {
        if (args.raw().size() != 1) {
            utils::log::error("trace takes exactly one trace id");
            return EXIT_FAILURE;
        }
        const auto id = TraceId::from_hex(args.raw().front());
        if (!id) {
            utils::log::error(std::format("Malformed trace id '{}'", args.raw().front()));
            return EXIT_FAILURE;
        }
        return emit(reader.get_trace(ctx, *id));
    }

    if (command == "find") {
        TraceQueryParameters query;
        const bool ok = args.for_each_flag([&](const std::string& flag, const std::string& value) {
            return parse_find_flag(query, flag, value);
        });
        if (!ok) return EXIT_FAILURE;
        return emit(reader.find_traces(ctx, query));
    }

    if (command == "deps") {
        auto end_time = utils::now();
        std::chrono::microseconds lookback = std::chrono::hours(24);
        const bool ok = args.for_each_flag([&](const std::string& flag, const std::string& value) {
            const auto us = parse_micros(value);
            if (!us) return false;
            if (flag == "--end") { end_time = utils::from_unix_micros(*us); return true; }
            if (flag == "--lookback") { lookback = std::chrono::microseconds(*us); return true; }
            return false;
        });
        if (!ok) return EXIT_FAILURE;
        return emit(reader.get_dependencies(ctx, end_time, lookback));
    }

    utils::log::error(std::format("Unknown command '{}'", command));
    return EXIT_FAILURE;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const std::string config_file = argv[1];
    const std::string command = argv[2];

    auto loaded = ConfigLoader::load_from_file(config_file);
    if (!loaded.success) {
        utils::log::error(loaded.error_message);
        return EXIT_FAILURE;
    }
    const auto& config = loaded.config;

    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    if (config.storage.connection_string.empty()) {
        utils::log::error(std::format("{}: [storage] connection_string is required", config_file));
        return EXIT_FAILURE;
    }

    try {
        auto pool = std::make_shared<GenericConnectionPool>(
            "spans", config.storage.to_pool_config(), std::make_shared<PgConnectionFactory>());

        PgSpanReader reader(pool, config.reader.to_reader_options(config.storage.connection_timeout));

        // Cancels the in-flight request on SIGINT/SIGTERM
        std::stop_source cancel;
        SignalWatcher watcher(cancel);

        const auto ctx = RequestContext::with_timeout(cancel.get_token(), config.reader.request_timeout);
        const int rc = run_command(reader, ctx, command, ArgList(argc, argv, 3));

        pool->drain();
        return rc;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return EXIT_FAILURE;
    }
}
