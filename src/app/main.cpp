/**
 * @file main.cpp
 * @brief railway_demo entry point.
 *
 * Wires the runtime into a small request pipeline:
 *   Config → Logger → validate (combine) → fetch with retry (ThreadPool) → render (match_error)
 */

#include "async/async_combinators.hpp"
#include "async/task.hpp"
#include "combinators/match.hpp"
#include "combinators/parallel.hpp"
#include "combinators/sequential.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "retry/retry.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/outcome_recorder.hpp"
#include "telemetry/result_logging.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

using namespace railway;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    bool verbose = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: railway_demo [OPTIONS]\n"
                      << "  --config <path>    Configuration file (default: config/default.toml)\n"
                      << "  --log-dir <path>   Log output directory (default: stdout)\n"
                      << "  --verbose, -v      Log at debug level\n"
                      << "  --help, -h         Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

// ── Sample domain ────────────────────────────

struct SignupRequest {
    std::string email;
    std::string name;
    int age = 0;
};

struct Account {
    std::string email;
    std::string name;
    int age = 0;
};

Result<std::string> validate_email(const std::string& email) {
    return ensure(
        ensure(success(email), [](const std::string& e) { return !e.empty(); },
               Error::validation("Email is required", "email")),
        [](const std::string& e) { return e.find('@') != std::string::npos; },
        Error::validation("Email is not a valid address", "email"));
}

Result<std::string> validate_name(const std::string& name) {
    return ensure(success(name), [](const std::string& n) { return !n.empty(); },
                  Error::validation("Name is required", "name"));
}

Result<int> validate_age(int age) {
    return ensure(success(age), [](int a) { return a >= 18 && a <= 130; },
                  [](int a) {
                      return Error::validation("Age " + std::to_string(a) + " is out of range",
                                               "age");
                  });
}

/// Every field is checked; all failures come back together.
Result<Account> validate_signup(const SignupRequest& request) {
    return railway::map(
        combine(validate_email(request.email), validate_name(request.name),
                validate_age(request.age)),
        [](std::string email, std::string name, int age) {
            return Account{std::move(email), std::move(name), age};
        });
}

/// Simulated upstream that is unavailable for the first two calls.
class FlakyDirectory {
public:
    Result<std::string> register_account(const Account& account) {
        const int call = ++calls_;
        if (call <= 2) {
            return Error::service_unavailable("directory busy (call " + std::to_string(call) + ")");
        }
        return "acct-" + std::to_string(call) + ":" + account.email;
    }

private:
    std::atomic<int> calls_{0};
};

std::string render(Result<std::string> outcome) {
    return match_error(
        std::move(outcome),
        [](const std::string& id) { return "201 created " + id; },
        ErrorHandlers<std::string>{
            .on_validation = [](const ValidationError& e) { return "400 " + e.to_string(); },
            .on_not_found = [](const NotFoundError& e) { return "404 " + e.message; },
            .on_conflict = [](const ConflictError& e) { return "409 " + e.message; },
            .on_service_unavailable =
                [](const ServiceUnavailableError& e) { return "503 " + e.message; },
            .on_error = [](const Error& e) { return "500 " + e.to_string(); },
        });
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error() << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result.value_or(default_config());

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.logging.log_dir = args.log_dir;
    if (args.verbose) config.logging.level = LogLevel::Debug;

    // ── Initialize Logger ────────────────────
    auto sink = make_log_sink(config.logging, "railway_demo");
    if (!sink) {
        std::cerr << sink.error() << std::endl;
        return 1;
    }
    Logger logger(std::move(sink).value(), config.logging.level, "demo");
    logger.info("railway_demo starting");

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::stop_source shutdown;
    std::jthread watcher([&shutdown](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_shutdown_requested) {
                shutdown.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    // ── Validation: accumulate every failure ─
    SignupRequest bad{.email = "not-an-email", .name = "", .age = 12};
    auto rejected = log_result(validate_signup(bad), logger, "validate bad request", LogLevel::Info);
    logger.info("bad request -> " + render(railway::map(std::move(rejected),
                                                        [](const Account& a) { return a.email; })));

    SignupRequest good{.email = "ada@example.org", .name = "Ada", .age = 36};
    auto accepted = validate_signup(good);

    // ── Retry on the pool ────────────────────
    OutcomeRecorder recorder(std::make_unique<NullSink>());
    FlakyDirectory directory;
    ThreadPool pool(config.executor.thread_count);

    RetryPolicy policy = to_retry_policy(config.retry);
    policy.should_retry = [](const Error& e) {
        return e.kind() == ErrorKind::ServiceUnavailable || e.kind() == ErrorKind::RateLimit;
    };

    RetryContext context;
    context.stop = shutdown.get_token();
    context.logger = &logger;
    context.observer = &recorder;
    context.operation = "register_account";

    auto registered = bind_async(
        make_ready_task(std::move(accepted)),
        [&](Account account) {
            return retry_async(
                pool,
                [&directory, account] { return directory.register_account(account); },
                policy, context);
        },
        shutdown.get_token());

    auto outcome = tap(registered.get(), [&](const std::string& id) {
        logger.info("registered " + id);
    });

    logger.info("good request -> " + render(std::move(outcome)));
    logger.info("attempts: " + std::to_string(recorder.successes()) + " ok, " +
                std::to_string(recorder.failures()) + " failed");

    watcher.request_stop();
    logger.info("railway_demo stopped");
    logger.flush();
    return g_shutdown_requested ? 130 : 0;
}
