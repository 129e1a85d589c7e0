#include "steenbok/cli/commands.hpp"
#include "steenbok/cli/runtime.hpp"
#include "steenbok/core/logger.hpp"
#include "steenbok/gateway/fetch_handler.hpp"
#include "steenbok/gateway/fetch_server.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <iostream>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

namespace steenbok::cli {

namespace net = boost::asio;

namespace {

struct FetchOptions {
    std::string url;
    bool allow_http = false;
};

struct ServeOptions {
    uint16_t port = 0;
};

void report(const Error& err) {
    std::cerr << "Error: " << err.what() << "\n";
}

} // anonymous namespace

auto exit_code_for(const infra::FetchOutcome& outcome) -> int {
    if (auto* rejected = std::get_if<infra::FetchRejected>(&outcome)) {
        return rejected->reason == ErrorCode::AllowlistRejected
            ? kExitAllowlistRejected : kExitRejected;
    }
    if (std::holds_alternative<infra::FetchFailed>(outcome)) {
        return kExitFailure;
    }
    return kExitOk;
}

// ---------------------------------------------------------------------------
// fetch command
// ---------------------------------------------------------------------------

void register_fetch_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("fetch", "Fetch a URL and print its text");

    // Options outlive this function; CLI11 writes into them during parse().
    auto opts = std::make_shared<FetchOptions>();
    sub->add_option("url", opts->url, "URL to fetch (https unless STEENBOK_ALLOW_HTTP=1)")
        ->required();
    sub->add_flag("--allow-http", opts->allow_http, "Permit plain http for this fetch");

    sub->callback([&ctx, opts]() {
        auto config = load_effective_config(ctx.config_path, ctx.log_level);
        if (!config) {
            report(config.error());
            ctx.exit_code = kExitFailure;
            return;
        }

        net::io_context ioc;
        auto runtime = build_runtime(*config, ioc.get_executor());
        if (!runtime) {
            report(runtime.error());
            ctx.exit_code = kExitFailure;
            return;
        }

        auto request = runtime->request_defaults;
        request.url = opts->url;
        request.allow_http = request.allow_http || opts->allow_http;

        infra::FetchOutcome outcome;
        std::exception_ptr failure;
        net::co_spawn(ioc, runtime->guard->fetch(std::move(request)),
            [&](std::exception_ptr e, infra::FetchOutcome result) {
                failure = e;
                outcome = std::move(result);
            });
        ioc.run();

        if (failure) {
            try {
                std::rethrow_exception(failure);
            } catch (const std::exception& e) {
                LOG_ERROR("Fetch aborted: {}", e.what());
            }
            ctx.exit_code = kExitFailure;
            return;
        }

        if (auto* rejected = std::get_if<infra::FetchRejected>(&outcome)) {
            std::cerr << "Rejected (" << error_code_to_reason(rejected->reason) << "): "
                      << rejected->detail << "\n";
            ctx.exit_code = exit_code_for(outcome);
            return;
        }
        if (auto* failed = std::get_if<infra::FetchFailed>(&outcome)) {
            std::cerr << "Failed (" << error_code_to_reason(failed->reason) << "): "
                      << failed->detail << "\n";
            ctx.exit_code = exit_code_for(outcome);
            return;
        }

        auto& success = std::get<infra::FetchSuccess>(outcome);
        auto text = runtime->extractor->extract(
            success.bytes, success.content_type, success.final_url);
        if (!text) {
            report(text.error());
            ctx.exit_code = kExitExtractionFailed;
            return;
        }

        std::cout << *text << "\n";
        ctx.exit_code = kExitOk;
    });
}

// ---------------------------------------------------------------------------
// serve command
// ---------------------------------------------------------------------------

void register_serve_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("serve", "Run the loopback fetch endpoint");

    auto opts = std::make_shared<ServeOptions>();
    sub->add_option("-p,--port", opts->port, "Listen port (overrides config)");

    sub->callback([&ctx, opts]() {
        auto config = load_effective_config(ctx.config_path, ctx.log_level);
        if (!config) {
            report(config.error());
            ctx.exit_code = kExitFailure;
            return;
        }
        if (opts->port != 0) {
            config->server.port = opts->port;
        }

        net::io_context ioc;
        auto runtime = build_runtime(*config, ioc.get_executor());
        if (!runtime) {
            report(runtime.error());
            ctx.exit_code = kExitFailure;
            return;
        }

        auto handler = std::make_shared<gateway::FetchHandler>(
            runtime->guard, runtime->extractor, runtime->request_defaults);
        gateway::FetchServer server(ioc, handler, config->server);

        const Config& active_config = *config;
        auto allowlist = runtime->allowlist;
        server.on_reload([&active_config, allowlist]() {
            auto reloaded = reload_allowlist(active_config, *allowlist);
            if (!reloaded) {
                LOG_ERROR("Allowlist reload failed, keeping current set: {}",
                          reloaded.error().what());
            }
        });

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&ioc, &server](auto ec, auto /*sig*/) {
            if (!ec) {
                LOG_INFO("Received shutdown signal");
                server.stop();
                ioc.stop();
            }
        });

        net::co_spawn(ioc, server.start(),
            [&](std::exception_ptr e, Result<void> started) {
                if (e) {
                    try {
                        std::rethrow_exception(e);
                    } catch (const std::exception& ex) {
                        LOG_ERROR("Fetch endpoint terminated: {}", ex.what());
                    }
                    ctx.exit_code = kExitFailure;
                } else if (!started) {
                    LOG_ERROR("{}", started.error().what());
                    ctx.exit_code = kExitFailure;
                }
                ioc.stop();
            });

        ioc.run();
    });
}

// ---------------------------------------------------------------------------
// allowlist command
// ---------------------------------------------------------------------------

void register_allowlist_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("allowlist", "Print the effective domain allowlist");

    sub->callback([&ctx]() {
        auto config = load_effective_config(ctx.config_path, ctx.log_level);
        if (!config) {
            report(config.error());
            ctx.exit_code = kExitFailure;
            return;
        }

        auto patterns = collect_allowlist_patterns(*config);
        if (!patterns) {
            report(patterns.error());
            ctx.exit_code = kExitFailure;
            return;
        }
        auto allowlist = infra::DomainAllowlist::from_patterns(*patterns);
        if (!allowlist) {
            report(allowlist.error());
            ctx.exit_code = kExitFailure;
            return;
        }

        for (const auto& pattern : (*allowlist)->patterns()) {
            std::cout << pattern << "\n";
        }
        std::cerr << (*allowlist)->patterns().size() << " patterns (file: "
                  << allowlist_file_path(*config).string() << ")\n";
        ctx.exit_code = kExitOk;
    });
}

} // namespace steenbok::cli
