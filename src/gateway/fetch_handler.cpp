#include "steenbok/gateway/fetch_handler.hpp"

#include "steenbok/core/logger.hpp"
#include "steenbok/core/utils.hpp"

#include <nlohmann/json.hpp>

namespace steenbok::gateway {

namespace http = boost::beast::http;
using json = nlohmann::json;

namespace {

constexpr std::string_view kFetchPath = "/fetch";

auto json_reply(unsigned status, std::string_view message) -> FetchReply {
    return FetchReply{status, "application/json", json{{"error", std::string(message)}}.dump()};
}

auto generic_failure(unsigned status) -> FetchReply {
    return json_reply(status, "Fetch failed");
}

} // anonymous namespace

FetchHandler::FetchHandler(std::shared_ptr<infra::FetchGuard> guard,
                           std::shared_ptr<const infra::TextExtractor> extractor,
                           infra::FetchRequest defaults)
    : guard_(std::move(guard))
    , extractor_(std::move(extractor))
    , defaults_(std::move(defaults)) {}

auto FetchHandler::query_url(std::string_view target) -> std::optional<std::string> {
    auto qpos = target.find('?');
    if (qpos == std::string_view::npos) {
        return std::nullopt;
    }
    auto query = target.substr(qpos + 1);
    if (auto hash = query.find('#'); hash != std::string_view::npos) {
        query = query.substr(0, hash);
    }

    for (const auto& param : utils::split(query, '&')) {
        auto eq = param.find('=');
        auto key = utils::url_decode(param.substr(0, eq));
        if (key != "url") {
            continue;
        }
        if (eq == std::string::npos) {
            return std::string{};
        }
        return utils::url_decode(std::string_view(param).substr(eq + 1));
    }
    return std::nullopt;
}

auto FetchHandler::handle(http::verb method, std::string_view target)
    -> boost::asio::awaitable<FetchReply>
{
    auto path = target.substr(0, target.find('?'));
    if (path != kFetchPath) {
        co_return json_reply(404, "not found");
    }
    if (method != http::verb::get) {
        co_return json_reply(405, "method not allowed");
    }

    auto url = query_url(target);
    if (!url || url->empty()) {
        co_return json_reply(400, "missing url");
    }

    auto request = defaults_;
    request.url = std::move(*url);
    auto outcome = co_await guard_->fetch(std::move(request));

    if (auto* rejected = std::get_if<infra::FetchRejected>(&outcome)) {
        LOG_INFO("Fetch rejected ({}): {}", error_code_to_reason(rejected->reason), rejected->url);
        co_return generic_failure(403);
    }
    if (auto* failed = std::get_if<infra::FetchFailed>(&outcome)) {
        LOG_INFO("Fetch failed ({}): {}", error_code_to_reason(failed->reason), failed->url);
        co_return generic_failure(502);
    }

    auto& success = std::get<infra::FetchSuccess>(outcome);
    auto text = extractor_->extract(success.bytes, success.content_type, success.final_url);
    if (!text) {
        LOG_WARN("Extraction failed for {}: {}", success.final_url, text.error().what());
        co_return generic_failure(502);
    }

    co_return FetchReply{200, "text/plain; charset=utf-8", std::move(*text)};
}

} // namespace steenbok::gateway
