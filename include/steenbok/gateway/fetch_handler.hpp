#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/verb.hpp>

#include "steenbok/infra/extractor.hpp"
#include "steenbok/infra/fetch_guard.hpp"

namespace steenbok::gateway {

/// Response produced for one local endpoint request.
struct FetchReply {
    unsigned status = 200;
    std::string content_type;
    std::string body;
};

/// Serves `GET /fetch?url=<percent-encoded URL>`.
///
/// Successful fetches are returned as extracted plain text. Every rejection
/// and failure gets the same generic JSON body; the reason and any blocked
/// address only reach the process log and the audit sink.
class FetchHandler {
public:
    FetchHandler(std::shared_ptr<infra::FetchGuard> guard,
                 std::shared_ptr<const infra::TextExtractor> extractor,
                 infra::FetchRequest defaults);

    auto handle(boost::beast::http::verb method, std::string_view target)
        -> boost::asio::awaitable<FetchReply>;

    /// Value of the `url` query parameter of a request target, percent-decoded.
    [[nodiscard]] static auto query_url(std::string_view target) -> std::optional<std::string>;

private:
    std::shared_ptr<infra::FetchGuard> guard_;
    std::shared_ptr<const infra::TextExtractor> extractor_;
    infra::FetchRequest defaults_;
};

} // namespace steenbok::gateway
