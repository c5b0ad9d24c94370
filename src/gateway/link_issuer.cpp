#include "rangegate/gateway/link_issuer.hpp"
#include "security/capability_token.hpp"
#include "stream/resource_fetcher.hpp"
#include "utils/logger.hpp"

namespace rangegate {
namespace gateway {

LinkIssuer::LinkIssuer(std::string base_url, std::shared_ptr<security::TokenCodec> codec)
    : base_url_(std::move(base_url))
    , codec_(std::move(codec))
{
    if (!codec_) {
        throw std::invalid_argument("LinkIssuer requires a token codec");
    }
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string LinkIssuer::issue_link(
    const std::string& resource_id,
    uint64_t size,
    const std::string& endpoint
) const {
    std::string path = endpoint;
    while (!path.empty() && path.front() == '/') {
        path.erase(path.begin());
    }

    auto link = base_url_ + "/" + path + "?" + codec_->issue(resource_id, size);
    RANGEGATE_LOG_INFO("Issued link for {} ({}), valid {}s",
                       resource_id, format_size(size), codec_->ttl_seconds());
    return link;
}

Result<std::string> LinkIssuer::issue_link(
    const std::string& resource_id,
    stream::ResourceFetcher& fetcher,
    const std::string& endpoint
) const {
    auto size = fetcher.resource_size(resource_id);
    if (!size) {
        return Result<std::string>::Err(Error(ErrorCode::ResourceNotFound,
                                              "cannot determine resource size", resource_id));
    }
    return Result<std::string>::Ok(issue_link(resource_id, *size, endpoint));
}

} // namespace gateway
} // namespace rangegate
