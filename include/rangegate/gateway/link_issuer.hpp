#pragma once

#include "rangegate/common.hpp"
#include "rangegate/error.hpp"
#include <memory>
#include <string>

namespace rangegate {

namespace security { class TokenCodec; }
namespace stream { class ResourceFetcher; }

namespace gateway {

/**
 * LinkIssuer - Produces signed stream URLs
 *
 * A link is "<base_url>/<endpoint>?<token query>" and stays valid for the
 * codec's fixed TTL. Front-ends (chat bots, web pages) only ever call
 * this; they never see the secret.
 */
class LinkIssuer {
public:
    LinkIssuer(std::string base_url, std::shared_ptr<security::TokenCodec> codec);

    std::string issue_link(const std::string& resource_id,
                           uint64_t size,
                           const std::string& endpoint = "stream") const;

    /**
     * Issue a link, asking the fetcher for the resource size
     * @return ResourceNotFound if the fetcher does not know the resource
     */
    Result<std::string> issue_link(const std::string& resource_id,
                                   stream::ResourceFetcher& fetcher,
                                   const std::string& endpoint = "stream") const;

    const std::string& base_url() const { return base_url_; }

private:
    std::string base_url_;
    std::shared_ptr<security::TokenCodec> codec_;
};

} // namespace gateway
} // namespace rangegate
