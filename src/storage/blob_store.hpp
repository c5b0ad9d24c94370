#pragma once

#include "rangegate/common.hpp"
#include "stream/resource_fetcher.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace rangegate::storage {

/**
 * BlobStore configuration
 */
struct BlobStoreConfig {
    std::filesystem::path root{"./blobs"};
    uint64_t alignment{constants::DEFAULT_ALIGNMENT};
    uint64_t max_read{constants::DEFAULT_BLOCK_SIZE};   // cap per fetch, like a remote block API
};

/**
 * Directory-backed block source
 *
 * Each resource is a file named by its identifier under the root
 * directory. Reads follow the upstream block contract: offsets must be
 * aligned, each read returns at most max_read bytes, and reads at or
 * past the end return nothing.
 */
class BlobStore : public stream::ResourceFetcher {
public:
    explicit BlobStore(const BlobStoreConfig& config);
    ~BlobStore() override;

    BlobStore(const BlobStore&) = delete;
    BlobStore& operator=(const BlobStore&) = delete;

    Result<bytes> fetch(const std::string& resource_id,
                        uint64_t offset,
                        uint64_t limit) override;

    std::optional<uint64_t> resource_size(const std::string& resource_id) override;

    /**
     * Store a blob under an identifier (replaces an existing one)
     * @return True if successful
     */
    bool put(const std::string& resource_id, const bytes& data);

    /**
     * Identifiers are single path components of [A-Za-z0-9._-], not starting with '.'
     */
    static bool is_valid_id(const std::string& resource_id);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rangegate::storage
