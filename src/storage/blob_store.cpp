#include "blob_store.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace rangegate::storage {

class BlobStore::Impl {
public:
    explicit Impl(const BlobStoreConfig& config)
        : config_(config)
    {
        if (config_.alignment == 0 || config_.max_read == 0) {
            throw ConfigException("blob store alignment and max_read must be positive");
        }
        // Otherwise a capped read leaves the caller at an offset fetch() rejects
        if (config_.max_read % config_.alignment != 0) {
            throw ConfigException("blob store max_read must be a multiple of its alignment");
        }

        std::error_code ec;
        std::filesystem::create_directories(config_.root, ec);
        if (ec) {
            throw ConfigException("cannot create blob directory " +
                                  config_.root.string() + ": " + ec.message());
        }

        RANGEGATE_LOG_INFO("Blob store at: {} (alignment {}, max read {})",
                           config_.root.string(), config_.alignment,
                           format_size(config_.max_read));
    }

    std::filesystem::path blob_path(const std::string& resource_id) const {
        return config_.root / resource_id;
    }

    Result<bytes> fetch(const std::string& resource_id, uint64_t offset, uint64_t limit) const {
        if (!is_valid_id(resource_id)) {
            return Result<bytes>::Err(ErrorCode::ResourceNotFound,
                                      "invalid resource identifier");
        }
        if (offset % config_.alignment != 0) {
            return Result<bytes>::Err(Error(ErrorCode::UpstreamMisaligned,
                "offset is not a multiple of " + std::to_string(config_.alignment),
                std::to_string(offset)));
        }
        if (limit == 0) {
            return Result<bytes>::Err(ErrorCode::InvalidArgument, "limit must be positive");
        }

        auto path = blob_path(resource_id);
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            return Result<bytes>::Err(Error(ErrorCode::ResourceNotFound,
                                            "no such blob", resource_id));
        }
        if (offset >= size) {
            return Result<bytes>::Ok(bytes{});
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            RANGEGATE_LOG_ERROR("Failed to open blob: {}", path.string());
            return Result<bytes>::Err(Error(ErrorCode::UpstreamTransientError,
                                            "failed to open blob", resource_id));
        }

        uint64_t length = std::min({limit, config_.max_read, size - offset});
        bytes data(length);
        file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(length));

        // The blob may have shrunk since file_size(); hand back what was read
        data.resize(static_cast<size_t>(file.gcount()));
        if (file.bad()) {
            RANGEGATE_LOG_ERROR("Failed to read blob: {} at {}", path.string(), offset);
            return Result<bytes>::Err(Error(ErrorCode::UpstreamTransientError,
                                            "failed to read blob", resource_id));
        }

        return Result<bytes>::Ok(std::move(data));
    }

    std::optional<uint64_t> resource_size(const std::string& resource_id) const {
        if (!is_valid_id(resource_id)) {
            return std::nullopt;
        }
        std::error_code ec;
        auto size = std::filesystem::file_size(blob_path(resource_id), ec);
        if (ec) {
            return std::nullopt;
        }
        return size;
    }

    bool put(const std::string& resource_id, const bytes& data) {
        if (!is_valid_id(resource_id)) {
            RANGEGATE_LOG_ERROR("Refusing to store blob with invalid id: {}", resource_id);
            return false;
        }

        auto path = blob_path(resource_id);
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            RANGEGATE_LOG_ERROR("Failed to create blob file: {}", path.string());
            return false;
        }

        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!file) {
            RANGEGATE_LOG_ERROR("Failed to write blob file: {}", path.string());
            return false;
        }

        RANGEGATE_LOG_DEBUG("Stored blob: {} ({})", resource_id, format_size(data.size()));
        return true;
    }

private:
    BlobStoreConfig config_;
};

BlobStore::BlobStore(const BlobStoreConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
}

BlobStore::~BlobStore() = default;

Result<bytes> BlobStore::fetch(const std::string& resource_id, uint64_t offset, uint64_t limit) {
    return impl_->fetch(resource_id, offset, limit);
}

std::optional<uint64_t> BlobStore::resource_size(const std::string& resource_id) {
    return impl_->resource_size(resource_id);
}

bool BlobStore::put(const std::string& resource_id, const bytes& data) {
    return impl_->put(resource_id, data);
}

bool BlobStore::is_valid_id(const std::string& resource_id) {
    if (resource_id.empty() || resource_id.size() > 255 || resource_id.front() == '.') {
        return false;
    }
    return std::all_of(resource_id.begin(), resource_id.end(), [](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return std::isalnum(c) || c == '.' || c == '_' || c == '-';
    });
}

} // namespace rangegate::storage
