#include "media/media_store.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include "core/errors.hpp"
#include "utils/common.hpp"
#include "utils/hash.hpp"
#include "utils/logging.hpp"

namespace osintpipe::media {

std::string StorageKeyFor(const std::string& sha256) {
    if (!utils::IsSha256Hex(sha256)) {
        throw std::invalid_argument("not a sha256 hex digest: " + sha256);
    }
    return "media/" + sha256.substr(0, 2) + "/" + sha256.substr(2, 2) + "/" + sha256;
}

void WriteFileFully(const std::filesystem::path& path, const std::string& bytes) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw StoreUnavailable("cannot write media file " + path.string());
    }
    output.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    output.close();
    if (!output) {
        throw StoreUnavailable("short write to media file " + path.string());
    }
}

FileMediaStore::FileMediaStore(std::filesystem::path root)
    : root_(std::move(root)) {}

std::filesystem::path FileMediaStore::PathFor(const std::string& sha256) const {
    return root_ / StorageKeyFor(sha256);
}

bool FileMediaStore::Exists(const std::string& sha256) {
    if (!utils::IsSha256Hex(sha256)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::exists(PathFor(sha256), ec);
}

ContentAddress FileMediaStore::Put(const std::string& bytes) {
    ContentAddress address{};
    address.sha256 = utils::Sha256Hex(bytes);
    address.storage_key = StorageKeyFor(address.sha256);
    address.size = static_cast<long long>(bytes.size());

    const auto target = root_ / address.storage_key;
    std::error_code ec;
    if (std::filesystem::exists(target, ec)) {
        return address;
    }
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw StoreUnavailable("cannot create media directory " + target.parent_path().string() +
                               ": " + ec.message());
    }

    // Concurrent writers each use their own temp file; the rename is atomic
    // and whichever lands last leaves identical bytes behind.
    auto temp = target;
    temp += ".tmp-" + utils::GenerateId(8);
    try {
        WriteFileFully(temp, bytes);
    } catch (const StoreUnavailable&) {
        std::error_code cleanup;
        std::filesystem::remove(temp, cleanup);
        throw;
    }
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(temp, cleanup);
        throw StoreUnavailable("cannot publish media file " + target.string() + ": " + ec.message());
    }
    utils::Log(utils::LogLevel::kDebug, "media", "stored",
               {{"key", address.storage_key}, {"bytes", std::to_string(address.size)}});
    return address;
}

}  // namespace osintpipe::media
