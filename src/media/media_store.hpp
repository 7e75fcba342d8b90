#pragma once

#include <filesystem>
#include <string>

namespace osintpipe::media {

struct ContentAddress {
    std::string sha256;
    std::string storage_key;
    long long size = 0;

    bool operator==(const ContentAddress&) const = default;
};

// "media/ab/cd/<hash>" for hash "abcd...".
std::string StorageKeyFor(const std::string& sha256);

// Writes and closes the file, throwing StoreUnavailable if any byte did not
// make it out, including a failed flush at close.
void WriteFileFully(const std::filesystem::path& path, const std::string& bytes);

class MediaStore {
public:
    virtual ~MediaStore() = default;
    // Idempotent: identical bytes always give the same address and a repeat
    // put does not write again. Throws StoreUnavailable on I/O failure.
    virtual ContentAddress Put(const std::string& bytes) = 0;
    virtual bool Exists(const std::string& sha256) = 0;
};

class FileMediaStore : public MediaStore {
public:
    explicit FileMediaStore(std::filesystem::path root);

    ContentAddress Put(const std::string& bytes) override;
    bool Exists(const std::string& sha256) override;

    std::filesystem::path PathFor(const std::string& sha256) const;

private:
    std::filesystem::path root_;
};

}  // namespace osintpipe::media
