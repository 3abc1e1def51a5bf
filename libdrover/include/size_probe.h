#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace drover {

// Abstract interface for filesystem size queries -- allows scripted and real implementations
class ISizeProbe {
public:
    virtual ~ISizeProbe() = default;

    // Available (not total) bytes on the filesystem containing path.
    // Empty if the path cannot be stat'ed.
    virtual std::optional<uint64_t> free_space(const std::string& path) = 0;

    // Sum of the sizes of every non-directory entry under path.
    // Any traversal error stops the walk and is reported through ec;
    // the returned value is meaningless in that case.
    virtual uint64_t subtree_size(const std::string& path, std::error_code& ec) = 0;
};

// statvfs / lstat backed implementation. Symlinks are counted, never followed.
class FilesystemSizeProbe : public ISizeProbe {
public:
    std::optional<uint64_t> free_space(const std::string& path) override;
    uint64_t subtree_size(const std::string& path, std::error_code& ec) override;
};

} // namespace drover
