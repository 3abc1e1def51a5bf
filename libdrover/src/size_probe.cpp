#include "size_probe.h"

#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <string>
#include <sys/stat.h>
#include <sys/statvfs.h>

namespace drover {

std::optional<uint64_t> FilesystemSizeProbe::free_space(const std::string& path) {
    struct statvfs buf{};
    if (statvfs(path.c_str(), &buf) != 0) {
        return std::nullopt;
    }

    uint64_t block_size = buf.f_frsize ? buf.f_frsize : buf.f_bsize;
    return static_cast<uint64_t>(buf.f_bavail) * block_size;
}

namespace {

// Recursively accumulate apparent sizes (st_size, not blocks).
// The first failure stops the walk and is left in ec.
uint64_t accumulate_size(const std::string& dir_path, std::error_code& ec) {
    uint64_t total = 0;

    DIR* dir = opendir(dir_path.c_str());
    if (!dir) {
        ec.assign(errno, std::generic_category());
        return 0;
    }

    struct dirent* entry;
    while (true) {
        errno = 0;
        entry = readdir(dir);
        if (!entry) {
            if (errno != 0) ec.assign(errno, std::generic_category());
            break;
        }

        // Skip . and ..
        if (entry->d_name[0] == '.') {
            if (entry->d_name[1] == '\0') continue;
            if (entry->d_name[1] == '.' && entry->d_name[2] == '\0') continue;
        }

        std::string full_path = dir_path + "/" + entry->d_name;

        struct stat st{};
        if (lstat(full_path.c_str(), &st) != 0) {
            ec.assign(errno, std::generic_category());
            break;
        }

        if (S_ISDIR(st.st_mode)) {
            total += accumulate_size(full_path, ec);
            if (ec) break;
        } else {
            total += static_cast<uint64_t>(st.st_size);
        }
    }

    closedir(dir);
    return total;
}

} // anonymous namespace

uint64_t FilesystemSizeProbe::subtree_size(const std::string& path, std::error_code& ec) {
    ec.clear();

    struct stat st{};
    if (lstat(path.c_str(), &st) != 0) {
        ec.assign(errno, std::generic_category());
        return 0;
    }

    if (S_ISDIR(st.st_mode)) {
        return accumulate_size(path, ec);
    }
    return static_cast<uint64_t>(st.st_size);
}

} // namespace drover
