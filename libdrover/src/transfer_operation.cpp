#include "transfer_operation.h"
#include "drover_log.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <utility>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace drover {

// ---------------------------------------------------------------------------
// CopyTransfer
// ---------------------------------------------------------------------------

const char* CopyTransfer::name() const { return "copy"; }

bool CopyTransfer::preserves_partial() const { return false; }

bool CopyTransfer::run(const std::string& source, const std::string& staging,
                       std::string& error) {
    std::error_code ec;
    fs::copy(source, staging,
             fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        error = "copy " + source + ": " + ec.message();
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// RsyncTransfer
// ---------------------------------------------------------------------------

RsyncTransfer::RsyncTransfer(std::string binary)
    : binary_(std::move(binary))
{
}

const char* RsyncTransfer::name() const { return "rsync"; }

bool RsyncTransfer::preserves_partial() const { return true; }

std::vector<std::string> RsyncTransfer::command_line(const std::string& source,
                                                     const std::string& staging) const {
    // Trailing slashes: sync the contents of source into staging itself.
    return {binary_, "-a", "--partial", source + "/", staging + "/"};
}

bool RsyncTransfer::run(const std::string& source, const std::string& staging,
                        std::string& error) {
    std::vector<std::string> argv = command_line(source, staging);
    std::vector<char*> args;
    for (auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    DROVER_LOG_DEBUG("exec %s %s -> %s", binary_.c_str(), source.c_str(), staging.c_str());

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork: ") + std::strerror(errno);
        return false;
    }
    if (pid == 0) {
        // Own process group: a terminal interrupt stops drover between rounds
        // and must not kill the copy in flight.
        ::setpgid(0, 0);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }
    if (::setpgid(pid, pid) != 0 && errno != EACCES) {
        DROVER_LOG_DEBUG("setpgid %d: %s", static_cast<int>(pid), std::strerror(errno));
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            error = std::string("waitpid: ") + std::strerror(errno);
            return false;
        }
    }

    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 0) return true;
        if (code == 127) {
            error = binary_ + ": could not be executed";
        } else {
            error = binary_ + " exited with status " + std::to_string(code);
        }
        return false;
    }
    if (WIFSIGNALED(status)) {
        error = binary_ + " killed by signal " + std::to_string(WTERMSIG(status));
        return false;
    }
    error = binary_ + " ended abnormally";
    return false;
}

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

std::unique_ptr<ITransferOperation> create_transfer_operation(const std::string& method,
                                                              const std::string& rsync_binary) {
    if (method == "copy") {
        return std::make_unique<CopyTransfer>();
    }
    if (method == "rsync") {
        return std::make_unique<RsyncTransfer>(rsync_binary.empty() ? "rsync" : rsync_binary);
    }
    return nullptr;
}

} // namespace drover
