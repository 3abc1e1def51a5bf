#pragma once

#include <memory>
#include <string>
#include <vector>

namespace drover {

// Abstract interface for the byte-moving mechanism -- allows in-process,
// external and scripted implementations behind the same executor.
class ITransferOperation {
public:
    virtual ~ITransferOperation() = default;

    virtual const char* name() const = 0;

    // If true, a failed run leaves its staging directory in place so a
    // later run into the same staging directory can resume.
    virtual bool preserves_partial() const = 0;

    // Populate staging (a directory path that may or may not exist yet) with
    // the contents of source. Returns false and sets error on failure.
    virtual bool run(const std::string& source, const std::string& staging,
                     std::string& error) = 0;
};

// Recursive std::filesystem copy. Partial data is not kept.
class CopyTransfer : public ITransferOperation {
public:
    const char* name() const override;
    bool preserves_partial() const override;
    bool run(const std::string& source, const std::string& staging,
             std::string& error) override;
};

// `<binary> -a --partial <source>/ <staging>/` in a child process.
class RsyncTransfer : public ITransferOperation {
public:
    explicit RsyncTransfer(std::string binary = "rsync");

    const char* name() const override;
    bool preserves_partial() const override;
    bool run(const std::string& source, const std::string& staging,
             std::string& error) override;

    std::vector<std::string> command_line(const std::string& source,
                                          const std::string& staging) const;

private:
    std::string binary_;
};

// "copy" or "rsync"; nullptr for anything else.
std::unique_ptr<ITransferOperation> create_transfer_operation(const std::string& method,
                                                              const std::string& rsync_binary);

} // namespace drover
