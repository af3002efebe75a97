#include "device/local_filesystem.hpp"

#include "util/logger.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace adbpipe {

bool PosixLocalFileSystem::Exists(const std::string& path) const {
    std::error_code ec;
    return !path.empty() && fs::exists(fs::path(path), ec);
}

std::uint64_t PosixLocalFileSystem::LocalSize(const std::string& path,
                                              const std::atomic_bool& cancel) const {
    if (path.empty())
        return 0;

    LogDebug("Calculating local size for: %s", path.c_str());

    std::uint64_t total = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(
        fs::path(path), fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LogError("Error calculating local size of %s: %s", path.c_str(), ec.message().c_str());
        return 0;
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        if (cancel.load(std::memory_order_relaxed)) {
            LogWarn("Local size walk of %s cancelled", path.c_str());
            return 0;
        }

        std::error_code entry_ec;
        if (!it->is_symlink(entry_ec) && it->is_regular_file(entry_ec)) {
            const auto size = it->file_size(entry_ec);
            if (entry_ec) {
                LogWarn("Cannot stat %s: %s", it->path().c_str(), entry_ec.message().c_str());
            } else {
                total += size;
            }
        }

        it.increment(ec);
        if (ec) {
            LogError("Local size walk of %s stopped early: %s", path.c_str(), ec.message().c_str());
            break;
        }
    }

    LogInfo("Local size: %llu bytes", static_cast<unsigned long long>(total));
    return total;
}

Result PosixLocalFileSystem::EnsureDir(const std::string& path) const {
    std::error_code ec;
    fs::create_directories(fs::path(path), ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot create " + path + ": " + ec.message());
    }
    return Result::Ok();
}

} // namespace adbpipe
