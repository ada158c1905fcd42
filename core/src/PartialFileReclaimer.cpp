#include "opencopy/PartialFileReclaimer.hpp"

#include <filesystem>
#include <system_error>
#include <thread>
#include <utility>

namespace opencopy {

namespace fs = std::filesystem;

PartialFileReclaimer::PartialFileReclaimer(ReclaimPolicy policy,
                                           Sleeper sleeper)
    : policy_(policy), sleeper_(std::move(sleeper)) {
    if (policy_.maxAttempts < 1)
        policy_.maxAttempts = 1;
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) {
            std::this_thread::sleep_for(d);
        };
    }
}

std::chrono::milliseconds PartialFileReclaimer::backoffFor(int attempt) const {
    auto delay = policy_.initialDelay;
    for (int i = 1; i < attempt && delay < policy_.maxDelay; ++i)
        delay *= 2;
    return delay < policy_.maxDelay ? delay : policy_.maxDelay;
}

bool PartialFileReclaimer::reclaim(const std::string& path, std::string& err) {
    err.clear();
    lastAttempts_ = 0;
    const fs::path p(path);

    std::error_code ec;
    const fs::file_status st = fs::symlink_status(p, ec);
    if (ec || !fs::exists(st))
        return true; // nothing left behind

    // Clear the read-only state first.
    if (fs::is_regular_file(st) &&
        (st.permissions() & fs::perms::owner_write) == fs::perms::none) {
        fs::permissions(p, fs::perms::owner_write, fs::perm_options::add, ec);
    }

    bool parentOpened = false;
    for (int attempt = 1; attempt <= policy_.maxAttempts; ++attempt) {
        lastAttempts_ = attempt;
        ec.clear();
        fs::remove(p, ec);
        if (!ec)
            return true;

        if (ec == std::errc::permission_denied ||
            ec == std::errc::operation_not_permitted) {
            if (!parentOpened) {
                // Unlinking needs write access to the directory, not the file.
                parentOpened = true;
                std::error_code pec;
                fs::permissions(p.parent_path(),
                                fs::perms::owner_all, fs::perm_options::add,
                                pec);
            }
        }
        err = ec.message();
        if (attempt < policy_.maxAttempts)
            sleeper_(backoffFor(attempt));
    }

    err = "Could not remove partial file after " +
          std::to_string(policy_.maxAttempts) + " attempts: " + err;
    return false;
}

} // namespace opencopy
