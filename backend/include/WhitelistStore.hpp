#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "Whitelist.hpp"

namespace bluegate {

// Persists the whitelist as "valid_devices" inside a JSON config file.
// Other keys in the file are left untouched.
class WhitelistStore {
public:
    explicit WhitelistStore(std::string path);

    const std::string& path() const { return path_; }

    // std::nullopt when the file or its "valid_devices" key is missing.
    // Throws std::runtime_error on a malformed file.
    std::optional<std::vector<WhitelistEntry>> load() const;

    // Writes via a temp file + rename. Returns false (and logs) on I/O failure.
    bool save(const std::vector<WhitelistEntry>& entries);

private:
    std::string path_;
    std::mutex io_m_;
};

} // namespace bluegate
