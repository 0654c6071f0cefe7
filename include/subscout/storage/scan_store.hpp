#pragma once

#include "../common/types.hpp"
#include "../core/error_codes.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace subscout {
namespace storage {

class StorageError : public std::runtime_error {
public:
    StorageError(core::CoreErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    core::CoreErrorCode code() const { return code_; }

private:
    core::CoreErrorCode code_;
};

// Persistent scan history. Implementations throw StorageError on I/O failure.
class ScanStore {
public:
    virtual ~ScanStore() = default;

    virtual int64_t startRun(const std::string& domain) = 0;
    virtual void completeRun(int64_t run_id, size_t total, int64_t duration_ms) = 0;

    // Entries sorted by name; meta comes from the latest completed run.
    virtual common::Snapshot loadSnapshot(const std::string& domain) = 0;

    // Insert-or-update keyed by (domain, name). Also records the names as
    // members of run_id when one is given.
    virtual void upsertEntries(const std::string& domain,
                               const std::vector<common::SubdomainEntry>& entries,
                               std::optional<int64_t> run_id) = 0;

    // Completed runs only, newest first.
    virtual std::vector<common::ScanRun> recentRuns(size_t limit) = 0;

    // Completed runs newest first, then unfinished runs newest first.
    virtual std::vector<common::ScanRun> runsForDomain(const std::string& domain, size_t limit) = 0;
};

}}
