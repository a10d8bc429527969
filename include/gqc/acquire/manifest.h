// =============================================================================
// genoqc - Acquisition Manifest
// =============================================================================
// Tab-separated record of every verified object in a data directory:
//
//   filename  role  accession  registry  technology  source_url  bytes  checksum  created_utc
//
// Rows are appended; the header is written only when the file is created.
// =============================================================================

#ifndef GQC_ACQUIRE_MANIFEST_H
#define GQC_ACQUIRE_MANIFEST_H

#include <filesystem>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "gqc/common/error.h"
#include "gqc/common/types.h"

namespace gqc::acquire {

/// @brief One manifest row.
struct ManifestEntry {
    std::string fileName;
    ObjectRole role = ObjectRole::kSingle;
    std::string accession;
    Registry registry = Registry::kEna;
    ReadTechnology technology = ReadTechnology::kShortRead;
    std::string sourceUrl;
    ByteCount bytes = 0;

    /// @brief "algo:hex" digest of the stored file, computed even when nothing was expected.
    std::string checksum;

    /// @brief ISO-8601 UTC timestamp.
    std::string createdUtc;
};

/// @brief Appends rows to one manifest file; safe to share between threads.
class ManifestWriter {
public:
    explicit ManifestWriter(std::filesystem::path path) : path_(std::move(path)) {}

    [[nodiscard]] VoidResult append(const std::vector<ManifestEntry>& entries);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

/// @brief Read a manifest written by ManifestWriter.
[[nodiscard]] Result<std::vector<ManifestEntry>> readManifest(const std::filesystem::path& path);

/// @brief Current time as "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string utcTimestamp();

}  // namespace gqc::acquire

#endif  // GQC_ACQUIRE_MANIFEST_H
