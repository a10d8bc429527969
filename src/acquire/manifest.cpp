// =============================================================================
// genoqc - Acquisition Manifest Implementation
// =============================================================================

#include "gqc/acquire/manifest.h"

#include <chrono>
#include <format>
#include <fstream>
#include <system_error>

#include "gqc/common/strings.h"

namespace gqc::acquire {

namespace {

constexpr std::string_view kManifestHeader =
    "filename\trole\taccession\tregistry\ttechnology\tsource_url\tbytes\tchecksum\tcreated_utc";

constexpr std::size_t kManifestColumns = 9;

Result<ObjectRole> parseObjectRole(std::string_view name) {
    for (ObjectRole role : {ObjectRole::kSingle, ObjectRole::kShortR1, ObjectRole::kShortR2,
                            ObjectRole::kLong}) {
        if (objectRoleToString(role) == name) {
            return role;
        }
    }
    return makeError(ErrorCode::kFormatError, "unknown object role '{}'", name);
}

}  // namespace

std::string utcTimestamp() {
    const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", now);
}

VoidResult ManifestWriter::append(const std::vector<ManifestEntry>& entries) {
    if (entries.empty()) {
        return {};
    }

    std::lock_guard lock(mutex_);

    std::error_code ec;
    const bool isNew = !std::filesystem::exists(path_, ec) ||
                       std::filesystem::file_size(path_, ec) == 0;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return makeError(ErrorCode::kIOError, "cannot create '{}': {}",
                             path_.parent_path().string(), ec.message());
        }
    }

    std::ofstream out(path_, std::ios::app);
    if (!out) {
        return makeError(ErrorCode::kIOError, "cannot open manifest '{}'", path_.string());
    }
    if (isNew) {
        out << kManifestHeader << '\n';
    }
    for (const auto& entry : entries) {
        out << std::format("{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\n", entry.fileName,
                           objectRoleToString(entry.role), entry.accession,
                           registryToString(entry.registry),
                           readTechnologyToString(entry.technology), entry.sourceUrl, entry.bytes,
                           entry.checksum, entry.createdUtc);
    }
    out.flush();
    if (!out) {
        return makeError(ErrorCode::kIOError, "write to manifest '{}' failed", path_.string());
    }
    return {};
}

Result<std::vector<ManifestEntry>> readManifest(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return makeError(ErrorCode::kIOError, "cannot open manifest '{}'", path.string());
    }

    std::vector<ManifestEntry> entries;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (line.empty() || line == kManifestHeader) {
            continue;
        }
        const auto fields = split(line, '\t');
        if (fields.size() != kManifestColumns) {
            return makeError(ErrorCode::kFormatError, "{}:{}: expected {} columns, got {}",
                             path.string(), lineNumber, kManifestColumns, fields.size());
        }

        ManifestEntry entry;
        entry.fileName = std::string(fields[0]);
        auto role = parseObjectRole(fields[1]);
        auto registry = parseRegistry(fields[3]);
        auto technology = parseReadTechnology(fields[4]);
        auto bytes = parseUnsigned<ByteCount>(fields[6]);
        if (!role || !registry || !technology || !bytes) {
            return makeError(ErrorCode::kFormatError, "{}:{}: malformed manifest row",
                             path.string(), lineNumber);
        }
        entry.role = *role;
        entry.accession = std::string(fields[2]);
        entry.registry = *registry;
        entry.technology = *technology;
        entry.sourceUrl = std::string(fields[5]);
        entry.bytes = *bytes;
        entry.checksum = std::string(fields[7]);
        entry.createdUtc = std::string(fields[8]);
        entries.push_back(std::move(entry));
    }
    return entries;
}

}  // namespace gqc::acquire
