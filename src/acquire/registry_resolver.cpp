// =============================================================================
// genoqc - Registry Resolver Implementation
// =============================================================================

#include "gqc/acquire/registry_resolver.h"

#include <algorithm>
#include <format>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <unordered_map>

#include "gqc/common/logger.h"
#include "gqc/common/strings.h"

namespace gqc::acquire {

namespace {

/// @brief Column lookup over one header row.
class ColumnIndex {
public:
    template <typename Fields>
    explicit ColumnIndex(const Fields& header) {
        for (std::size_t i = 0; i < header.size(); ++i) {
            columns_.emplace(std::string(trim(header[i])), i);
        }
    }

    [[nodiscard]] bool has(std::string_view name) const {
        return columns_.find(std::string(name)) != columns_.end();
    }

    template <typename Fields>
    [[nodiscard]] std::string_view get(const Fields& row, std::string_view name) const {
        auto it = columns_.find(std::string(name));
        if (it == columns_.end() || it->second >= row.size()) {
            return {};
        }
        return trim(std::string_view(row[it->second]));
    }

private:
    std::unordered_map<std::string, std::size_t> columns_;
};

std::vector<std::string_view> nonEmptyLines(std::string_view body) {
    std::vector<std::string_view> lines;
    for (auto line : split(body, '\n')) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (!trim(line).empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

bool isUnknownCell(std::string_view cell) {
    cell = trim(cell);
    return cell.empty() || cell == "-";
}

std::string httpsUrl(std::string_view url) {
    std::string normalized = net::normalizeUrl(trim(url));
    constexpr std::string_view kHttp = "http://";
    if (normalized.starts_with(kHttp)) {
        normalized = std::format("https://{}", std::string_view(normalized).substr(kHttp.size()));
    }
    return normalized;
}

Result<ReadTechnology> technologyFor(std::string_view run,
                                     std::string_view platform,
                                     std::optional<ReadTechnology> override) {
    if (override) {
        return *override;
    }
    auto technology = technologyForPlatform(platform);
    if (!technology) {
        return makeError(ErrorCode::kUnsupportedTechnology,
                         "{}: instrument platform '{}' maps to no technology class", run,
                         platform);
    }
    return *technology;
}

}  // namespace

// =============================================================================
// Helpers
// =============================================================================

std::string fileNameFromUrl(std::string_view url) {
    url = url.substr(0, url.find_first_of("?#"));
    while (!url.empty() && url.back() == '/') {
        url.remove_suffix(1);
    }
    const auto slash = url.rfind('/');
    const std::string_view name = slash == std::string_view::npos ? url : url.substr(slash + 1);
    return isSafePathComponent(name) ? std::string(name) : std::string();
}

std::size_t dropDuplicateAccessions(std::vector<DatasetRef>& datasets) {
    std::set<std::string> seen;
    const auto before = datasets.size();
    std::erase_if(datasets, [&](const DatasetRef& dataset) {
        if (seen.insert(dataset.accession).second) {
            return false;
        }
        GQC_LOG_DEBUG("{} requested more than once; keeping the first", dataset.accession);
        return true;
    });
    return before - datasets.size();
}

void assignObjectRoles(DatasetRef& dataset) {
    if (dataset.technology == ReadTechnology::kLongRead) {
        for (auto& object : dataset.objects) {
            object.role = ObjectRole::kLong;
        }
        return;
    }

    bool anyMate = false;
    for (auto& object : dataset.objects) {
        const std::string name = toLower(object.fileName);
        if (name.find("_1.f") != std::string::npos || name.find("_r1") != std::string::npos) {
            object.role = ObjectRole::kShortR1;
            anyMate = true;
        } else if (name.find("_2.f") != std::string::npos ||
                   name.find("_r2") != std::string::npos) {
            object.role = ObjectRole::kShortR2;
            anyMate = true;
        } else {
            object.role = ObjectRole::kSingle;
        }
    }
    // Two unnamed files of a paired run: keep listing order as R1, R2.
    if (!anyMate && dataset.objects.size() == 2 &&
        toUpper(dataset.metadata.libraryLayout) == "PAIRED") {
        dataset.objects[0].role = ObjectRole::kShortR1;
        dataset.objects[1].role = ObjectRole::kShortR2;
    }

    auto rank = [](ObjectRole role) {
        switch (role) {
            case ObjectRole::kShortR1:
                return 0;
            case ObjectRole::kShortR2:
                return 1;
            case ObjectRole::kSingle:
            case ObjectRole::kLong:
                return 2;
        }
        return 2;
    };
    std::stable_sort(dataset.objects.begin(), dataset.objects.end(),
                     [&](const RemoteObject& a, const RemoteObject& b) {
                         return rank(a.role) < rank(b.role);
                     });
}

// =============================================================================
// ENA filereport
// =============================================================================

namespace {

/// @brief Rows whose platform maps to no technology class.
enum class UnmappedPlatform : std::uint8_t { kFail, kSkip };

Result<std::vector<DatasetRef>> parseEnaRows(std::string_view body,
                                             std::optional<ReadTechnology> technology,
                                             UnmappedPlatform unmapped) {
    const auto lines = nonEmptyLines(body);
    if (lines.empty()) {
        return makeError(ErrorCode::kResolutionFailed, "empty ENA report");
    }
    const ColumnIndex columns(split(lines.front(), '\t'));
    if (!columns.has("run_accession") || !columns.has("fastq_ftp")) {
        return makeError(ErrorCode::kFormatError,
                         "ENA report lacks run_accession/fastq_ftp columns");
    }

    std::vector<DatasetRef> datasets;
    for (std::size_t i = 1; i < lines.size(); ++i) {
        const auto row = split(lines[i], '\t');

        DatasetRef dataset;
        dataset.accession = std::string(columns.get(row, "run_accession"));
        dataset.registry = Registry::kEna;
        dataset.metadata.sampleAccession = std::string(columns.get(row, "sample_accession"));
        dataset.metadata.studyAccession = std::string(columns.get(row, "study_accession"));
        dataset.metadata.scientificName = std::string(columns.get(row, "scientific_name"));
        dataset.metadata.instrumentPlatform =
            std::string(columns.get(row, "instrument_platform"));
        dataset.metadata.instrumentModel = std::string(columns.get(row, "instrument_model"));
        dataset.metadata.libraryLayout = std::string(columns.get(row, "library_layout"));
        dataset.metadata.libraryStrategy = std::string(columns.get(row, "library_strategy"));
        dataset.metadata.readCount = parseUnsigned<std::uint64_t>(columns.get(row, "read_count"));
        dataset.metadata.baseCount = parseUnsigned<std::uint64_t>(columns.get(row, "base_count"));
        if (!isSafePathComponent(dataset.accession)) {
            return makeError(ErrorCode::kFormatError, "ENA report line {}: bad run accession '{}'",
                             i + 1, dataset.accession);
        }

        const auto urls = split(columns.get(row, "fastq_ftp"), ';');
        const auto sizes = split(columns.get(row, "fastq_bytes"), ';');
        const auto digests = split(columns.get(row, "fastq_md5"), ';');
        for (std::size_t j = 0; j < urls.size(); ++j) {
            if (trim(urls[j]).empty()) {
                continue;
            }
            RemoteObject object;
            object.url = httpsUrl(urls[j]);
            object.fileName = fileNameFromUrl(object.url);
            if (object.fileName.empty()) {
                return makeError(ErrorCode::kFormatError, "{}: URL '{}' has no usable file name",
                                 dataset.accession, object.url);
            }
            if (j < sizes.size()) {
                object.expectedSize = parseUnsigned<ByteCount>(sizes[j]);
            }
            if (j < digests.size() && !isUnknownCell(digests[j])) {
                auto checksum = parseChecksumSpec(digests[j]);
                if (!checksum) {
                    return std::unexpected(checksum.error());
                }
                object.expectedChecksum = *checksum;
            }
            dataset.objects.push_back(std::move(object));
        }

        if (dataset.objects.empty()) {
            GQC_LOG_WARNING("{}: ENA lists no FASTQ files; skipping run", dataset.accession);
            continue;
        }

        auto tech = technologyFor(dataset.accession, dataset.metadata.instrumentPlatform,
                                  technology);
        if (!tech) {
            if (unmapped == UnmappedPlatform::kSkip) {
                GQC_LOG_DEBUG("{}", tech.error().message());
                continue;
            }
            return std::unexpected(tech.error());
        }
        dataset.technology = *tech;
        assignObjectRoles(dataset);
        datasets.push_back(std::move(dataset));
    }
    return datasets;
}

}  // namespace

Result<std::vector<DatasetRef>> parseEnaFilereport(std::string_view body,
                                                   std::optional<ReadTechnology> technology) {
    return parseEnaRows(body, technology, UnmappedPlatform::kFail);
}

Result<std::vector<DatasetRef>> parseEnaSearch(std::string_view body) {
    return parseEnaRows(body, std::nullopt, UnmappedPlatform::kSkip);
}

// =============================================================================
// NCBI runinfo
// =============================================================================

Result<std::vector<DatasetRef>> parseNcbiRuninfo(std::string_view body,
                                                 std::optional<ReadTechnology> technology) {
    const auto lines = nonEmptyLines(body);
    if (lines.empty()) {
        return makeError(ErrorCode::kResolutionFailed, "empty NCBI runinfo");
    }
    const auto header = splitCsv(lines.front());
    const ColumnIndex columns(header);
    if (!columns.has("Run") || !columns.has("download_path")) {
        return makeError(ErrorCode::kFormatError, "NCBI runinfo lacks Run/download_path columns");
    }

    std::vector<DatasetRef> datasets;
    for (std::size_t i = 1; i < lines.size(); ++i) {
        const auto row = splitCsv(lines[i]);
        if (row == header) {
            continue;  // repeated header between result pages
        }
        const std::string_view downloadPath = columns.get(row, "download_path");
        if (downloadPath.empty()) {
            continue;
        }

        DatasetRef dataset;
        dataset.accession = std::string(columns.get(row, "Run"));
        dataset.registry = Registry::kNcbi;
        dataset.metadata.sampleAccession = std::string(columns.get(row, "Sample"));
        dataset.metadata.studyAccession = std::string(columns.get(row, "SRAStudy"));
        dataset.metadata.scientificName = std::string(columns.get(row, "ScientificName"));
        dataset.metadata.instrumentPlatform = std::string(columns.get(row, "Platform"));
        dataset.metadata.instrumentModel = std::string(columns.get(row, "Model"));
        dataset.metadata.libraryLayout = std::string(columns.get(row, "LibraryLayout"));

        // runinfo only reports rounded megabytes, so the size stays unknown.
        if (!isSafePathComponent(dataset.accession)) {
            return makeError(ErrorCode::kFormatError, "NCBI runinfo line {}: bad run '{}'", i + 1,
                             dataset.accession);
        }
        RemoteObject object;
        object.url = httpsUrl(downloadPath);
        object.fileName = fileNameFromUrl(object.url);
        if (object.fileName.empty()) {
            return makeError(ErrorCode::kFormatError, "{}: URL '{}' has no usable file name",
                             dataset.accession, object.url);
        }
        dataset.objects.push_back(std::move(object));

        auto tech = technologyFor(dataset.accession, dataset.metadata.instrumentPlatform,
                                  technology);
        if (!tech) {
            return std::unexpected(tech.error());
        }
        dataset.technology = *tech;
        assignObjectRoles(dataset);
        datasets.push_back(std::move(dataset));
    }
    return datasets;
}

// =============================================================================
// Dataset sheet
// =============================================================================

Result<std::vector<DatasetRef>> parseDatasetSheet(std::string_view text) {
    std::vector<DatasetRef> datasets;
    std::map<std::string, std::size_t> byAccession;

    std::size_t lineNumber = 0;
    for (auto line : split(text, '\n')) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (trim(line).empty() || trim(line).starts_with('#')) {
            continue;
        }
        const auto fields = split(line, '\t');
        if (toLower(trim(fields[0])) == "accession") {
            continue;
        }
        if (fields.size() < 4) {
            return makeError(ErrorCode::kFormatError,
                             "dataset sheet line {}: expected at least 4 columns, got {}",
                             lineNumber, fields.size());
        }

        const std::string accession(trim(fields[0]));
        if (!isSafePathComponent(accession)) {
            return makeError(ErrorCode::kFormatError,
                             "dataset sheet line {}: accession '{}' is not a valid directory name",
                             lineNumber, accession);
        }
        auto technology = parseReadTechnology(fields[2]);
        if (!technology) {
            return makeError(ErrorCode::kUnsupportedTechnology, "dataset sheet line {}: {}",
                             lineNumber, technology.error().message());
        }

        Result<Registry> registry = isUnknownCell(fields[1]) ? registryForAccession(accession)
                                                             : parseRegistry(fields[1]);
        if (!registry) {
            return makeError(registry.error().code(), "dataset sheet line {}: {}", lineNumber,
                             registry.error().message());
        }

        RemoteObject object;
        object.url = std::string(trim(fields[3]));
        object.fileName = fileNameFromUrl(object.url);
        if (object.fileName.empty()) {
            return makeError(ErrorCode::kFormatError,
                             "dataset sheet line {}: URL has no usable file name", lineNumber);
        }
        if (fields.size() > 4 && !isUnknownCell(fields[4])) {
            object.expectedSize = parseUnsigned<ByteCount>(fields[4]);
            if (!object.expectedSize) {
                return makeError(ErrorCode::kFormatError, "dataset sheet line {}: bad size '{}'",
                                 lineNumber, fields[4]);
            }
        }
        if (fields.size() > 5 && !isUnknownCell(fields[5])) {
            auto checksum = parseChecksumSpec(fields[5]);
            if (!checksum) {
                return makeError(ErrorCode::kFormatError, "dataset sheet line {}: {}",
                                 lineNumber, checksum.error().message());
            }
            object.expectedChecksum = *checksum;
        }

        auto [it, inserted] = byAccession.try_emplace(accession, datasets.size());
        if (inserted) {
            DatasetRef dataset;
            dataset.accession = accession;
            dataset.registry = *registry;
            dataset.technology = *technology;
            datasets.push_back(std::move(dataset));
        }
        DatasetRef& dataset = datasets[it->second];
        if (dataset.technology != *technology) {
            return makeError(ErrorCode::kFormatError,
                             "dataset sheet line {}: {} declared with two technology classes",
                             lineNumber, accession);
        }
        const bool duplicate = std::any_of(
            dataset.objects.begin(), dataset.objects.end(),
            [&](const RemoteObject& other) { return other.fileName == object.fileName; });
        if (duplicate) {
            return makeError(ErrorCode::kFormatError,
                             "dataset sheet line {}: {} lists '{}' twice", lineNumber, accession,
                             object.fileName);
        }
        dataset.objects.push_back(std::move(object));
    }

    for (auto& dataset : datasets) {
        assignObjectRoles(dataset);
    }
    return datasets;
}

Result<std::vector<DatasetRef>> loadDatasetSheet(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return makeError(ErrorCode::kIOError, "cannot open dataset sheet '{}'", path.string());
    }
    std::ostringstream text;
    text << in.rdbuf();
    return parseDatasetSheet(text.str());
}

// =============================================================================
// RegistryResolver
// =============================================================================

RegistryResolver::RegistryResolver(ResolverConfig config,
                                   TransferConfig transfer,
                                   net::RangeSourcePtr source)
    : config_(std::move(config)), transfer_(std::move(transfer)), source_(std::move(source)) {}

net::RangeRequest RegistryResolver::request(std::string url) const {
    net::RangeRequest request;
    request.url = std::move(url);
    request.connectTimeoutSec = transfer_.connectTimeoutSec;
    request.readTimeoutSec = transfer_.readTimeoutSec;
    request.userAgent = transfer_.userAgent;
    request.verifyTls = transfer_.verifyTls;
    return request;
}

Result<std::vector<DatasetRef>> RegistryResolver::resolve(
    std::string_view accession, std::optional<ReadTechnology> technology) const {
    const std::string id(trim(accession));
    auto registry = registryForAccession(id);
    if (!registry) {
        return std::unexpected(registry.error());
    }

    std::string url;
    switch (*registry) {
        case Registry::kEna:
            url = std::format("{}?accession={}&result=read_run&fields={}&format=tsv",
                              config_.enaFilereportUrl, id, kEnaFilereportFields);
            break;
        case Registry::kNcbi:
            url = std::format("{}?acc={}", config_.ncbiRuninfoUrl, id);
            break;
    }

    GQC_LOG_DEBUG("Resolving {} via {}", id, registryToString(*registry));
    auto body = source_->fetchText(request(std::move(url)));
    if (!body) {
        return makeError(body.error().code(), "resolving {}: {}", id, body.error().message());
    }

    auto datasets = *registry == Registry::kEna ? parseEnaFilereport(*body, technology)
                                                : parseNcbiRuninfo(*body, technology);
    if (!datasets) {
        return std::unexpected(datasets.error());
    }
    if (datasets->empty()) {
        return makeError(ErrorCode::kResolutionFailed, "{}: registry returned no runs with files",
                         id);
    }
    GQC_LOG_INFO("Resolved {} to {} run(s) on {}", id, datasets->size(),
                 registryToString(*registry));
    return datasets;
}

Result<std::vector<DatasetRef>> RegistryResolver::resolveAll(
    const std::vector<std::string>& accessions, std::optional<ReadTechnology> technology) const {
    std::vector<DatasetRef> all;
    for (const auto& accession : accessions) {
        auto datasets = resolve(accession, technology);
        if (!datasets) {
            return std::unexpected(datasets.error());
        }
        for (auto& dataset : *datasets) {
            all.push_back(std::move(dataset));
        }
    }
    if (const auto dropped = dropDuplicateAccessions(all); dropped > 0) {
        GQC_LOG_INFO("Dropped {} run(s) reached through more than one accession", dropped);
    }
    return all;
}

std::string RegistryResolver::searchUrl(std::string_view organism,
                                        std::string_view strategy) const {
    std::string query = std::format("scientific_name=\"{}\"", trim(organism));
    if (!trim(strategy).empty()) {
        query += std::format(" AND library_strategy=\"{}\"", toUpper(trim(strategy)));
    }
    return std::format("{}?result=read_run&format=tsv&limit={}&fields={}&query={}",
                       config_.enaSearchUrl, config_.searchLimit, kEnaFilereportFields,
                       percentEncode(query));
}

Result<std::vector<DatasetRef>> RegistryResolver::discover(std::string_view organism,
                                                           std::string_view strategy) const {
    if (trim(organism).empty()) {
        return makeError(ErrorCode::kInvalidArgument, "organism name is empty");
    }
    GQC_LOG_INFO("Searching ENA for {} runs of {}",
                 trim(strategy).empty() ? std::string("all") : toUpper(trim(strategy)),
                 trim(organism));
    auto body = source_->fetchText(request(searchUrl(organism, strategy)));
    if (!body) {
        return makeError(body.error().code(), "searching {}: {}", trim(organism),
                         body.error().message());
    }
    auto runs = parseEnaSearch(*body);
    if (!runs) {
        return std::unexpected(runs.error());
    }
    if (runs->empty()) {
        return makeError(ErrorCode::kResolutionFailed, "no ENA runs of {} with FASTQ files",
                         trim(organism));
    }
    GQC_LOG_INFO("Found {} candidate run(s) of {}", runs->size(), trim(organism));
    return runs;
}

}  // namespace gqc::acquire
