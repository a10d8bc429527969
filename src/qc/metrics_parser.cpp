// =============================================================================
// genoqc - QC Metric Parsers Implementation
// =============================================================================

#include "gqc/qc/metrics_parser.h"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include "gqc/common/strings.h"

namespace gqc::qc {

namespace {

constexpr std::string_view kFastqcDataFile = "fastqc_data.txt";
constexpr std::string_view kFastqcDirSuffix = "_fastqc";
constexpr std::string_view kNanoStatsSuffix = "NanoStats.txt";

Result<std::string> readText(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return makeError(ErrorCode::kIOError, "cannot open '{}'", path.string());
    }
    std::ostringstream text;
    text << in.rdbuf();
    return text.str();
}

std::vector<std::string_view> lines(std::string_view text) {
    auto result = split(text, '\n');
    for (auto& line : result) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
    }
    return result;
}

/// @brief Drop thousands separators from numeric values; keep other text.
std::string cleanValue(std::string_view value) {
    value = trim(value);
    if (parseNumber(value)) {
        std::string cleaned;
        for (char c : value) {
            if (c != ',') {
                cleaned.push_back(c);
            }
        }
        return cleaned;
    }
    return std::string(value);
}

/// @brief Every path under @p root whose file name satisfies @p match, sorted.
template <typename Predicate>
std::vector<std::filesystem::path> findFiles(const std::filesystem::path& root, Predicate match) {
    std::vector<std::filesystem::path> found;
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(root, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && match(it->path().filename().string())) {
            found.push_back(it->path());
        }
    }
    std::sort(found.begin(), found.end());
    return found;
}

}  // namespace

std::string normalizeMetricName(std::string_view label) {
    std::string name;
    bool pendingSeparator = false;
    for (unsigned char c : trim(label)) {
        if (c == '%') {
            if (!name.empty()) {
                name.push_back('_');
            }
            name += "percent";
            pendingSeparator = true;
        } else if (std::isalnum(c)) {
            if (pendingSeparator && !name.empty()) {
                name.push_back('_');
            }
            pendingSeparator = false;
            name.push_back(static_cast<char>(std::tolower(c)));
        } else {
            pendingSeparator = true;
        }
    }
    return name;
}

Result<MetricMap> parseFastqcData(std::string_view text) {
    MetricMap metrics;
    bool inBasicStatistics = false;
    bool sawModule = false;

    for (auto line : lines(text)) {
        if (line.starts_with(">>END_MODULE")) {
            inBasicStatistics = false;
            continue;
        }
        if (line.starts_with(">>")) {
            const auto fields = split(line.substr(2), '\t');
            if (fields.size() < 2) {
                return makeError(ErrorCode::kFormatError, "malformed FastQC module header '{}'",
                                 line);
            }
            const std::string module = normalizeMetricName(fields[0]);
            metrics[module] = toLower(trim(fields[1]));
            inBasicStatistics = module == "basic_statistics";
            sawModule = true;
            continue;
        }
        if (!inBasicStatistics || line.empty() || line.starts_with('#')) {
            continue;
        }
        const auto fields = split(line, '\t');
        if (fields.size() >= 2) {
            metrics[normalizeMetricName(fields[0])] = cleanValue(fields[1]);
        }
    }

    if (!sawModule) {
        return makeError(ErrorCode::kFormatError, "no FastQC modules found");
    }
    return metrics;
}

Result<MetricMap> parseNanoStats(std::string_view text) {
    MetricMap metrics;
    const auto all = lines(text);

    auto first = std::find_if(all.begin(), all.end(),
                              [](std::string_view line) { return !trim(line).empty(); });
    if (first == all.end()) {
        return makeError(ErrorCode::kFormatError, "empty NanoStats report");
    }

    if (first->starts_with("Metrics\t")) {
        for (auto it = std::next(first); it != all.end(); ++it) {
            const auto fields = split(*it, '\t');
            if (fields.size() >= 2 && !trim(fields[0]).empty()) {
                metrics[normalizeMetricName(fields[0])] = cleanValue(fields[1]);
            }
        }
    } else {
        for (auto line : all) {
            const auto colon = line.find(':');
            if (colon == std::string_view::npos) {
                continue;
            }
            const std::string_view key = trim(line.substr(0, colon));
            const std::string_view value = trim(line.substr(colon + 1));
            // Skip section titles, ">Q5:" thresholds and numbered top-5 lists.
            if (key.empty() || value.empty() || key.starts_with('>') ||
                std::isdigit(static_cast<unsigned char>(key.front()))) {
                continue;
            }
            if (!parseNumber(value)) {
                continue;
            }
            metrics[normalizeMetricName(key)] = cleanValue(value);
        }
    }

    if (metrics.empty()) {
        return makeError(ErrorCode::kFormatError, "no metrics in NanoStats report");
    }
    return metrics;
}

Result<MetricMap> collectMetrics(AnalyzerKind kind,
                                 std::string_view analyzerName,
                                 const std::filesystem::path& outputDir) {
    MetricMap collected;

    switch (kind) {
        case AnalyzerKind::kShortRead: {
            const auto reports =
                findFiles(outputDir, [](const std::string& name) { return name == kFastqcDataFile; });
            for (const auto& report : reports) {
                std::string stem = report.parent_path().filename().string();
                if (stem.ends_with(kFastqcDirSuffix)) {
                    stem.resize(stem.size() - kFastqcDirSuffix.size());
                }
                auto text = readText(report);
                if (!text) {
                    return std::unexpected(text.error());
                }
                auto metrics = parseFastqcData(*text);
                if (!metrics) {
                    return makeError(metrics.error().code(), "{}: {}", report.string(),
                                     metrics.error().message());
                }
                for (auto& [name, value] : *metrics) {
                    collected[std::format("{}.{}.{}", analyzerName, stem, name)] = value;
                }
            }
            break;
        }
        case AnalyzerKind::kLongRead: {
            const auto reports = findFiles(outputDir, [](const std::string& name) {
                return name.ends_with(kNanoStatsSuffix);
            });
            for (const auto& report : reports) {
                std::string stem = report.filename().string();
                stem.resize(stem.size() - kNanoStatsSuffix.size());
                while (!stem.empty() && (stem.back() == '_' || stem.back() == '-')) {
                    stem.pop_back();
                }
                if (stem.empty()) {
                    stem = "all";
                }
                auto text = readText(report);
                if (!text) {
                    return std::unexpected(text.error());
                }
                auto metrics = parseNanoStats(*text);
                if (!metrics) {
                    return makeError(metrics.error().code(), "{}: {}", report.string(),
                                     metrics.error().message());
                }
                for (auto& [name, value] : *metrics) {
                    collected[std::format("{}.{}.{}", analyzerName, stem, name)] = value;
                }
            }
            break;
        }
    }
    return collected;
}

}  // namespace gqc::qc
