// =============================================================================
// genoqc - Resolve Command Implementation
// =============================================================================

#include "resolve_command.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <sstream>

#include "gqc/common/logger.h"

namespace gqc::commands {

ResolveCommand::ResolveCommand(CommandContext& context, ResolveOptions options)
    : context_(context), options_(std::move(options)) {}

int ResolveCommand::execute() {
    auto datasets = resolveSelection(context_, options_.selection);
    if (!datasets) {
        return reportError(datasets.error());
    }
    std::cout << (options_.jsonOutput ? formatDatasetJson(*datasets) + "\n"
                                      : formatDatasetTable(*datasets));
    return toExitCode(ErrorCode::kSuccess);
}

std::string formatDatasetTable(const std::vector<DatasetRef>& datasets) {
    std::ostringstream out;
    out << "accession\tregistry\ttechnology\trole\turl\tsize\tchecksum\n";
    for (const auto& dataset : datasets) {
        for (const auto& object : dataset.objects) {
            out << dataset.accession << '\t' << registryToString(dataset.registry) << '\t'
                << readTechnologyToString(dataset.technology) << '\t'
                << objectRoleToString(object.role) << '\t' << object.url << '\t'
                << (object.expectedSize ? std::to_string(*object.expectedSize) : "-") << '\t'
                << (object.expectedChecksum ? object.expectedChecksum->toString() : "-") << '\n';
        }
    }
    return out.str();
}

std::string formatDatasetJson(const std::vector<DatasetRef>& datasets) {
    nlohmann::json root = nlohmann::json::array();
    for (const auto& dataset : datasets) {
        nlohmann::json entry;
        entry["accession"] = dataset.accession;
        entry["registry"] = std::string(registryToString(dataset.registry));
        entry["technology"] = std::string(readTechnologyToString(dataset.technology));
        entry["metadata"] = {
            {"sampleAccession", dataset.metadata.sampleAccession},
            {"studyAccession", dataset.metadata.studyAccession},
            {"scientificName", dataset.metadata.scientificName},
            {"instrumentPlatform", dataset.metadata.instrumentPlatform},
            {"instrumentModel", dataset.metadata.instrumentModel},
            {"libraryLayout", dataset.metadata.libraryLayout},
            {"libraryStrategy", dataset.metadata.libraryStrategy},
            {"readCount", dataset.metadata.readCount ? nlohmann::json(*dataset.metadata.readCount)
                                                     : nlohmann::json()},
            {"baseCount", dataset.metadata.baseCount ? nlohmann::json(*dataset.metadata.baseCount)
                                                     : nlohmann::json()},
        };
        nlohmann::json objects = nlohmann::json::array();
        for (const auto& object : dataset.objects) {
            objects.push_back({
                {"url", object.url},
                {"fileName", object.fileName},
                {"role", std::string(objectRoleToString(object.role))},
                {"expectedSize",
                 object.expectedSize ? nlohmann::json(*object.expectedSize) : nlohmann::json()},
                {"expectedChecksum", object.expectedChecksum
                                         ? nlohmann::json(object.expectedChecksum->toString())
                                         : nlohmann::json()},
            });
        }
        entry["objects"] = std::move(objects);
        root.push_back(std::move(entry));
    }
    return root.dump(2);
}

}  // namespace gqc::commands
