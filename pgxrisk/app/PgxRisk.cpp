//
// PGx Risk
// Copyright 2026 PGx Risk contributors
// All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
//

#include <ctime>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "spdlog/spdlog.h"

#include "app/OutputHelpers.hh"
#include "app/Version.hh"
#include "core/Parameters.hh"
#include "core/RuleCatalog.hh"
#include "io/CatalogLoading.hh"
#include "io/JsonWriter.hh"
#include "io/ParameterLoading.hh"
#include "io/PharmgkbLoading.hh"
#include "io/VariantQualityFilter.hh"
#include "pipeline/DrugAnalysis.hh"

using namespace pgxrisk;

static std::string getCurrentUtcTimestamp()
{
    const std::time_t now = std::time(nullptr);
    std::tm utcTime;
    gmtime_r(&now, &utcTime);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utcTime);
    return buffer;
}

int main(int argc, char** argv)
{
    spdlog::set_pattern("%Y-%m-%dT%H:%M:%S,[%v]");

    try
    {
        spdlog::info("Starting {}", kProgramVersion);

        auto optionalProgramParameters = tryLoadingProgramParameters(argc, argv);
        if (!optionalProgramParameters)
        {
            return 0;
        }
        const ProgramParameters& params = *optionalProgramParameters;

        setLogLevel(params.logLevel());

        const InputPaths& inputPaths = params.inputPaths();
        spdlog::info("Loading rules catalog from {}", inputPaths.catalog());
        RuleCatalog catalog = loadRuleCatalog(inputPaths.catalog());

        if (!inputPaths.pharmgkbAnnotations().empty())
        {
            spdlog::info("Loading PharmGKB annotations from {}", inputPaths.pharmgkbAnnotations());
            loadPharmgkbAnnotations(inputPaths.pharmgkbAnnotations(), catalog);
        }
        if (!inputPaths.pharmgkbVariantAnnotations().empty())
        {
            loadPharmgkbVariantAnnotations(inputPaths.pharmgkbVariantAnnotations(), catalog);
        }

        spdlog::info("Analyzing patient {} from {}", params.patientId(), inputPaths.vcf());
        FilteredVariants filteredVariants
            = filterVariantsFromFile(inputPaths.vcf(), catalog, params.analysis().minQual());
        if (!filteredVariants.parsingSuccess)
        {
            spdlog::warn("VCF {} could not be parsed; all calls fall back to reference diplotypes", inputPaths.vcf());
        }

        const PatientProfile profile(params.patientId(), std::move(filteredVariants), catalog);
        const std::string timestamp = params.timestamp() ? *params.timestamp() : getCurrentUtcTimestamp();
        const std::vector<AnalysisResult> results
            = analyzeDrugs(catalog, profile, params.drugs(), params.concurrentMedications(), timestamp);

        spdlog::info("Writing output to disk");
        JsonWriter jsonWriter(
            params.patientId(), catalog.version(), params.concurrentMedications(), results,
            params.analysis().includeDecisionTrace());
        writeToFile(params.outputPaths().json(), jsonWriter);
    }
    catch (const std::exception& e)
    {
        spdlog::error(e.what());
        return 1;
    }

    return 0;
}
