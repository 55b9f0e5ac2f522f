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

#include "pipeline/Phenoconversion.hh"

#include <array>
#include <set>

#include <boost/algorithm/string.hpp>

#include "spdlog/spdlog.h"

using std::string;
using std::vector;

namespace pgxrisk
{

namespace
{
const size_t kStrengthCount = 4;
const size_t kPhenotypeCount = 6;

// Rows follow InhibitorStrength (none, weak, moderate, strong);
// columns follow Phenotype (PM, IM, NM, RM, URM, Unknown)
const std::array<std::array<Phenotype, kPhenotypeCount>, kStrengthCount> kDowngradeTable = { {
    { { Phenotype::kPM, Phenotype::kIM, Phenotype::kNM, Phenotype::kRM, Phenotype::kURM, Phenotype::kUnknown } },
    { { Phenotype::kPM, Phenotype::kIM, Phenotype::kNM, Phenotype::kRM, Phenotype::kURM, Phenotype::kUnknown } },
    { { Phenotype::kPM, Phenotype::kIM, Phenotype::kNM, Phenotype::kNM, Phenotype::kRM, Phenotype::kUnknown } },
    { { Phenotype::kPM, Phenotype::kPM, Phenotype::kIM, Phenotype::kIM, Phenotype::kNM, Phenotype::kUnknown } },
} };
}

Phenotype applyInhibition(Phenotype geneticPhenotype, InhibitorStrength strength)
{
    return kDowngradeTable[static_cast<size_t>(strength)][static_cast<size_t>(geneticPhenotype)];
}

static string joinMedications(const vector<InhibitorExposure>& drivers)
{
    vector<string> names;
    for (const auto& driver : drivers)
    {
        names.push_back(driver.medication);
    }
    return boost::algorithm::join(names, ", ");
}

static string describePhenoconversion(const PhenoconversionResult& result)
{
    if (result.drivers.empty())
    {
        return "No known inhibitor-based phenoconversion signal detected.";
    }

    const string genetic = streamToString(result.geneticPhenotype);
    if (result.isPhenoconverted())
    {
        const string functional = streamToString(result.functionalPhenotype);
        return "Genetic phenotype " + genetic + " may functionally shift to " + functional
            + " due to inhibitor exposure (" + joinMedications(result.drivers) + "). Source: inhibitor rule table.";
    }

    return "Inhibitor exposure (" + joinMedications(result.drivers) + ", strongest "
        + streamToString(result.strongestStrength) + ") is not expected to shift genetic phenotype " + genetic
        + ". Source: inhibitor rule table.";
}

PhenoconversionResult adjustForConcurrentMedications(
    const string& gene, Phenotype geneticPhenotype, const vector<string>& medications, const RuleCatalog& catalog)
{
    PhenoconversionResult result;
    result.gene = gene;
    result.geneticPhenotype = geneticPhenotype;

    const GeneModel* geneModel = catalog.findGeneModel(gene);
    if (geneModel != nullptr)
    {
        std::set<string> seenMedications;
        for (const string& medication : medications)
        {
            const string name = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(medication));
            if (name.empty() || !seenMedications.insert(name).second)
            {
                continue;
            }

            const InhibitorStrength strength = geneModel->inhibitorStrength(name);
            if (strength == InhibitorStrength::kNone)
            {
                continue;
            }

            result.drivers.push_back({ name, strength });
            if (strengthRank(strength) > strengthRank(result.strongestStrength))
            {
                result.strongestStrength = strength;
            }
        }
    }

    result.functionalPhenotype = applyInhibition(geneticPhenotype, result.strongestStrength);
    result.confidencePenalty = catalog.phenoconversionPenalty(result.strongestStrength);
    result.clinicalNote = describePhenoconversion(result);

    if (result.isPhenoconverted())
    {
        spdlog::info(
            "{} phenotype {} converts to {} ({} inhibition)", gene, streamToString(geneticPhenotype),
            streamToString(result.functionalPhenotype), streamToString(result.strongestStrength));
    }

    return result;
}

}
