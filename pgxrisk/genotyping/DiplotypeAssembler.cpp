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

#include "genotyping/DiplotypeAssembler.hh"

#include <algorithm>
#include <utility>

#include "spdlog/spdlog.h"

using std::string;
using std::vector;

namespace pgxrisk
{

std::ostream& operator<<(std::ostream& out, const Diplotype& diplotype)
{
    out << diplotype.gene() << " " << diplotype.encode();
    return out;
}

namespace
{
struct AlleleCopy
{
    string starAllele;
    AlleleFunction function;
};

bool isActionableCall(const Variant& variant, const RuleCatalog& catalog)
{
    return variant.genotypeClass != GenotypeClass::kHomRef && !variant.starAllele.empty()
        && variant.starAllele != catalog.referenceAllele();
}
}

static Diplotype assembleGeneDiplotype(const string& gene, const vector<Variant>& variants, const RuleCatalog& catalog)
{
    const string& referenceAllele = catalog.referenceAllele();

    vector<AlleleCopy> alleleCopies;
    int supportingVariantCount = 0;
    for (const Variant& variant : variants)
    {
        if (variant.gene != gene || !isActionableCall(variant, catalog))
        {
            continue;
        }

        ++supportingVariantCount;
        alleleCopies.push_back({ variant.starAllele, variant.function });
        if (variant.genotypeClass == GenotypeClass::kHomAlt)
        {
            alleleCopies.push_back({ variant.starAllele, variant.function });
        }
    }

    if (alleleCopies.empty())
    {
        return Diplotype(gene, referenceAllele, referenceAllele, 0, false);
    }

    const bool isAmbiguous = alleleCopies.size() > 2;
    if (alleleCopies.size() == 1)
    {
        alleleCopies.push_back({ referenceAllele, AlleleFunction::kNormal });
    }

    std::stable_sort(alleleCopies.begin(), alleleCopies.end(), [](const AlleleCopy& a, const AlleleCopy& b) {
        return alleleImpactRank(a.function) > alleleImpactRank(b.function);
    });

    if (isAmbiguous)
    {
        spdlog::warn(
            "{} has {} non-reference allele copies; keeping {}/{}", gene, alleleCopies.size(),
            alleleCopies[0].starAllele, alleleCopies[1].starAllele);
    }

    return Diplotype(gene, alleleCopies[0].starAllele, alleleCopies[1].starAllele, supportingVariantCount, isAmbiguous);
}

DiplotypeByGene assembleDiplotypes(const vector<Variant>& variants, const RuleCatalog& catalog)
{
    DiplotypeByGene diplotypes;
    for (const string& gene : catalog.targetGenes())
    {
        diplotypes.emplace(gene, assembleGeneDiplotype(gene, variants, catalog));
    }

    return diplotypes;
}

vector<DetectedVariant>
extractDetectedVariants(const vector<Variant>& variants, const string& gene, const RuleCatalog& catalog)
{
    vector<DetectedVariant> detectedVariants;
    for (const Variant& variant : variants)
    {
        if (variant.gene != gene || !isActionableCall(variant, catalog))
        {
            continue;
        }

        DetectedVariant detectedVariant;
        detectedVariant.rsid = variant.rsid;
        detectedVariant.gene = variant.gene;
        detectedVariant.starAllele = variant.starAllele;
        detectedVariant.zygosity
            = variant.genotypeClass == GenotypeClass::kHomAlt ? Zygosity::kHomozygous : Zygosity::kHeterozygous;
        detectedVariant.function = variant.function;
        detectedVariant.clinicalSignificance = describeClinicalSignificance(variant.function);
        detectedVariants.push_back(std::move(detectedVariant));
    }

    return detectedVariants;
}

string describeClinicalSignificance(AlleleFunction function)
{
    switch (function)
    {
    case AlleleFunction::kNoFunction:
        return "Loss-of-function variant";
    case AlleleFunction::kDecreased:
        return "Reduced function variant";
    case AlleleFunction::kIncreased:
        return "Gain-of-function variant";
    case AlleleFunction::kNormal:
        return "Normal function variant";
    case AlleleFunction::kUncertain:
        return "Variant of uncertain significance";
    }

    return "Variant of uncertain significance";
}

}
