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

#include "pipeline/ConfidenceScorer.hh"

#include <algorithm>

namespace pgxrisk
{

static double clampToUnitInterval(double value) { return std::max(0.0, std::min(1.0, value)); }

double ConfidenceScorer::scoreEvidence(EvidenceTier tier) const
{
    const auto valueIt = model_.evidenceByTier.find(tier);
    if (tier == EvidenceTier::kNone || valueIt == model_.evidenceByTier.end())
    {
        return model_.noEvidence;
    }
    return valueIt->second;
}

double ConfidenceScorer::scoreGenotype(const GenotypeSupport& support) const
{
    const GenotypeComponentModel& genotypeModel = model_.genotype;
    const double quality = clampToUnitInterval(support.vcfQualityScore / 100.0);
    const double completeness = clampToUnitInterval(support.annotationCompleteness);
    const double variantSupport = clampToUnitInterval(
        genotypeModel.baselineSupport + genotypeModel.supportPerVariant * support.supportingVariantCount);

    return clampToUnitInterval(
        genotypeModel.qualityWeight * quality + genotypeModel.completenessWeight * completeness
        + genotypeModel.supportWeight * variantSupport);
}

double ConfidenceScorer::scorePhenotype(Phenotype phenotype, bool isDiplotypeAmbiguous) const
{
    if (phenotype == Phenotype::kUnknown)
    {
        return model_.phenotype.unknown;
    }
    return isDiplotypeAmbiguous ? model_.phenotype.ambiguous : model_.phenotype.mapped;
}

double ConfidenceScorer::scoreRuleCoverage(bool isRuleCovered) const
{
    return isRuleCovered ? 1.0 : model_.ruleCoverageFallback;
}

ConfidenceComponents ConfidenceScorer::scoreComponents(
    EvidenceTier tier, const GenotypeSupport& support, Phenotype phenotype, bool isDiplotypeAmbiguous,
    bool isRuleCovered) const
{
    ConfidenceComponents components;
    components.evidence = scoreEvidence(tier);
    components.genotype = scoreGenotype(support);
    components.phenotype = scorePhenotype(phenotype, isDiplotypeAmbiguous);
    components.ruleCoverage = scoreRuleCoverage(isRuleCovered);
    return components;
}

double ConfidenceScorer::computeRawScore(const ConfidenceComponents& components, bool isRuleCovered) const
{
    const ConfidenceWeights& weights = model_.weights;
    double rawScore = weights.evidence * components.evidence + weights.genotype * components.genotype
        + weights.phenotype * components.phenotype + weights.ruleCoverage * components.ruleCoverage;
    rawScore = clampToUnitInterval(rawScore);

    if (!isRuleCovered)
    {
        rawScore = std::min(rawScore, kUncoveredRawScoreCap);
    }

    return rawScore;
}

}
