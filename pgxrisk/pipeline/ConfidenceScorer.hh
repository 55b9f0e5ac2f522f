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

#pragma once

#include "core/Common.hh"
#include "core/RuleCatalog.hh"

namespace pgxrisk
{

// Ceiling of the raw score when no risk rule covers the call
const double kUncoveredRawScoreCap = 0.69;

struct ConfidenceComponents
{
    double evidence = 0.0;
    double genotype = 0.0;
    double phenotype = 0.0;
    double ruleCoverage = 0.0;
};

struct GenotypeSupport
{
    // 0-100 score of the input VCF
    double vcfQualityScore = 0.0;
    double annotationCompleteness = 0.0;
    int supportingVariantCount = 0;
};

class ConfidenceScorer
{
public:
    explicit ConfidenceScorer(const ConfidenceModel& model)
        : model_(model)
    {
    }

    double scoreEvidence(EvidenceTier tier) const;
    double scoreGenotype(const GenotypeSupport& support) const;
    double scorePhenotype(Phenotype phenotype, bool isDiplotypeAmbiguous) const;
    double scoreRuleCoverage(bool isRuleCovered) const;

    ConfidenceComponents scoreComponents(
        EvidenceTier tier, const GenotypeSupport& support, Phenotype phenotype, bool isDiplotypeAmbiguous,
        bool isRuleCovered) const;

    // Weighted sum of the components within [0, 1], capped when the call is not rule-covered
    double computeRawScore(const ConfidenceComponents& components, bool isRuleCovered) const;

private:
    const ConfidenceModel& model_;
};

}
