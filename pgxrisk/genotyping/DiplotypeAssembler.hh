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

#include <map>
#include <string>
#include <vector>

#include "core/Common.hh"
#include "core/RuleCatalog.hh"
#include "io/VariantQualityFilter.hh"

namespace pgxrisk
{

class Diplotype
{
public:
    Diplotype(std::string gene, std::string allele1, std::string allele2, int supportingVariantCount, bool ambiguous)
        : gene_(std::move(gene))
        , allele1_(std::move(allele1))
        , allele2_(std::move(allele2))
        , supportingVariantCount_(supportingVariantCount)
        , ambiguous_(ambiguous)
    {
    }

    const std::string& gene() const { return gene_; }
    const std::string& allele1() const { return allele1_; }
    const std::string& allele2() const { return allele2_; }
    // Number of non-reference variant calls the alleles were assembled from
    int supportingVariantCount() const { return supportingVariantCount_; }
    // Set when more than two non-reference allele copies were observed
    bool isAmbiguous() const { return ambiguous_; }

    std::string encode() const { return allele1_ + "/" + allele2_; }

    bool operator==(const Diplotype& other) const
    {
        return gene_ == other.gene_ && allele1_ == other.allele1_ && allele2_ == other.allele2_;
    }

private:
    std::string gene_;
    std::string allele1_;
    std::string allele2_;
    int supportingVariantCount_;
    bool ambiguous_;
};

std::ostream& operator<<(std::ostream& out, const Diplotype& diplotype);

struct DetectedVariant
{
    std::string rsid;
    std::string gene;
    std::string starAllele;
    Zygosity zygosity;
    AlleleFunction function;
    std::string clinicalSignificance;
};

using DiplotypeByGene = std::map<std::string, Diplotype>;

/// \brief Assemble exactly one diplotype for every target gene of the catalog
///
/// Reference calls and reference star alleles contribute no allele. Genes without a contributing variant
/// default to the homozygous reference pair. Alleles are ordered by functional impact, loss of function first.
///
DiplotypeByGene assembleDiplotypes(const std::vector<Variant>& variants, const RuleCatalog& catalog);

// Actionable (non-reference) calls of the gene
std::vector<DetectedVariant>
extractDetectedVariants(const std::vector<Variant>& variants, const std::string& gene, const RuleCatalog& catalog);

std::string describeClinicalSignificance(AlleleFunction function);

}
