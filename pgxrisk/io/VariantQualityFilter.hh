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

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "core/Common.hh"
#include "core/RuleCatalog.hh"

namespace pgxrisk
{

struct Variant
{
    std::string chrom;
    int64_t position = 0;
    std::string rsid;
    std::string ref;
    std::string alt;
    double qual = 0.0;
    std::string filter;
    // Allele indexes with phasing separators normalized to '/'
    std::string genotype;
    GenotypeClass genotypeClass = GenotypeClass::kHomRef;
    std::string gene;
    std::string starAllele;
    AlleleFunction function = AlleleFunction::kUncertain;
};

struct SkippedRecordCounts
{
    int malformed = 0;
    int lowQuality = 0;
    int unclassifiedGenotype = 0;
    int offTarget = 0;

    int total() const { return malformed + lowQuality + unclassifiedGenotype + offTarget; }
};

struct FilteredVariants
{
    std::vector<Variant> variants;
    SkippedRecordCounts skipped;
    int dataLineCount = 0;
    // False when the input has no #CHROM header or none of its data lines could be parsed
    bool parsingSuccess = false;
};

// Returns none for missing, haploid or partially called genotypes
boost::optional<GenotypeClass> classifyGenotype(const std::string& genotype);

FilteredVariants filterVariants(std::istream& vcfStream, const RuleCatalog& catalog, double minQual);
FilteredVariants filterVariantsFromFile(const std::string& vcfPath, const RuleCatalog& catalog, double minQual);

// 0-100 score combining the mean QUAL (capped at 100) and the fraction of annotated variants
double calculateVcfQualityScore(const std::vector<Variant>& variants);
// Fraction of variants that carry both gene and star allele; 1 for an empty list
double calculateAnnotationCompleteness(const std::vector<Variant>& variants);

}
