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

#include <string>
#include <vector>

#include "core/Common.hh"
#include "core/RuleCatalog.hh"

namespace pgxrisk
{

struct InhibitorExposure
{
    std::string medication;
    InhibitorStrength strength;
};

struct PhenoconversionResult
{
    std::string gene;
    Phenotype geneticPhenotype = Phenotype::kUnknown;
    Phenotype functionalPhenotype = Phenotype::kUnknown;
    InhibitorStrength strongestStrength = InhibitorStrength::kNone;
    std::vector<InhibitorExposure> drivers;
    // Subtracted from the raw confidence score
    double confidencePenalty = 0.0;
    std::string clinicalNote;

    bool isPhenoconverted() const { return functionalPhenotype != geneticPhenotype; }
};

// Downgrade of a metabolizer phenotype under inhibition of the given strength; weak inhibition never shifts
Phenotype applyInhibition(Phenotype geneticPhenotype, InhibitorStrength strength);

/// \brief Functional phenotype of a gene given the medications the patient takes concurrently
///
/// Medications are matched case-insensitively against the inhibitor table of the gene; unrecognized names have
/// no effect. The strongest matching inhibitor selects the downgrade.
///
PhenoconversionResult adjustForConcurrentMedications(
    const std::string& gene, Phenotype geneticPhenotype, const std::vector<std::string>& medications,
    const RuleCatalog& catalog);

}
