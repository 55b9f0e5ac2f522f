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

#include <boost/optional.hpp>

#include "core/Common.hh"
#include "core/RuleCatalog.hh"
#include "genotyping/DiplotypeAssembler.hh"

namespace pgxrisk
{

enum class PhenotypeSource
{
    kDiplotypeTable,
    kActivityScore,
    kUnmapped
};

std::ostream& operator<<(std::ostream& out, PhenotypeSource source);

struct PhenotypeCall
{
    Phenotype phenotype = Phenotype::kUnknown;
    // Sum of allele activity scores when every allele has one
    boost::optional<double> activityScore;
    PhenotypeSource source = PhenotypeSource::kUnmapped;
};

// Explicit diplotype calls take precedence over the activity score sum; never guesses an unmapped diplotype
PhenotypeCall callPhenotype(const Diplotype& diplotype, const RuleCatalog& catalog);

}
