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

#include "genotyping/PhenotypeCaller.hh"

#include "spdlog/spdlog.h"

using boost::optional;

namespace pgxrisk
{

std::ostream& operator<<(std::ostream& out, PhenotypeSource source)
{
    switch (source)
    {
    case PhenotypeSource::kDiplotypeTable:
        out << "diplotype table";
        break;
    case PhenotypeSource::kActivityScore:
        out << "activity score";
        break;
    case PhenotypeSource::kUnmapped:
        out << "unmapped";
        break;
    }

    return out;
}

static Phenotype classifyActivityScore(double activityScore, const GeneModel& geneModel)
{
    for (const PhenotypeBreakpoint& breakpoint : geneModel.breakpoints())
    {
        if (!breakpoint.maxScore || activityScore <= *breakpoint.maxScore)
        {
            return breakpoint.phenotype;
        }
    }

    return Phenotype::kUnknown;
}

PhenotypeCall callPhenotype(const Diplotype& diplotype, const RuleCatalog& catalog)
{
    PhenotypeCall call;
    const GeneModel* geneModel = catalog.findGeneModel(diplotype.gene());
    if (geneModel == nullptr)
    {
        spdlog::warn("No phenotype model for {}", diplotype.gene());
        return call;
    }

    const optional<double> score1 = geneModel->activityScore(diplotype.allele1());
    const optional<double> score2 = geneModel->activityScore(diplotype.allele2());
    if (score1 && score2)
    {
        call.activityScore = *score1 + *score2;
    }

    const optional<Phenotype> explicitPhenotype
        = geneModel->explicitPhenotype(diplotype.allele1(), diplotype.allele2());
    if (explicitPhenotype)
    {
        call.phenotype = *explicitPhenotype;
        call.source = PhenotypeSource::kDiplotypeTable;
        return call;
    }

    if (call.activityScore)
    {
        call.phenotype = classifyActivityScore(*call.activityScore, *geneModel);
        call.source
            = call.phenotype == Phenotype::kUnknown ? PhenotypeSource::kUnmapped : PhenotypeSource::kActivityScore;
    }

    if (call.phenotype == Phenotype::kUnknown)
    {
        spdlog::warn(
            "{} diplotype {} is not in the activity score table; phenotype is Unknown", diplotype.gene(),
            diplotype.encode());
    }

    return call;
}

}
