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

#include "pipeline/EvidenceResolver.hh"

#include <algorithm>
#include <cctype>

#include "spdlog/spdlog.h"

using boost::optional;
using std::string;

namespace pgxrisk
{

static const size_t kMinimalPmidLength = 6;

std::ostream& operator<<(std::ostream& out, EvidenceSource source)
{
    switch (source)
    {
    case EvidenceSource::kDynamic:
        out << "PharmGKB annotation";
        break;
    case EvidenceSource::kCurated:
        out << "curated CPIC reference";
        break;
    case EvidenceSource::kNone:
        out << "none";
        break;
    }

    return out;
}

bool isSparseAnnotation(const EvidenceAnnotation& annotation)
{
    const auto isDigit = [](unsigned char c) { return std::isdigit(c) != 0; };
    const bool hasWellFormedPmid = annotation.pmid.size() >= kMinimalPmidLength
        && std::all_of(annotation.pmid.begin(), annotation.pmid.end(), isDigit);
    return annotation.authors.empty() || annotation.year <= 0 || !hasWellFormedPmid;
}

ResolvedEvidence resolveEvidence(const string& gene, const string& drug, const RuleCatalog& catalog)
{
    const optional<EvidenceAnnotation> dynamicRow = catalog.findDynamicEvidence(gene, drug);
    const optional<EvidenceAnnotation> curatedRow = catalog.findCuratedReference(gene, drug);

    ResolvedEvidence evidence;
    if (dynamicRow && !isSparseAnnotation(*dynamicRow))
    {
        evidence.annotation = *dynamicRow;
        evidence.source = EvidenceSource::kDynamic;
        evidence.hasCitation = true;
        return evidence;
    }

    if (curatedRow)
    {
        evidence.annotation = *curatedRow;
        evidence.source = EvidenceSource::kCurated;
        evidence.hasCitation = !isSparseAnnotation(*curatedRow);
        if (dynamicRow && dynamicRow->tier != EvidenceTier::kNone)
        {
            evidence.annotation.tier = dynamicRow->tier;
            if (!dynamicRow->clinicalSignificance.empty())
            {
                evidence.annotation.clinicalSignificance = dynamicRow->clinicalSignificance;
            }
            evidence.annotation.phenotypeCategories = dynamicRow->phenotypeCategories;
            evidence.annotation.annotationSentences = dynamicRow->annotationSentences;
        }
        return evidence;
    }

    if (dynamicRow)
    {
        evidence.annotation = *dynamicRow;
        evidence.source = EvidenceSource::kDynamic;
        evidence.hasCitation = false;
        spdlog::warn("Evidence for {} / {} has no curated citation", gene, drug);
        return evidence;
    }

    spdlog::warn("No evidence on file for {} / {}", gene, drug);
    evidence.annotation.gene = gene;
    evidence.annotation.drug = drug;
    evidence.annotation.tier = EvidenceTier::kNone;
    evidence.annotation.fdaRequirement = deriveFdaRequirement(EvidenceTier::kNone);
    evidence.source = EvidenceSource::kNone;
    return evidence;
}

string formatReference(const ResolvedEvidence& evidence)
{
    if (evidence.source == EvidenceSource::kNone)
    {
        return "No evidence on file";
    }
    if (!evidence.hasCitation)
    {
        return "No citation on file";
    }

    const EvidenceAnnotation& annotation = evidence.annotation;
    string reference = annotation.authors + " (" + std::to_string(annotation.year) + ").";
    if (!annotation.guideline.empty())
    {
        reference += " " + annotation.guideline + ".";
    }
    reference += " PMID: " + annotation.pmid;
    if (!annotation.doi.empty())
    {
        reference += ". DOI: " + annotation.doi;
    }

    return reference;
}

}
