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

#include "core/RuleCatalog.hh"

namespace pgxrisk
{

enum class EvidenceSource
{
    kDynamic,
    kCurated,
    kNone
};

std::ostream& operator<<(std::ostream& out, EvidenceSource source);

struct ResolvedEvidence
{
    EvidenceAnnotation annotation;
    EvidenceSource source = EvidenceSource::kNone;
    bool hasCitation = false;
};

// A row is sparse when it lacks authors, a publication year or a well-formed PMID
bool isSparseAnnotation(const EvidenceAnnotation& annotation);

/// \brief Evidence level and citation of a gene-drug pair
///
/// Complete dynamic rows are used as they are. Sparse dynamic rows take their citation from the curated
/// reference of the same pair while keeping the dynamic evidence level. Citations are never made up: a pair
/// that is on file nowhere resolves to EvidenceTier::kNone.
///
ResolvedEvidence resolveEvidence(const std::string& gene, const std::string& drug, const RuleCatalog& catalog);

// Human-readable citation or a "no citation" sentinel
std::string formatReference(const ResolvedEvidence& evidence);

}
