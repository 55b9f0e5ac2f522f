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

#include <istream>
#include <string>

#include "core/RuleCatalog.hh"

namespace pgxrisk
{

// Adds rows of a PharmGKB clinical_annotations.tsv table to the dynamic evidence source of the catalog;
// returns the number of (gene, drug) rows read
int loadPharmgkbAnnotations(std::istream& tsvStream, RuleCatalog& catalog);
int loadPharmgkbAnnotations(const std::string& tsvPath, RuleCatalog& catalog);

// Attaches the sentences of a PharmGKB var_drug_ann.tsv table to gene-drug pairs already loaded from the
// clinical annotations; returns the number of sentences attached
int loadPharmgkbVariantAnnotations(std::istream& tsvStream, RuleCatalog& catalog);
int loadPharmgkbVariantAnnotations(const std::string& tsvPath, RuleCatalog& catalog);

}
