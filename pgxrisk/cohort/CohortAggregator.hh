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
#include <set>
#include <string>
#include <vector>

#include "core/Common.hh"

namespace pgxrisk
{

// The fields of a per-drug result the cohort summary depends on
struct CohortEntry
{
    std::string patientId;
    std::string drug;
    RiskLabel riskLabel;
    Severity severity;
};

// Toxic or Ineffective label, or high or critical severity
bool isHighRisk(const CohortEntry& entry);

using RiskCounts = std::map<RiskLabel, int>;

class CohortSummary
{
public:
    void add(const CohortEntry& entry);
    // Partition-and-merge: summaries of disjoint batches combine into the summary of their union
    void merge(const CohortSummary& other);

    int cohortSize() const { return cohortSize_; }
    // Drug -> risk label -> count; every label of a listed drug is present
    const std::map<std::string, RiskCounts>& riskMatrix() const { return riskMatrix_; }
    const std::set<std::string>& highRiskPatients() const { return highRiskPatients_; }
    int highRiskCount() const { return static_cast<int>(highRiskPatients_.size()); }
    std::string alert() const;

private:
    RiskCounts& countsForDrug(const std::string& drug);

    int cohortSize_ = 0;
    std::map<std::string, RiskCounts> riskMatrix_;
    std::set<std::string> highRiskPatients_;
};

CohortSummary aggregateCohort(const std::vector<CohortEntry>& entries);

}
