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

#include "cohort/CohortAggregator.hh"

namespace pgxrisk
{

bool isHighRisk(const CohortEntry& entry)
{
    return entry.riskLabel == RiskLabel::kToxic || entry.riskLabel == RiskLabel::kIneffective
        || entry.severity == Severity::kHigh || entry.severity == Severity::kCritical;
}

RiskCounts& CohortSummary::countsForDrug(const std::string& drug)
{
    auto drugIt = riskMatrix_.find(drug);
    if (drugIt == riskMatrix_.end())
    {
        RiskCounts counts;
        for (RiskLabel label : { RiskLabel::kSafe, RiskLabel::kAdjustDosage, RiskLabel::kToxic,
                                 RiskLabel::kIneffective, RiskLabel::kUnknown })
        {
            counts[label] = 0;
        }
        drugIt = riskMatrix_.emplace(drug, counts).first;
    }
    return drugIt->second;
}

void CohortSummary::add(const CohortEntry& entry)
{
    ++cohortSize_;
    ++countsForDrug(entry.drug)[entry.riskLabel];
    if (isHighRisk(entry))
    {
        highRiskPatients_.insert(entry.patientId);
    }
}

void CohortSummary::merge(const CohortSummary& other)
{
    cohortSize_ += other.cohortSize_;
    for (const auto& drugAndCounts : other.riskMatrix_)
    {
        RiskCounts& counts = countsForDrug(drugAndCounts.first);
        for (const auto& labelAndCount : drugAndCounts.second)
        {
            counts[labelAndCount.first] += labelAndCount.second;
        }
    }
    highRiskPatients_.insert(other.highRiskPatients_.begin(), other.highRiskPatients_.end());
}

std::string CohortSummary::alert() const
{
    const int count = highRiskCount();
    if (count == 0)
    {
        return "No patients require immediate clinical review";
    }
    return std::to_string(count) + (count == 1 ? " patient requires" : " patients require")
        + " immediate clinical review";
}

CohortSummary aggregateCohort(const std::vector<CohortEntry>& entries)
{
    CohortSummary summary;
    for (const auto& entry : entries)
    {
        summary.add(entry);
    }
    return summary;
}

}
