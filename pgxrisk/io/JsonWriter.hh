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

#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cohort/CohortAggregator.hh"
#include "pipeline/DrugAnalysis.hh"

namespace pgxrisk
{

class JsonWriter
{
public:
    JsonWriter(
        std::string patientId, std::string rulesVersion, std::vector<std::string> concurrentMedications,
        const std::vector<AnalysisResult>& results, bool includeDecisionTrace);

    void write(std::ostream& out);

private:
    std::string patientId_;
    std::string rulesVersion_;
    std::vector<std::string> concurrentMedications_;
    const std::vector<AnalysisResult>& results_;
    bool includeDecisionTrace_;
};

std::ostream& operator<<(std::ostream& out, JsonWriter& jsonWriter);

nlohmann::json encodeAnalysisResult(const AnalysisResult& result, bool includeDecisionTrace);

class CohortJsonWriter
{
public:
    explicit CohortJsonWriter(const CohortSummary& summary)
        : summary_(summary)
    {
    }

    void write(std::ostream& out);

private:
    const CohortSummary& summary_;
};

std::ostream& operator<<(std::ostream& out, CohortJsonWriter& cohortWriter);

// Accepts a PgxRisk output document, a single result record or an array of result records
std::vector<CohortEntry> decodeCohortEntries(const nlohmann::json& resultsJson);

}
