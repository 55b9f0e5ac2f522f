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

struct RiskMatch
{
    RiskLabel riskLabel = RiskLabel::kUnknown;
    Severity severity = Severity::kNone;
    std::string action;
    std::vector<std::string> alternatives;
    bool isRuleCovered = false;
};

// Exact (gene, phenotype, drug) lookup; a miss yields an explicit Unknown verdict, never a guessed label
RiskMatch
matchRiskRule(const std::string& gene, Phenotype phenotype, const std::string& drug, const RuleCatalog& catalog);

std::string describeMonitoring(const RiskMatch& match);

}
