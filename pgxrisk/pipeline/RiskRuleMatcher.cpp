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

#include "pipeline/RiskRuleMatcher.hh"

#include "spdlog/spdlog.h"

using boost::optional;
using std::string;

namespace pgxrisk
{

RiskMatch matchRiskRule(const string& gene, Phenotype phenotype, const string& drug, const RuleCatalog& catalog)
{
    RiskMatch match;
    const optional<RiskRule> rule = catalog.findRiskRule(gene, phenotype, drug);
    if (rule)
    {
        match.riskLabel = rule->riskLabel;
        match.severity = rule->severity;
        match.action = rule->action;
        match.alternatives = rule->alternatives;
        match.isRuleCovered = true;
        return match;
    }

    spdlog::warn("No risk rule for {} / {} / {}", gene, streamToString(phenotype), drug);
    match.action = "Insufficient rule coverage for " + gene + " + " + drug + " + " + encodeFullPhenotype(phenotype)
        + ". Classify as Unknown and consult CPIC/PharmGKB guidelines or a pharmacogenomics specialist.";
    return match;
}

string describeMonitoring(const RiskMatch& match)
{
    if (!match.isRuleCovered)
    {
        return "Insufficient curated evidence for this combination. "
               "Use standard monitoring and seek specialist pharmacogenomic review.";
    }

    switch (match.severity)
    {
    case Severity::kCritical:
        return "Do NOT initiate therapy. Consult clinical pharmacist or pharmacogenomics specialist.";
    case Severity::kHigh:
        return "Intensive monitoring required. Check labs frequently. Watch for adverse events.";
    case Severity::kModerate:
        return "Monitor patient response. Adjust dose as needed based on clinical outcome.";
    default:
        return "Standard monitoring per drug label.";
    }
}

}
