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

#include "pipeline/DrugAnalysis.hh"

#include <algorithm>
#include <set>

#include <boost/algorithm/string/join.hpp>

#include "genotyping/PhenotypeCaller.hh"
#include "io/StringUtils.hh"
#include "pipeline/EvidenceResolver.hh"
#include "pipeline/RiskRuleMatcher.hh"
#include "spdlog/spdlog.h"

using boost::optional;
using std::string;
using std::to_string;
using std::vector;

namespace pgxrisk
{

PatientProfile::PatientProfile(string patientId, FilteredVariants filteredVariants, const RuleCatalog& catalog)
    : patientId_(std::move(patientId))
    , filteredVariants_(std::move(filteredVariants))
    , diplotypes_(assembleDiplotypes(filteredVariants_.variants, catalog))
    , vcfQualityScore_(calculateVcfQualityScore(filteredVariants_.variants))
    , annotationCompleteness_(calculateAnnotationCompleteness(filteredVariants_.variants))
{
}

string describeConfidenceLevel(double confidenceScore)
{
    if (confidenceScore >= 0.85)
    {
        return "high";
    }
    if (confidenceScore >= 0.70)
    {
        return "medium";
    }
    return "low";
}

static string describeMedications(const vector<string>& medications)
{
    return medications.empty() ? "no concurrent medications" : boost::algorithm::join(medications, ", ");
}

static string describeComponents(const ConfidenceComponents& components)
{
    return "evidence " + formatFixed(components.evidence, 3) + ", genotype " + formatFixed(components.genotype, 3)
        + ", phenotype " + formatFixed(components.phenotype, 3) + ", rule coverage "
        + formatFixed(components.ruleCoverage, 3);
}

AnalysisResult DrugAnalyzer::analyze(const string& drugName, const string& timestamp) const
{
    AnalysisResult result;
    result.patientId = profile_.patientId();
    result.drug = catalog_.normalizeDrugName(drugName);
    result.timestamp = timestamp;

    const string& rulesVersion = catalog_.version();
    const FilteredVariants& filteredVariants = profile_.filteredVariants();
    DecisionTrace& trace = result.decisionTrace;
    trace.record(
        "VariantQualityFilter", to_string(filteredVariants.dataLineCount) + " VCF data lines",
        to_string(filteredVariants.variants.size()) + " retained, " + to_string(filteredVariants.skipped.total())
            + " skipped",
        "VCF input");

    int supportingVariantCount = 0;
    bool isDiplotypeAmbiguous = false;
    const optional<string> primaryGene = catalog_.primaryGene(result.drug);
    if (primaryGene)
    {
        const Diplotype& diplotype = profile_.diplotypes().at(*primaryGene);
        result.primaryGene = *primaryGene;
        result.diplotype = diplotype.encode();
        supportingVariantCount = diplotype.supportingVariantCount();
        isDiplotypeAmbiguous = diplotype.isAmbiguous();
        trace.record(
            "DiplotypeAssembler", result.primaryGene + ": " + to_string(supportingVariantCount) + " actionable calls",
            result.diplotype + (isDiplotypeAmbiguous ? " (ambiguous)" : ""), "AlleleDefinitions " + rulesVersion);

        const PhenotypeCall call = callPhenotype(diplotype, catalog_);
        result.phenotype = call.phenotype;
        result.activityScore = call.activityScore;
        const string scoreDescription
            = call.activityScore ? " (activity score " + formatFixed(*call.activityScore, 2) + ")" : "";
        trace.record(
            "PhenotypeCaller", result.diplotype, streamToString(call.phenotype) + scoreDescription,
            streamToString(call.source) + " " + rulesVersion);

        result.detectedVariants = extractDetectedVariants(filteredVariants.variants, result.primaryGene, catalog_);
    }
    else
    {
        spdlog::warn("Drug {} is not supported by rules catalog {}", result.drug, rulesVersion);
        result.primaryGene = kUnknownGene;
        result.diplotype = kUnknownGene;
        result.phenotype = Phenotype::kUnknown;
        trace.record("DiplotypeAssembler", result.drug, "unsupported drug", "SupportedDrugs " + rulesVersion);
    }

    const PhenoconversionResult phenoconversion
        = adjustForConcurrentMedications(result.primaryGene, result.phenotype, concurrentMedications_, catalog_);
    result.functionalPhenotype = phenoconversion.functionalPhenotype;
    const GeneModel* geneModel = catalog_.findGeneModel(result.primaryGene);
    if (geneModel != nullptr && geneModel->supportsPhenoconversion())
    {
        result.phenoconversion = phenoconversion;
    }
    trace.record(
        "PhenoconversionAdjuster",
        streamToString(result.phenotype) + " with " + describeMedications(concurrentMedications_),
        streamToString(result.functionalPhenotype) + " (" + streamToString(phenoconversion.strongestStrength)
            + " inhibition)",
        "InhibitorStrengths " + rulesVersion);

    const ResolvedEvidence evidence = resolveEvidence(result.primaryGene, result.drug, catalog_);
    trace.record(
        "EvidenceResolver", result.primaryGene + " / " + result.drug,
        "level " + streamToString(evidence.annotation.tier), streamToString(evidence.source));

    const RiskMatch match = matchRiskRule(result.primaryGene, result.functionalPhenotype, result.drug, catalog_);
    result.riskLabel = match.riskLabel;
    result.severity = match.severity;
    result.isRuleCovered = match.isRuleCovered;
    trace.record(
        "RiskRuleMatcher",
        result.primaryGene + " / " + streamToString(result.functionalPhenotype) + " / " + result.drug,
        streamToString(match.riskLabel) + " (" + streamToString(match.severity) + ")",
        match.isRuleCovered ? "RiskRules " + rulesVersion : "no matching rule");

    ClinicalRecommendation& recommendation = result.recommendation;
    recommendation.guideline = evidence.annotation.guideline.empty()
        ? "No curated CPIC guideline mapping for " + result.drug + " and " + result.primaryGene
        : evidence.annotation.guideline;
    recommendation.action = match.action;
    if (result.phenoconversion && phenoconversion.isPhenoconverted())
    {
        recommendation.action += " " + phenoconversion.clinicalNote;
    }
    recommendation.alternativeDrugs = match.alternatives;
    recommendation.monitoring = describeMonitoring(match);
    recommendation.evidenceLevel = evidence.annotation.tier;
    recommendation.fdaRequirement = evidence.annotation.fdaRequirement;
    recommendation.reference = formatReference(evidence);
    recommendation.phenotypeCategories.assign(
        evidence.annotation.phenotypeCategories.begin(), evidence.annotation.phenotypeCategories.end());
    recommendation.annotationSentences = evidence.annotation.annotationSentences;

    GenotypeSupport support;
    support.vcfQualityScore = profile_.vcfQualityScore();
    support.annotationCompleteness = profile_.annotationCompleteness();
    support.supportingVariantCount = supportingVariantCount;
    result.confidenceComponents = scorer_.scoreComponents(
        evidence.annotation.tier, support, result.phenotype, isDiplotypeAmbiguous, match.isRuleCovered);
    result.rawConfidenceScore = scorer_.computeRawScore(result.confidenceComponents, match.isRuleCovered);
    trace.record(
        "ConfidenceScorer", describeComponents(result.confidenceComponents),
        "raw " + formatFixed(result.rawConfidenceScore, 3), "ConfidenceModel " + rulesVersion);

    const double penalizedScore = std::max(0.0, result.rawConfidenceScore - phenoconversion.confidencePenalty);
    result.confidenceScore = calibrator_.calibrate(penalizedScore);
    if (!match.isRuleCovered)
    {
        result.confidenceScore = std::min(result.confidenceScore, kUncoveredRawScoreCap);
    }
    trace.record(
        "PostHocCalibrator",
        formatFixed(result.rawConfidenceScore, 3) + " - penalty " + formatFixed(phenoconversion.confidencePenalty, 3),
        formatFixed(result.confidenceScore, 2),
        calibrator_.isIdentity() ? "identity" : "CalibrationBins " + rulesVersion);

    QualityMetrics& quality = result.qualityMetrics;
    quality.vcfParsingSuccess = filteredVariants.parsingSuccess;
    quality.vcfQualityScore = profile_.vcfQualityScore();
    quality.variantsAnalyzed = static_cast<int>(filteredVariants.variants.size());
    quality.annotationCompleteness = profile_.annotationCompleteness();
    quality.skippedRecords = filteredVariants.skipped;
    quality.confidenceLevel = describeConfidenceLevel(result.confidenceScore);
    quality.rulesVersion = rulesVersion;

    return result;
}

vector<AnalysisResult> analyzeDrugs(
    const RuleCatalog& catalog, const PatientProfile& profile, const vector<string>& drugNames,
    const vector<string>& concurrentMedications, const string& timestamp)
{
    const DrugAnalyzer analyzer(catalog, profile, concurrentMedications);

    vector<AnalysisResult> results;
    std::set<string> analyzedDrugs;
    for (const string& drugName : drugNames)
    {
        const string drug = catalog.normalizeDrugName(drugName);
        if (drug.empty() || !analyzedDrugs.insert(drug).second)
        {
            continue;
        }
        results.push_back(analyzer.analyze(drug, timestamp));
    }

    spdlog::info(
        "Analysed {} drugs for patient {}", add_commas_at_thousands(static_cast<int>(results.size())),
        profile.patientId());
    return results;
}

}
