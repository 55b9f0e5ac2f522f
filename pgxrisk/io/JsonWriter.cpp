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

#include "io/JsonWriter.hh"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using std::string;
using std::vector;

using Json = nlohmann::json;

namespace pgxrisk
{

// Round double to 3 decimal places for byte-stable JSON output
static double round3(double value) { return std::round(value * 1000.0) / 1000.0; }

static double round2(double value) { return std::round(value * 100.0) / 100.0; }

std::ostream& operator<<(std::ostream& out, JsonWriter& jsonWriter)
{
    jsonWriter.write(out);
    return out;
}

JsonWriter::JsonWriter(
    string patientId, string rulesVersion, vector<string> concurrentMedications, const vector<AnalysisResult>& results,
    bool includeDecisionTrace)
    : patientId_(std::move(patientId))
    , rulesVersion_(std::move(rulesVersion))
    , concurrentMedications_(std::move(concurrentMedications))
    , results_(results)
    , includeDecisionTrace_(includeDecisionTrace)
{
}

void JsonWriter::write(std::ostream& out)
{
    Json sampleParametersRecord;
    sampleParametersRecord["PatientId"] = patientId_;
    sampleParametersRecord["RulesVersion"] = rulesVersion_;
    sampleParametersRecord["ConcurrentMedications"] = concurrentMedications_;

    Json resultRecords = Json::array();
    for (const AnalysisResult& result : results_)
    {
        resultRecords.push_back(encodeAnalysisResult(result, includeDecisionTrace_));
    }

    Json sampleRecords;
    sampleRecords["SampleParameters"] = sampleParametersRecord;
    sampleRecords["Results"] = resultRecords;

    out << std::setw(2) << sampleRecords << std::endl;
}

static Json encodeDetectedVariant(const DetectedVariant& variant)
{
    Json record;
    record["Rsid"] = variant.rsid;
    record["Gene"] = variant.gene;
    record["StarAllele"] = variant.starAllele;
    record["Zygosity"] = streamToString(variant.zygosity);
    record["Function"] = streamToString(variant.function);
    record["ClinicalSignificance"] = variant.clinicalSignificance;
    return record;
}

static Json encodePhenoconversion(const PhenoconversionResult& phenoconversion)
{
    Json drivers = Json::array();
    for (const InhibitorExposure& driver : phenoconversion.drivers)
    {
        Json driverRecord;
        driverRecord["Drug"] = driver.medication;
        driverRecord["Strength"] = streamToString(driver.strength);
        drivers.push_back(driverRecord);
    }

    Json record;
    record["Gene"] = phenoconversion.gene;
    record["PhenoconversionRisk"] = phenoconversion.isPhenoconverted();
    record["GeneticPhenotype"] = streamToString(phenoconversion.geneticPhenotype);
    record["FunctionalPhenotype"] = streamToString(phenoconversion.functionalPhenotype);
    record["InhibitorStrength"] = streamToString(phenoconversion.strongestStrength);
    record["CausedBy"] = drivers;
    record["ConfidencePenalty"] = round3(phenoconversion.confidencePenalty);
    record["ClinicalNote"] = phenoconversion.clinicalNote;
    return record;
}

Json encodeAnalysisResult(const AnalysisResult& result, bool includeDecisionTrace)
{
    Json riskRecord;
    riskRecord["RiskLabel"] = streamToString(result.riskLabel);
    riskRecord["ConfidenceScore"] = round2(result.confidenceScore);
    riskRecord["RawConfidenceScore"] = round3(result.rawConfidenceScore);
    riskRecord["Severity"] = streamToString(result.severity);

    Json detectedVariants = Json::array();
    for (const DetectedVariant& variant : result.detectedVariants)
    {
        detectedVariants.push_back(encodeDetectedVariant(variant));
    }

    Json profileRecord;
    profileRecord["PrimaryGene"] = result.primaryGene;
    profileRecord["Diplotype"] = result.diplotype;
    profileRecord["Phenotype"] = streamToString(result.phenotype);
    profileRecord["FunctionalPhenotype"] = streamToString(result.functionalPhenotype);
    profileRecord["ActivityScore"] = result.activityScore ? Json(round3(*result.activityScore)) : Json(nullptr);
    profileRecord["DetectedVariants"] = detectedVariants;

    const ClinicalRecommendation& recommendation = result.recommendation;
    Json recommendationRecord;
    recommendationRecord["Guideline"] = recommendation.guideline;
    recommendationRecord["Action"] = recommendation.action;
    recommendationRecord["AlternativeDrugs"] = recommendation.alternativeDrugs;
    recommendationRecord["Monitoring"] = recommendation.monitoring;
    recommendationRecord["EvidenceLevel"] = streamToString(recommendation.evidenceLevel);
    recommendationRecord["FdaRequirement"] = recommendation.fdaRequirement;
    recommendationRecord["Reference"] = recommendation.reference;
    recommendationRecord["PhenotypeCategories"] = recommendation.phenotypeCategories;
    recommendationRecord["AnnotationSentences"] = recommendation.annotationSentences;

    Json componentsRecord;
    componentsRecord["Evidence"] = round3(result.confidenceComponents.evidence);
    componentsRecord["Genotype"] = round3(result.confidenceComponents.genotype);
    componentsRecord["Phenotype"] = round3(result.confidenceComponents.phenotype);
    componentsRecord["RuleCoverage"] = round3(result.confidenceComponents.ruleCoverage);

    const QualityMetrics& quality = result.qualityMetrics;
    Json skippedRecord;
    skippedRecord["Malformed"] = quality.skippedRecords.malformed;
    skippedRecord["LowQuality"] = quality.skippedRecords.lowQuality;
    skippedRecord["UnclassifiedGenotype"] = quality.skippedRecords.unclassifiedGenotype;
    skippedRecord["OffTarget"] = quality.skippedRecords.offTarget;

    Json qualityRecord;
    qualityRecord["VcfParsingSuccess"] = quality.vcfParsingSuccess;
    qualityRecord["VcfQualityScore"] = round3(quality.vcfQualityScore);
    qualityRecord["VariantsAnalyzed"] = quality.variantsAnalyzed;
    qualityRecord["AnnotationCompleteness"] = round3(quality.annotationCompleteness);
    qualityRecord["SkippedRecords"] = skippedRecord;
    qualityRecord["ConfidenceLevel"] = quality.confidenceLevel;
    qualityRecord["RuleCoverage"] = result.isRuleCovered;
    qualityRecord["RulesVersion"] = quality.rulesVersion;

    Json record;
    record["PatientId"] = result.patientId;
    record["Drug"] = result.drug;
    record["Timestamp"] = result.timestamp;
    record["RiskAssessment"] = riskRecord;
    record["PharmacogenomicProfile"] = profileRecord;
    record["ClinicalRecommendation"] = recommendationRecord;
    record["ConfidenceComponents"] = componentsRecord;
    record["QualityMetrics"] = qualityRecord;

    if (result.phenoconversion)
    {
        record["Phenoconversion"] = encodePhenoconversion(*result.phenoconversion);
    }

    if (includeDecisionTrace)
    {
        Json traceRecords = Json::array();
        for (const TraceStep& step : result.decisionTrace.steps())
        {
            Json stepRecord;
            stepRecord["Stage"] = step.stage;
            stepRecord["Input"] = step.input;
            stepRecord["Output"] = step.output;
            stepRecord["Source"] = step.source;
            traceRecords.push_back(stepRecord);
        }
        record["DecisionTrace"] = traceRecords;
    }

    return record;
}

std::ostream& operator<<(std::ostream& out, CohortJsonWriter& cohortWriter)
{
    cohortWriter.write(out);
    return out;
}

void CohortJsonWriter::write(std::ostream& out)
{
    Json matrixRecord = Json::object();
    for (const auto& drugAndCounts : summary_.riskMatrix())
    {
        Json countsRecord;
        for (const auto& labelAndCount : drugAndCounts.second)
        {
            countsRecord[streamToString(labelAndCount.first)] = labelAndCount.second;
        }
        matrixRecord[drugAndCounts.first] = countsRecord;
    }

    Json cohortRecord;
    cohortRecord["CohortSize"] = summary_.cohortSize();
    cohortRecord["RiskMatrix"] = matrixRecord;
    cohortRecord["HighRiskPatients"] = summary_.highRiskPatients();
    cohortRecord["HighRiskCount"] = summary_.highRiskCount();
    cohortRecord["Alert"] = summary_.alert();

    out << std::setw(2) << cohortRecord << std::endl;
}

static CohortEntry decodeCohortEntry(const Json& resultRecord)
{
    for (const string& field : { "PatientId", "Drug", "RiskAssessment" })
    {
        if (resultRecord.find(field) == resultRecord.end())
        {
            std::stringstream out;
            out << resultRecord;
            throw std::logic_error("Field " + field + " must be present in " + out.str());
        }
    }

    const Json& riskRecord = resultRecord["RiskAssessment"];
    if (riskRecord.find("RiskLabel") == riskRecord.end() || riskRecord.find("Severity") == riskRecord.end())
    {
        throw std::logic_error("RiskAssessment must have RiskLabel and Severity: " + riskRecord.dump());
    }

    CohortEntry entry;
    entry.patientId = resultRecord["PatientId"].get<string>();
    entry.drug = resultRecord["Drug"].get<string>();
    entry.riskLabel = decodeRiskLabel(riskRecord["RiskLabel"].get<string>());
    entry.severity = decodeSeverity(riskRecord["Severity"].get<string>());
    return entry;
}

vector<CohortEntry> decodeCohortEntries(const Json& resultsJson)
{
    vector<CohortEntry> entries;
    if (resultsJson.is_object() && resultsJson.find("Results") != resultsJson.end())
    {
        return decodeCohortEntries(resultsJson["Results"]);
    }

    if (resultsJson.is_array())
    {
        for (const Json& resultRecord : resultsJson)
        {
            entries.push_back(decodeCohortEntry(resultRecord));
        }
        return entries;
    }

    entries.push_back(decodeCohortEntry(resultsJson));
    return entries;
}

}
