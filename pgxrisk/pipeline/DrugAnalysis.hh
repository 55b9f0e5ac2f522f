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

#include <boost/optional.hpp>

#include "core/Common.hh"
#include "core/RuleCatalog.hh"
#include "genotyping/DiplotypeAssembler.hh"
#include "io/VariantQualityFilter.hh"
#include "pipeline/Calibration.hh"
#include "pipeline/ConfidenceScorer.hh"
#include "pipeline/DecisionTrace.hh"
#include "pipeline/Phenoconversion.hh"

namespace pgxrisk
{

// Placeholder gene, diplotype and phenotype label of drugs the catalog does not support
const std::string kUnknownGene = "Unknown";

/// \brief Patient-level inputs shared by the analyses of all requested drugs
///
class PatientProfile
{
public:
    PatientProfile(std::string patientId, FilteredVariants filteredVariants, const RuleCatalog& catalog);

    const std::string& patientId() const { return patientId_; }
    const FilteredVariants& filteredVariants() const { return filteredVariants_; }
    const DiplotypeByGene& diplotypes() const { return diplotypes_; }
    double vcfQualityScore() const { return vcfQualityScore_; }
    double annotationCompleteness() const { return annotationCompleteness_; }

private:
    std::string patientId_;
    FilteredVariants filteredVariants_;
    DiplotypeByGene diplotypes_;
    double vcfQualityScore_;
    double annotationCompleteness_;
};

struct QualityMetrics
{
    bool vcfParsingSuccess = false;
    double vcfQualityScore = 0.0;
    int variantsAnalyzed = 0;
    double annotationCompleteness = 0.0;
    SkippedRecordCounts skippedRecords;
    std::string confidenceLevel;
    std::string rulesVersion;
};

struct ClinicalRecommendation
{
    std::string guideline;
    std::string action;
    std::vector<std::string> alternativeDrugs;
    std::string monitoring;
    EvidenceTier evidenceLevel = EvidenceTier::kNone;
    std::string fdaRequirement;
    std::string reference;
    std::vector<std::string> phenotypeCategories;
    std::vector<std::string> annotationSentences;
};

struct AnalysisResult
{
    std::string patientId;
    std::string drug;
    std::string timestamp;

    RiskLabel riskLabel = RiskLabel::kUnknown;
    Severity severity = Severity::kNone;
    double confidenceScore = 0.0;
    double rawConfidenceScore = 0.0;

    std::string primaryGene;
    std::string diplotype;
    Phenotype phenotype = Phenotype::kUnknown;
    Phenotype functionalPhenotype = Phenotype::kUnknown;
    boost::optional<double> activityScore;
    std::vector<DetectedVariant> detectedVariants;

    ClinicalRecommendation recommendation;
    ConfidenceComponents confidenceComponents;
    bool isRuleCovered = false;
    QualityMetrics qualityMetrics;

    // Present for genes with an inhibitor table
    boost::optional<PhenoconversionResult> phenoconversion;
    DecisionTrace decisionTrace;
};

// high (>= 0.85), medium (>= 0.70) or low
std::string describeConfidenceLevel(double confidenceScore);

/// \brief Runs the per-drug inference chain for one patient
///
/// Every call returns a fully shaped result; coverage gaps surface as Unknown labels, never as exceptions.
///
class DrugAnalyzer
{
public:
    DrugAnalyzer(
        const RuleCatalog& catalog, const PatientProfile& profile, std::vector<std::string> concurrentMedications)
        : catalog_(catalog)
        , profile_(profile)
        , concurrentMedications_(std::move(concurrentMedications))
        , scorer_(catalog.confidenceModel())
        , calibrator_(catalog.calibrationBins())
    {
    }

    AnalysisResult analyze(const std::string& drugName, const std::string& timestamp) const;

private:
    const RuleCatalog& catalog_;
    const PatientProfile& profile_;
    std::vector<std::string> concurrentMedications_;
    ConfidenceScorer scorer_;
    PostHocCalibrator calibrator_;
};

// Drug names are normalized first and each normalized drug is analysed once, in request order
std::vector<AnalysisResult> analyzeDrugs(
    const RuleCatalog& catalog, const PatientProfile& profile, const std::vector<std::string>& drugNames,
    const std::vector<std::string>& concurrentMedications, const std::string& timestamp);

}
