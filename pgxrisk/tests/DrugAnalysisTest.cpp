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

#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "tests/TestCatalog.hh"

using std::string;
using std::vector;
using namespace pgxrisk;

namespace
{

const string kTimestamp = "2026-01-15T09:30:00Z";

const string kVcfHeader = "##fileformat=VCFv4.2\n"
                          "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tSAMPLE\n";

PatientProfile makeProfile(const string& vcf, const RuleCatalog& catalog)
{
    std::istringstream vcfStream(vcf);
    return PatientProfile("PATIENT_001", filterVariants(vcfStream, catalog, 20.0), catalog);
}

}

TEST(AnalyzingDrugs, HomozygousNullCodeinePatient_ToxicCriticalCall)
{
    const RuleCatalog catalog = makeTestCatalog();
    const PatientProfile profile = makeProfile(
        kVcfHeader + "22\t42524947\trs3892097\tC\tT\t99\tPASS\tGENE=CYP2D6;STAR=*4\tGT\t1/1\n", catalog);
    const DrugAnalyzer analyzer(catalog, profile, {});

    const AnalysisResult result = analyzer.analyze("codeine", kTimestamp);

    EXPECT_EQ("PATIENT_001", result.patientId);
    EXPECT_EQ("CODEINE", result.drug);
    EXPECT_EQ(kTimestamp, result.timestamp);
    EXPECT_EQ("CYP2D6", result.primaryGene);
    EXPECT_EQ("*4/*4", result.diplotype);
    EXPECT_EQ(Phenotype::kPM, result.phenotype);
    EXPECT_EQ(Phenotype::kPM, result.functionalPhenotype);
    EXPECT_DOUBLE_EQ(0.0, *result.activityScore);
    EXPECT_EQ(RiskLabel::kToxic, result.riskLabel);
    EXPECT_EQ(Severity::kCritical, result.severity);
    EXPECT_TRUE(result.isRuleCovered);
    EXPECT_DOUBLE_EQ(1.0, result.confidenceComponents.ruleCoverage);

    ASSERT_EQ(1u, result.detectedVariants.size());
    EXPECT_EQ("rs3892097", result.detectedVariants.front().rsid);
    EXPECT_EQ(Zygosity::kHomozygous, result.detectedVariants.front().zygosity);

    const ClinicalRecommendation& recommendation = result.recommendation;
    EXPECT_EQ("CPIC Guideline for Codeine and CYP2D6", recommendation.guideline);
    EXPECT_EQ("Avoid codeine. Use morphine or non-opioid alternative.", recommendation.action);
    EXPECT_EQ(EvidenceTier::k1A, recommendation.evidenceLevel);
    EXPECT_EQ("Required", recommendation.fdaRequirement);
    EXPECT_EQ("Crews et al. (2014). CPIC Guideline for Codeine and CYP2D6. PMID: 24458010", recommendation.reference);

    EXPECT_NEAR(0.35 * 0.96 + 0.25 * 0.9972 + 0.2 * 0.95 + 0.2, result.rawConfidenceScore, 1e-9);
    EXPECT_DOUBLE_EQ(0.95, result.confidenceScore);
    EXPECT_EQ("high", result.qualityMetrics.confidenceLevel);
    EXPECT_TRUE(result.qualityMetrics.vcfParsingSuccess);
    EXPECT_EQ(1, result.qualityMetrics.variantsAnalyzed);
    EXPECT_EQ("test-rules-1", result.qualityMetrics.rulesVersion);

    ASSERT_TRUE(result.phenoconversion);
    EXPECT_FALSE(result.phenoconversion->isPhenoconverted());
}

TEST(AnalyzingDrugs, StrongInhibitorWithNormalMetabolizer_FunctionalPhenotypeDrivesRule)
{
    const RuleCatalog catalog = makeTestCatalog();
    const PatientProfile profile = makeProfile(kVcfHeader, catalog);
    const DrugAnalyzer analyzer(catalog, profile, { "fluoxetine" });

    const AnalysisResult result = analyzer.analyze("CODEINE", kTimestamp);

    EXPECT_EQ("*1/*1", result.diplotype);
    EXPECT_EQ(Phenotype::kNM, result.phenotype);
    EXPECT_EQ(Phenotype::kIM, result.functionalPhenotype);
    EXPECT_EQ(RiskLabel::kAdjustDosage, result.riskLabel);
    EXPECT_EQ(Severity::kModerate, result.severity);

    ASSERT_TRUE(result.phenoconversion);
    const PhenoconversionResult& phenoconversion = *result.phenoconversion;
    EXPECT_TRUE(phenoconversion.isPhenoconverted());
    ASSERT_EQ(1u, phenoconversion.drivers.size());
    EXPECT_EQ("fluoxetine", phenoconversion.drivers.front().medication);
    EXPECT_EQ(InhibitorStrength::kStrong, phenoconversion.drivers.front().strength);
    EXPECT_EQ("Use codeine with caution. " + phenoconversion.clinicalNote, result.recommendation.action);

    // Penalty of the strong inhibitor is taken before calibration: 0.8535 - 0.1 falls into [0.7, 0.8)
    EXPECT_NEAR(0.8535, result.rawConfidenceScore, 1e-9);
    EXPECT_DOUBLE_EQ(0.78, result.confidenceScore);
    EXPECT_EQ("medium", result.qualityMetrics.confidenceLevel);
}

TEST(AnalyzingDrugs, ReferenceOnlyCalls_WildTypeDiplotypesAndNoDetectedVariants)
{
    const RuleCatalog catalog = makeTestCatalog();
    const PatientProfile profile = makeProfile(
        kVcfHeader + "22\t42524947\trs3892097\tC\tT\t20\tPASS\tGENE=CYP2D6;STAR=*4\tGT\t0/0\n"
                     "10\t94781859\trs4244285\tG\tA\t20\tPASS\tGENE=CYP2C19;STAR=*2\tGT\t0/0\n",
        catalog);

    for (const auto& geneAndDiplotype : profile.diplotypes())
    {
        EXPECT_EQ("*1/*1", geneAndDiplotype.second.encode());
    }

    const vector<AnalysisResult> results = analyzeDrugs(catalog, profile, { "CODEINE", "CLOPIDOGREL" }, {}, kTimestamp);
    ASSERT_EQ(2u, results.size());
    for (const AnalysisResult& result : results)
    {
        EXPECT_TRUE(result.detectedVariants.empty());
        EXPECT_EQ(Phenotype::kNM, result.phenotype);
        EXPECT_EQ(RiskLabel::kSafe, result.riskLabel);
        EXPECT_EQ(2, result.qualityMetrics.variantsAnalyzed);
    }
}

TEST(AnalyzingDrugs, SupportedDrugWithoutRule_UnknownWithCappedConfidence)
{
    const RuleCatalog catalog = makeTestCatalog();
    const PatientProfile profile = makeProfile(kVcfHeader, catalog);
    const DrugAnalyzer analyzer(catalog, profile, {});

    const AnalysisResult result = analyzer.analyze("ondansetron", kTimestamp);

    EXPECT_EQ("CYP2D6", result.primaryGene);
    EXPECT_EQ(RiskLabel::kUnknown, result.riskLabel);
    EXPECT_EQ(Severity::kNone, result.severity);
    EXPECT_FALSE(result.isRuleCovered);
    EXPECT_DOUBLE_EQ(0.0, result.confidenceComponents.ruleCoverage);
    EXPECT_LE(result.rawConfidenceScore, kUncoveredRawScoreCap);
    EXPECT_LE(result.confidenceScore, kUncoveredRawScoreCap);
    EXPECT_EQ(
        "Insufficient rule coverage for CYP2D6 + ONDANSETRON + Normal Metabolizer. Classify as Unknown and consult "
        "CPIC/PharmGKB guidelines or a pharmacogenomics specialist.",
        result.recommendation.action);
    EXPECT_EQ("No curated CPIC guideline mapping for ONDANSETRON and CYP2D6", result.recommendation.guideline);
    EXPECT_EQ(EvidenceTier::kNone, result.recommendation.evidenceLevel);
    EXPECT_EQ("No evidence on file", result.recommendation.reference);
    EXPECT_EQ("low", result.qualityMetrics.confidenceLevel);
}

TEST(AnalyzingDrugs, UnsupportedDrug_FullyShapedUnknownResult)
{
    const RuleCatalog catalog = makeTestCatalog();
    const PatientProfile profile = makeProfile(kVcfHeader, catalog);
    const DrugAnalyzer analyzer(catalog, profile, { "fluoxetine" });

    const AnalysisResult result = analyzer.analyze("aspirin", kTimestamp);

    EXPECT_EQ("ASPIRIN", result.drug);
    EXPECT_EQ(kUnknownGene, result.primaryGene);
    EXPECT_EQ(kUnknownGene, result.diplotype);
    EXPECT_EQ(Phenotype::kUnknown, result.phenotype);
    EXPECT_EQ(Phenotype::kUnknown, result.functionalPhenotype);
    EXPECT_EQ(RiskLabel::kUnknown, result.riskLabel);
    EXPECT_FALSE(result.activityScore);
    EXPECT_FALSE(result.phenoconversion);
    EXPECT_LE(result.confidenceScore, kUncoveredRawScoreCap);
    EXPECT_FALSE(result.recommendation.monitoring.empty());
}

TEST(AnalyzingDrugs, DecisionTrace_RecordsEveryStageInOrder)
{
    const RuleCatalog catalog = makeTestCatalog();
    const PatientProfile profile = makeProfile(kVcfHeader, catalog);
    const DrugAnalyzer analyzer(catalog, profile, {});

    const AnalysisResult result = analyzer.analyze("CODEINE", kTimestamp);

    const vector<string> expectedStages
        = { "VariantQualityFilter", "DiplotypeAssembler", "PhenotypeCaller",  "PhenoconversionAdjuster",
            "EvidenceResolver",     "RiskRuleMatcher",    "ConfidenceScorer", "PostHocCalibrator" };
    vector<string> stages;
    for (const TraceStep& step : result.decisionTrace.steps())
    {
        stages.push_back(step.stage);
        EXPECT_FALSE(step.source.empty());
    }
    EXPECT_EQ(expectedStages, stages);
}

TEST(AnalyzingDrugs, RepeatedAndAliasedDrugNames_AnalyzedOnceInRequestOrder)
{
    const RuleCatalog catalog = makeTestCatalog();
    const PatientProfile profile = makeProfile(kVcfHeader, catalog);

    const vector<AnalysisResult> results = analyzeDrugs(
        catalog, profile, { "Plavix", "codeine", "CLOPIDOGREL", "Tylenol 3", " " }, {}, kTimestamp);

    ASSERT_EQ(2u, results.size());
    EXPECT_EQ("CLOPIDOGREL", results[0].drug);
    EXPECT_EQ("CODEINE", results[1].drug);
}

TEST(AnalyzingDrugs, SameInputs_IdenticalResults)
{
    const RuleCatalog catalog = makeTestCatalog();
    const PatientProfile profile = makeProfile(
        kVcfHeader + "10\t94781859\trs4244285\tG\tA\t45\tPASS\t.\tGT\t0/1\n", catalog);
    const DrugAnalyzer analyzer(catalog, profile, { "paroxetine" });

    const AnalysisResult first = analyzer.analyze("CLOPIDOGREL", kTimestamp);
    const AnalysisResult second = analyzer.analyze("CLOPIDOGREL", kTimestamp);

    EXPECT_EQ(first.riskLabel, second.riskLabel);
    EXPECT_EQ(first.diplotype, second.diplotype);
    EXPECT_DOUBLE_EQ(first.confidenceScore, second.confidenceScore);
    EXPECT_DOUBLE_EQ(first.rawConfidenceScore, second.rawConfidenceScore);
    EXPECT_EQ(first.recommendation.action, second.recommendation.action);
    EXPECT_EQ(Phenotype::kIM, first.phenotype);
}

TEST(DescribingConfidenceLevels, Scores_Banded)
{
    EXPECT_EQ("high", describeConfidenceLevel(0.85));
    EXPECT_EQ("medium", describeConfidenceLevel(0.84));
    EXPECT_EQ("medium", describeConfidenceLevel(0.7));
    EXPECT_EQ("low", describeConfidenceLevel(0.69));
}
