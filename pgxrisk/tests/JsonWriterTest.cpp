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

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "tests/TestCatalog.hh"

using nlohmann::json;
using std::string;
using std::vector;
using namespace pgxrisk;

namespace
{

vector<AnalysisResult> analyzeTestPatient(const vector<string>& concurrentMedications)
{
    static const RuleCatalog catalog = makeTestCatalog();
    std::istringstream vcfStream("##fileformat=VCFv4.2\n"
                                 "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tSAMPLE\n"
                                 "22\t42524947\trs3892097\tC\tT\t99\tPASS\tGENE=CYP2D6;STAR=*4\tGT\t0/1\n");
    const PatientProfile profile("PATIENT_001", filterVariants(vcfStream, catalog, 20.0), catalog);
    return analyzeDrugs(
        catalog, profile, { "CODEINE", "CLOPIDOGREL", "ASPIRIN" }, concurrentMedications, "2026-01-15T09:30:00Z");
}

string writeResults(const vector<AnalysisResult>& results, bool includeDecisionTrace)
{
    JsonWriter writer("PATIENT_001", "test-rules-1", { "fluoxetine" }, results, includeDecisionTrace);
    std::ostringstream out;
    out << writer;
    return out.str();
}

}

TEST(WritingJson, SameResults_ByteIdenticalOutput)
{
    const string firstRun = writeResults(analyzeTestPatient({ "fluoxetine" }), true);
    const string secondRun = writeResults(analyzeTestPatient({ "fluoxetine" }), true);
    EXPECT_EQ(firstRun, secondRun);
}

TEST(WritingJson, AnalysisResult_EncodedWithAllSections)
{
    const json output = json::parse(writeResults(analyzeTestPatient({ "fluoxetine" }), true));

    EXPECT_EQ("PATIENT_001", output["SampleParameters"]["PatientId"]);
    EXPECT_EQ("test-rules-1", output["SampleParameters"]["RulesVersion"]);
    ASSERT_EQ(3u, output["Results"].size());

    const json& codeine = output["Results"][0];
    EXPECT_EQ("CODEINE", codeine["Drug"]);
    EXPECT_EQ("2026-01-15T09:30:00Z", codeine["Timestamp"]);
    EXPECT_EQ("*4/*1", codeine["PharmacogenomicProfile"]["Diplotype"]);
    EXPECT_EQ("IM", codeine["PharmacogenomicProfile"]["Phenotype"]);
    EXPECT_EQ("PM", codeine["PharmacogenomicProfile"]["FunctionalPhenotype"]);
    EXPECT_EQ(1.0, codeine["PharmacogenomicProfile"]["ActivityScore"]);
    EXPECT_EQ("heterozygous", codeine["PharmacogenomicProfile"]["DetectedVariants"][0]["Zygosity"]);
    EXPECT_EQ("Toxic", codeine["RiskAssessment"]["RiskLabel"]);
    EXPECT_EQ("critical", codeine["RiskAssessment"]["Severity"]);
    EXPECT_EQ("1A", codeine["ClinicalRecommendation"]["EvidenceLevel"]);
    EXPECT_TRUE(codeine["ClinicalRecommendation"]["PhenotypeCategories"].is_array());
    EXPECT_TRUE(codeine["ClinicalRecommendation"]["AnnotationSentences"].empty());
    EXPECT_TRUE(codeine["QualityMetrics"]["RuleCoverage"].get<bool>());
    EXPECT_EQ(0, codeine["QualityMetrics"]["SkippedRecords"]["LowQuality"]);
    EXPECT_TRUE(codeine["Phenoconversion"]["PhenoconversionRisk"].get<bool>());
    EXPECT_EQ("strong", codeine["Phenoconversion"]["CausedBy"][0]["Strength"]);
    EXPECT_EQ(8u, codeine["DecisionTrace"].size());

    const json& clopidogrel = output["Results"][1];
    EXPECT_TRUE(clopidogrel.find("Phenoconversion") == clopidogrel.end());

    const json& aspirin = output["Results"][2];
    EXPECT_EQ("Unknown", aspirin["RiskAssessment"]["RiskLabel"]);
    EXPECT_EQ("Unknown", aspirin["PharmacogenomicProfile"]["PrimaryGene"]);
    EXPECT_TRUE(aspirin["PharmacogenomicProfile"]["ActivityScore"].is_null());
    EXPECT_LE(aspirin["RiskAssessment"]["ConfidenceScore"].get<double>(), 0.69);
}

TEST(WritingJson, DecisionTraceDisabled_TraceOmitted)
{
    const json output = json::parse(writeResults(analyzeTestPatient({}), false));
    for (const json& result : output["Results"])
    {
        EXPECT_TRUE(result.find("DecisionTrace") == result.end());
    }
}

TEST(DecodingCohortEntries, WrittenResults_RoundTripIntoCohortSummary)
{
    const json output = json::parse(writeResults(analyzeTestPatient({ "fluoxetine" }), false));
    const vector<CohortEntry> entries = decodeCohortEntries(output);

    ASSERT_EQ(3u, entries.size());
    EXPECT_EQ("PATIENT_001", entries[0].patientId);
    EXPECT_EQ(RiskLabel::kToxic, entries[0].riskLabel);
    EXPECT_EQ(Severity::kCritical, entries[0].severity);

    const CohortSummary summary = aggregateCohort(entries);
    EXPECT_EQ(3, summary.cohortSize());
    EXPECT_EQ(1, summary.highRiskCount());
}

TEST(DecodingCohortEntries, RecordWithoutRiskAssessment_ExceptionThrown)
{
    const json record = { { "PatientId", "P1" }, { "Drug", "CODEINE" } };
    EXPECT_THROW(decodeCohortEntries(record), std::logic_error);
}

TEST(WritingCohortJson, Summary_EncodedWithMatrixAndAlert)
{
    const CohortSummary summary
        = aggregateCohort({ { "P1", "CODEINE", RiskLabel::kToxic, Severity::kCritical },
                            { "P2", "CODEINE", RiskLabel::kSafe, Severity::kNone },
                            { "P3", "WARFARIN", RiskLabel::kSafe, Severity::kNone } });
    CohortJsonWriter writer(summary);
    std::ostringstream out;
    out << writer;

    const json output = json::parse(out.str());
    EXPECT_EQ(3, output["CohortSize"]);
    EXPECT_EQ(1, output["HighRiskCount"]);
    EXPECT_EQ("P1", output["HighRiskPatients"][0]);
    EXPECT_EQ(1, output["RiskMatrix"]["CODEINE"]["Toxic"]);
    EXPECT_EQ(0, output["RiskMatrix"]["WARFARIN"]["Adjust Dosage"]);
    EXPECT_EQ("1 patient requires immediate clinical review", output["Alert"]);
}
