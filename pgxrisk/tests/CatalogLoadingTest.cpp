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

#include "io/CatalogLoading.hh"

#include <stdexcept>

#include "gtest/gtest.h"

#include "tests/TestCatalog.hh"

using nlohmann::json;
using namespace pgxrisk;

TEST(LoadingRuleCatalog, WellFormedCatalog_Loaded)
{
    const RuleCatalog catalog = makeTestCatalog();

    EXPECT_EQ("test-rules-1", catalog.version());
    EXPECT_EQ(2u, catalog.targetGenes().size());
    EXPECT_TRUE(catalog.isTargetGene("CYP2C19"));
    EXPECT_FALSE(catalog.isTargetGene("DPYD"));
    EXPECT_EQ("*1/*1", catalog.defaultDiplotype());
    EXPECT_EQ(7u, catalog.riskRuleCount());
    EXPECT_EQ(7u, catalog.calibrationBins().size());
}

TEST(LoadingRuleCatalog, DrugNamesInRules_Normalized)
{
    const RuleCatalog catalog = makeTestCatalog();

    const auto rule = catalog.findRiskRule("CYP2D6", Phenotype::kPM, "CODEINE");
    ASSERT_TRUE(rule);
    EXPECT_EQ(RiskLabel::kToxic, rule->riskLabel);
    EXPECT_EQ(Severity::kCritical, rule->severity);
    const std::vector<std::string> expectedAlternatives = { "morphine", "non-opioid analgesics" };
    EXPECT_EQ(expectedAlternatives, rule->alternatives);
}

TEST(LoadingRuleCatalog, DrugAliases_ResolvedToSupportedDrugs)
{
    const RuleCatalog catalog = makeTestCatalog();

    EXPECT_EQ("CLOPIDOGREL", catalog.normalizeDrugName("  plavix "));
    EXPECT_EQ("CODEINE", catalog.normalizeDrugName("Tylenol 3"));
    EXPECT_EQ("ASPIRIN", catalog.normalizeDrugName("aspirin"));
    EXPECT_EQ(std::string("CYP2C19"), *catalog.primaryGene("CLOPIDOGREL"));
    EXPECT_FALSE(catalog.primaryGene("ASPIRIN"));
}

TEST(LoadingRuleCatalog, AlleleDefinitions_LookedUpByRsidAndName)
{
    const RuleCatalog catalog = makeTestCatalog();

    const auto byRsid = catalog.findAlleleByRsid("rs3892097");
    ASSERT_TRUE(byRsid);
    EXPECT_EQ("*4", byRsid->starAllele);
    EXPECT_EQ(AlleleFunction::kNoFunction, byRsid->function);

    const auto byName = catalog.findAllele("CYP2C19", "*17");
    ASSERT_TRUE(byName);
    EXPECT_EQ(AlleleFunction::kIncreased, byName->function);
    EXPECT_FALSE(catalog.findAlleleByRsid("rs0"));
}

TEST(LoadingRuleCatalog, CuratedReferenceWithoutFdaField_DerivedFromLevel)
{
    const RuleCatalog catalog = makeTestCatalog();

    const auto reference = catalog.findCuratedReference("CYP2D6", "CODEINE");
    ASSERT_TRUE(reference);
    EXPECT_EQ(EvidenceTier::k1A, reference->tier);
    EXPECT_EQ("Required", reference->fdaRequirement);
    EXPECT_EQ(2014, reference->year);
}

TEST(LoadingRuleCatalog, MissingRiskRules_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson.erase("RiskRules");
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, RuleWithoutAction_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson["RiskRules"][0].erase("Action");
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, RuleKeyedOnUnknownPhenotype_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson["RiskRules"][0]["Phenotype"] = "Unknown";
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, MisspelledRiskLabel_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson["RiskRules"][0]["RiskLabel"] = "Toxicity";
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, DuplicatedRule_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson["RiskRules"].push_back(catalogJson["RiskRules"][0]);
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, WeightsNotSummingToOne_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson["ConfidenceModel"]["Weights"]["Evidence"] = 0.5;
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, EvidenceConfidenceIncreasingWithWeakerLevel_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson["ConfidenceModel"]["EvidenceByLevel"]["2B"] = 0.99;
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, UnorderedBreakpoints_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson["PhenotypeBreakpoints"]["CYP2D6"][1]["MaxScore"] = 3.0;
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, OpenBreakpointBeforeLast_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson["PhenotypeBreakpoints"]["CYP2D6"][0].erase("MaxScore");
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, TargetGeneWithoutBreakpoints_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson["PhenotypeBreakpoints"].erase("CYP2C19");
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, DrugMappedToNonTargetGene_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson["SupportedDrugs"]["WARFARIN"] = "CYP2C9";
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, AliasOfUnsupportedDrug_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson["DrugAliases"]["COUMADIN"] = "WARFARIN";
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, DuplicatedRsid_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson["AlleleDefinitions"].push_back(catalogJson["AlleleDefinitions"][0]);
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, InhibitorWithConflictingStrengths_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson["InhibitorStrengths"]["CYP2D6"]["weak"].push_back("Fluoxetine");
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, CalibrationBinsWithGap_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson["CalibrationBins"][1]["Lower"] = 0.45;
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, DecreasingCalibratedScores_ExceptionThrown)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson["CalibrationBins"][6]["Calibrated"] = 0.5;
    EXPECT_THROW(decodeRuleCatalog(catalogJson), std::logic_error);
}

TEST(LoadingRuleCatalog, NoCalibrationBins_IdentityCalibration)
{
    json catalogJson = makeTestCatalogJson();
    catalogJson.erase("CalibrationBins");
    const RuleCatalog catalog = decodeRuleCatalog(catalogJson);
    EXPECT_TRUE(catalog.calibrationBins().empty());
}

TEST(LoadingRuleCatalog, NonexistentFile_ExceptionThrown)
{
    EXPECT_THROW(loadRuleCatalog("/nonexistent/pgx_rules.json"), std::runtime_error);
}
