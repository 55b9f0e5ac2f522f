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

#include "io/PharmgkbLoading.hh"

#include <sstream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "tests/TestCatalog.hh"

using std::set;
using std::string;
using std::vector;
using namespace pgxrisk;

TEST(LoadingPharmgkbAnnotations, TypicalTable_RowsAddedAsDynamicEvidence)
{
    RuleCatalog catalog = makeTestCatalog();
    std::istringstream table("Clinical Annotation ID\tGene\tLevel of Evidence\tPhenotype Category\tDrug(s)\n"
                             "1449309937\tCYP2D6\t1A\tToxicity\tcodeine\n"
                             "1449309750\tCYP2C19\t1B\tEfficacy\tPlavix;ticagrelor\n"
                             "1183621000\tCYP2C19\tnot-a-level\tEfficacy\tomeprazole\n"
                             "1183621001\tCYP2C19\t2A\n");

    EXPECT_EQ(3, loadPharmgkbAnnotations(table, catalog));

    const auto codeine = catalog.findDynamicEvidence("CYP2D6", "CODEINE");
    ASSERT_TRUE(codeine);
    EXPECT_EQ(EvidenceTier::k1A, codeine->tier);
    EXPECT_EQ("Toxicity", codeine->clinicalSignificance);
    EXPECT_EQ("Required", codeine->fdaRequirement);
    EXPECT_TRUE(catalog.findDynamicEvidence("CYP2C19", "CLOPIDOGREL"));
    EXPECT_TRUE(catalog.findDynamicEvidence("CYP2C19", "TICAGRELOR"));
    EXPECT_FALSE(catalog.findDynamicEvidence("CYP2C19", "OMEPRAZOLE"));
}

TEST(LoadingPharmgkbAnnotations, RowsAtOrBelowKeptLevel_PhenotypeCategoriesMerged)
{
    RuleCatalog catalog = makeTestCatalog();
    std::istringstream table("Gene\tLevel of Evidence\tPhenotype Category\tDrug(s)\n"
                             "CYP2D6\t1A\tToxicity\tcodeine\n"
                             "CYP2D6\t3\tEfficacy, Dosage\tcodeine\n"
                             "CYP2D6\t1A\tMetabolism/PK\tcodeine\n");

    EXPECT_EQ(3, loadPharmgkbAnnotations(table, catalog));

    const auto codeine = catalog.findDynamicEvidence("CYP2D6", "CODEINE");
    ASSERT_TRUE(codeine);
    EXPECT_EQ(EvidenceTier::k1A, codeine->tier);
    EXPECT_EQ("Toxicity", codeine->clinicalSignificance);
    const set<string> expectedCategories = { "Dosage", "Efficacy", "Metabolism/PK", "Toxicity" };
    EXPECT_EQ(expectedCategories, codeine->phenotypeCategories);
}

TEST(LoadingPharmgkbAnnotations, BetterLevelRow_ReplacesKeptAnnotation)
{
    RuleCatalog catalog = makeTestCatalog();
    std::istringstream table("Gene\tLevel of Evidence\tPhenotype Category\tDrug(s)\n"
                             "CYP2C19\t2A\tEfficacy\tclopidogrel\n"
                             "CYP2C19\t1A\tToxicity\tclopidogrel\n");

    loadPharmgkbAnnotations(table, catalog);

    const auto clopidogrel = catalog.findDynamicEvidence("CYP2C19", "CLOPIDOGREL");
    ASSERT_TRUE(clopidogrel);
    EXPECT_EQ(EvidenceTier::k1A, clopidogrel->tier);
    const set<string> expectedCategories = { "Toxicity" };
    EXPECT_EQ(expectedCategories, clopidogrel->phenotypeCategories);
}

TEST(LoadingPharmgkbVariantAnnotations, SentencesForLoadedPairs_Attached)
{
    RuleCatalog catalog = makeTestCatalog();
    std::istringstream clinicalTable("Gene\tLevel of Evidence\tPhenotype Category\tDrug(s)\n"
                                     "CYP2D6\t1A\tToxicity\tcodeine\n");
    loadPharmgkbAnnotations(clinicalTable, catalog);

    std::istringstream variantTable("Variant Annotation ID\tGene\tDrug(s)\tSentence\n"
                                    "1\tCYP2D6\tcodeine\tGenotype *4/*4 is associated with decreased metabolism.\n"
                                    "2\tCYP2D6\tcodeine\tGenotype *4/*4 is associated with decreased metabolism.\n"
                                    "3\tCYP2D6\ttramadol\tAllele *4 is associated with decreased response.\n"
                                    "4\tCYP2D6\tcodeine\t\n");

    EXPECT_EQ(1, loadPharmgkbVariantAnnotations(variantTable, catalog));

    const auto codeine = catalog.findDynamicEvidence("CYP2D6", "CODEINE");
    ASSERT_TRUE(codeine);
    const vector<string> expectedSentences = { "Genotype *4/*4 is associated with decreased metabolism." };
    EXPECT_EQ(expectedSentences, codeine->annotationSentences);
    EXPECT_FALSE(catalog.findDynamicEvidence("CYP2D6", "TRAMADOL"));
}

TEST(LoadingPharmgkbVariantAnnotations, MissingSentenceColumn_ExceptionThrown)
{
    RuleCatalog catalog = makeTestCatalog();
    std::istringstream table("Gene\tDrug(s)\nCYP2D6\tcodeine\n");
    EXPECT_THROW(loadPharmgkbVariantAnnotations(table, catalog), std::runtime_error);
}

TEST(LoadingPharmgkbAnnotations, MissingLevelColumn_ExceptionThrown)
{
    RuleCatalog catalog = makeTestCatalog();
    std::istringstream table("Gene\tDrug(s)\nCYP2D6\tcodeine\n");
    EXPECT_THROW(loadPharmgkbAnnotations(table, catalog), std::runtime_error);
}

TEST(LoadingPharmgkbAnnotations, EmptyTable_ExceptionThrown)
{
    RuleCatalog catalog = makeTestCatalog();
    std::istringstream table("");
    EXPECT_THROW(loadPharmgkbAnnotations(table, catalog), std::runtime_error);
}
