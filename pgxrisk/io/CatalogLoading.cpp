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

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "io/StringUtils.hh"
#include "io/TextInputFile.hh"
#include "spdlog/spdlog.h"

using std::string;
using std::vector;

using Json = nlohmann::json;

namespace pgxrisk
{

static bool checkIfFieldExists(const Json& record, const string& fieldName)
{
    return record.find(fieldName) != record.end();
}

static void assertFieldExists(const Json& record, const string& fieldName)
{
    if (!checkIfFieldExists(record, fieldName))
    {
        std::stringstream out;
        out << record;
        throw std::logic_error("Field " + fieldName + " must be present in " + out.str());
    }
}

static void assertRecordIsArray(const Json& record)
{
    if (!record.is_array())
    {
        std::stringstream out;
        out << record;
        throw std::logic_error("Expected array but got this instead " + out.str());
    }
}

static void assertRecordIsObject(const Json& record)
{
    if (!record.is_object())
    {
        std::stringstream out;
        out << record;
        throw std::logic_error("Expected object but got this instead " + out.str());
    }
}

static string getOptionalString(const Json& record, const string& fieldName)
{
    if (!checkIfFieldExists(record, fieldName) || record[fieldName].is_null())
    {
        return "";
    }
    return record[fieldName].get<string>();
}

static ConfidenceModel decodeConfidenceModel(const Json& modelJson)
{
    assertRecordIsObject(modelJson);
    ConfidenceModel model;

    assertFieldExists(modelJson, "Weights");
    const Json& weightsJson = modelJson["Weights"];
    for (const string& field : { "Evidence", "Genotype", "Phenotype", "RuleCoverage" })
    {
        assertFieldExists(weightsJson, field);
    }
    model.weights.evidence = weightsJson["Evidence"].get<double>();
    model.weights.genotype = weightsJson["Genotype"].get<double>();
    model.weights.phenotype = weightsJson["Phenotype"].get<double>();
    model.weights.ruleCoverage = weightsJson["RuleCoverage"].get<double>();

    assertFieldExists(modelJson, "EvidenceByLevel");
    const Json& evidenceJson = modelJson["EvidenceByLevel"];
    assertRecordIsObject(evidenceJson);
    for (auto levelIt = evidenceJson.begin(); levelIt != evidenceJson.end(); ++levelIt)
    {
        const EvidenceTier tier = decodeEvidenceTier(levelIt.key());
        if (tier == EvidenceTier::kNone)
        {
            throw std::logic_error("Use NoEvidence instead of EvidenceByLevel.none");
        }
        model.evidenceByTier[tier] = levelIt.value().get<double>();
    }

    assertFieldExists(modelJson, "NoEvidence");
    model.noEvidence = modelJson["NoEvidence"].get<double>();

    assertFieldExists(modelJson, "Genotype");
    const Json& genotypeJson = modelJson["Genotype"];
    for (const string& field :
         { "QualityWeight", "CompletenessWeight", "SupportWeight", "BaselineSupport", "SupportPerVariant" })
    {
        assertFieldExists(genotypeJson, field);
    }
    model.genotype.qualityWeight = genotypeJson["QualityWeight"].get<double>();
    model.genotype.completenessWeight = genotypeJson["CompletenessWeight"].get<double>();
    model.genotype.supportWeight = genotypeJson["SupportWeight"].get<double>();
    model.genotype.baselineSupport = genotypeJson["BaselineSupport"].get<double>();
    model.genotype.supportPerVariant = genotypeJson["SupportPerVariant"].get<double>();

    assertFieldExists(modelJson, "Phenotype");
    const Json& phenotypeJson = modelJson["Phenotype"];
    for (const string& field : { "Mapped", "Ambiguous", "Unknown" })
    {
        assertFieldExists(phenotypeJson, field);
    }
    model.phenotype.mapped = phenotypeJson["Mapped"].get<double>();
    model.phenotype.ambiguous = phenotypeJson["Ambiguous"].get<double>();
    model.phenotype.unknown = phenotypeJson["Unknown"].get<double>();

    assertFieldExists(modelJson, "RuleCoverageFallback");
    model.ruleCoverageFallback = modelJson["RuleCoverageFallback"].get<double>();

    return model;
}

static void loadSupportedDrugs(const Json& catalogJson, RuleCatalog& catalog)
{
    assertFieldExists(catalogJson, "SupportedDrugs");
    const Json& drugsJson = catalogJson["SupportedDrugs"];
    assertRecordIsObject(drugsJson);
    for (auto drugIt = drugsJson.begin(); drugIt != drugsJson.end(); ++drugIt)
    {
        catalog.addSupportedDrug(drugIt.key(), drugIt.value().get<string>());
    }

    if (checkIfFieldExists(catalogJson, "DrugAliases"))
    {
        const Json& aliasesJson = catalogJson["DrugAliases"];
        assertRecordIsObject(aliasesJson);
        for (auto aliasIt = aliasesJson.begin(); aliasIt != aliasesJson.end(); ++aliasIt)
        {
            catalog.addDrugAlias(aliasIt.key(), aliasIt.value().get<string>());
        }
    }
}

static void loadAlleleDefinitions(const Json& catalogJson, RuleCatalog& catalog)
{
    assertFieldExists(catalogJson, "AlleleDefinitions");
    const Json& allelesJson = catalogJson["AlleleDefinitions"];
    assertRecordIsArray(allelesJson);
    for (const Json& alleleJson : allelesJson)
    {
        assertFieldExists(alleleJson, "Rsid");
        assertFieldExists(alleleJson, "Gene");
        assertFieldExists(alleleJson, "StarAllele");

        AlleleDefinition definition;
        definition.rsid = alleleJson["Rsid"].get<string>();
        definition.gene = alleleJson["Gene"].get<string>();
        definition.starAllele = alleleJson["StarAllele"].get<string>();
        definition.function = decodeAlleleFunction(getOptionalString(alleleJson, "Function"));
        catalog.addAlleleDefinition(std::move(definition));
    }
}

static void loadGeneModels(const Json& catalogJson, RuleCatalog& catalog)
{
    assertFieldExists(catalogJson, "ActivityScores");
    const Json& scoresJson = catalogJson["ActivityScores"];
    assertRecordIsObject(scoresJson);
    for (auto geneIt = scoresJson.begin(); geneIt != scoresJson.end(); ++geneIt)
    {
        GeneModel& model = catalog.mutableGeneModel(geneIt.key());
        for (auto alleleIt = geneIt.value().begin(); alleleIt != geneIt.value().end(); ++alleleIt)
        {
            model.setActivityScore(alleleIt.key(), alleleIt.value().get<double>());
        }
    }

    assertFieldExists(catalogJson, "PhenotypeBreakpoints");
    const Json& breakpointsJson = catalogJson["PhenotypeBreakpoints"];
    assertRecordIsObject(breakpointsJson);
    for (auto geneIt = breakpointsJson.begin(); geneIt != breakpointsJson.end(); ++geneIt)
    {
        assertRecordIsArray(geneIt.value());
        vector<PhenotypeBreakpoint> breakpoints;
        for (const Json& breakpointJson : geneIt.value())
        {
            assertFieldExists(breakpointJson, "Phenotype");
            PhenotypeBreakpoint breakpoint;
            breakpoint.phenotype = decodePhenotype(breakpointJson["Phenotype"].get<string>());
            if (checkIfFieldExists(breakpointJson, "MaxScore") && !breakpointJson["MaxScore"].is_null())
            {
                breakpoint.maxScore = breakpointJson["MaxScore"].get<double>();
            }
            breakpoints.push_back(breakpoint);
        }
        catalog.mutableGeneModel(geneIt.key()).setBreakpoints(std::move(breakpoints));
    }

    if (checkIfFieldExists(catalogJson, "DiplotypePhenotypes"))
    {
        const Json& diplotypesJson = catalogJson["DiplotypePhenotypes"];
        assertRecordIsObject(diplotypesJson);
        for (auto geneIt = diplotypesJson.begin(); geneIt != diplotypesJson.end(); ++geneIt)
        {
            GeneModel& model = catalog.mutableGeneModel(geneIt.key());
            for (auto diplotypeIt = geneIt.value().begin(); diplotypeIt != geneIt.value().end(); ++diplotypeIt)
            {
                vector<string> alleles;
                boost::split(alleles, diplotypeIt.key(), boost::is_any_of("|"));
                if (alleles.size() != 2 || alleles[0].empty() || alleles[1].empty())
                {
                    throw std::logic_error(
                        "Diplotype key " + diplotypeIt.key() + " of " + geneIt.key() + " must look like *a|*b");
                }
                model.addDiplotypePhenotype(
                    alleles[0], alleles[1], decodePhenotype(diplotypeIt.value().get<string>()));
            }
        }
    }

    if (checkIfFieldExists(catalogJson, "InhibitorStrengths"))
    {
        const Json& inhibitorsJson = catalogJson["InhibitorStrengths"];
        assertRecordIsObject(inhibitorsJson);
        for (auto geneIt = inhibitorsJson.begin(); geneIt != inhibitorsJson.end(); ++geneIt)
        {
            GeneModel& model = catalog.mutableGeneModel(geneIt.key());
            for (auto strengthIt = geneIt.value().begin(); strengthIt != geneIt.value().end(); ++strengthIt)
            {
                const InhibitorStrength strength = decodeInhibitorStrength(strengthIt.key());
                assertRecordIsArray(strengthIt.value());
                for (const Json& medicationJson : strengthIt.value())
                {
                    model.addInhibitor(medicationJson.get<string>(), strength);
                }
            }
        }
    }

    if (checkIfFieldExists(catalogJson, "PhenoconversionPenalty"))
    {
        const Json& penaltiesJson = catalogJson["PhenoconversionPenalty"];
        assertRecordIsObject(penaltiesJson);
        for (auto penaltyIt = penaltiesJson.begin(); penaltyIt != penaltiesJson.end(); ++penaltyIt)
        {
            catalog.setPhenoconversionPenalty(
                decodeInhibitorStrength(penaltyIt.key()), penaltyIt.value().get<double>());
        }
    }
}

static void loadRiskRules(const Json& catalogJson, RuleCatalog& catalog)
{
    assertFieldExists(catalogJson, "RiskRules");
    const Json& rulesJson = catalogJson["RiskRules"];
    assertRecordIsArray(rulesJson);
    for (const Json& ruleJson : rulesJson)
    {
        for (const string& field : { "Gene", "Phenotype", "Drug", "RiskLabel", "Severity", "Action" })
        {
            assertFieldExists(ruleJson, field);
        }

        RiskRule rule;
        rule.gene = ruleJson["Gene"].get<string>();
        rule.phenotype = decodePhenotype(ruleJson["Phenotype"].get<string>());
        rule.drug = catalog.normalizeDrugName(ruleJson["Drug"].get<string>());
        rule.riskLabel = decodeRiskLabel(ruleJson["RiskLabel"].get<string>());
        rule.severity = decodeSeverity(ruleJson["Severity"].get<string>());
        rule.action = ruleJson["Action"].get<string>();
        if (checkIfFieldExists(ruleJson, "Alternatives"))
        {
            assertRecordIsArray(ruleJson["Alternatives"]);
            rule.alternatives = ruleJson["Alternatives"].get<vector<string>>();
        }

        if (rule.phenotype == Phenotype::kUnknown)
        {
            throw std::logic_error("Risk rules cannot be keyed on an Unknown phenotype: " + ruleJson.dump());
        }
        catalog.addRiskRule(std::move(rule));
    }
}

static EvidenceAnnotation decodeEvidenceAnnotation(const Json& annotationJson, const RuleCatalog& catalog)
{
    assertFieldExists(annotationJson, "Gene");
    assertFieldExists(annotationJson, "Drug");
    assertFieldExists(annotationJson, "EvidenceLevel");

    EvidenceAnnotation annotation;
    annotation.gene = annotationJson["Gene"].get<string>();
    annotation.drug = catalog.normalizeDrugName(annotationJson["Drug"].get<string>());
    annotation.tier = decodeEvidenceTier(annotationJson["EvidenceLevel"].get<string>());
    annotation.clinicalSignificance = getOptionalString(annotationJson, "ClinicalSignificance");
    annotation.guideline = getOptionalString(annotationJson, "Guideline");
    annotation.authors = getOptionalString(annotationJson, "Authors");
    annotation.pmid = getOptionalString(annotationJson, "Pmid");
    annotation.doi = getOptionalString(annotationJson, "Doi");
    if (checkIfFieldExists(annotationJson, "Year") && !annotationJson["Year"].is_null())
    {
        annotation.year = annotationJson["Year"].get<int>();
    }

    const string fdaRequirement = getOptionalString(annotationJson, "FdaRequirement");
    annotation.fdaRequirement = fdaRequirement.empty() ? deriveFdaRequirement(annotation.tier) : fdaRequirement;
    return annotation;
}

static void loadEvidence(const Json& catalogJson, RuleCatalog& catalog)
{
    if (checkIfFieldExists(catalogJson, "EvidenceAnnotations"))
    {
        assertRecordIsArray(catalogJson["EvidenceAnnotations"]);
        for (const Json& annotationJson : catalogJson["EvidenceAnnotations"])
        {
            catalog.addDynamicEvidence(decodeEvidenceAnnotation(annotationJson, catalog));
        }
    }

    if (checkIfFieldExists(catalogJson, "CpicReferences"))
    {
        assertRecordIsArray(catalogJson["CpicReferences"]);
        for (const Json& referenceJson : catalogJson["CpicReferences"])
        {
            catalog.addCuratedReference(decodeEvidenceAnnotation(referenceJson, catalog));
        }
    }
}

static void loadCalibrationBins(const Json& catalogJson, RuleCatalog& catalog)
{
    if (!checkIfFieldExists(catalogJson, "CalibrationBins") || catalogJson["CalibrationBins"].is_null())
    {
        spdlog::warn("Rule catalog has no CalibrationBins; confidence scores will not be calibrated");
        return;
    }

    const Json& binsJson = catalogJson["CalibrationBins"];
    assertRecordIsArray(binsJson);
    vector<CalibrationBin> bins;
    for (const Json& binJson : binsJson)
    {
        assertFieldExists(binJson, "Lower");
        assertFieldExists(binJson, "Upper");
        assertFieldExists(binJson, "Calibrated");
        bins.push_back(
            { binJson["Lower"].get<double>(), binJson["Upper"].get<double>(), binJson["Calibrated"].get<double>() });
    }
    catalog.setCalibrationBins(std::move(bins));
}

RuleCatalog decodeRuleCatalog(const Json& catalogJson)
{
    assertRecordIsObject(catalogJson);
    for (const string& field : { "RulesVersion", "TargetGenes", "ReferenceAllele", "ConfidenceModel" })
    {
        assertFieldExists(catalogJson, field);
    }
    assertRecordIsArray(catalogJson["TargetGenes"]);

    RuleCatalog catalog(
        catalogJson["RulesVersion"].get<string>(), catalogJson["TargetGenes"].get<vector<string>>(),
        catalogJson["ReferenceAllele"].get<string>(), decodeConfidenceModel(catalogJson["ConfidenceModel"]));

    // Aliases are needed before rules and evidence rows are keyed by drug
    loadSupportedDrugs(catalogJson, catalog);
    loadAlleleDefinitions(catalogJson, catalog);
    loadGeneModels(catalogJson, catalog);
    loadRiskRules(catalogJson, catalog);
    loadEvidence(catalogJson, catalog);
    loadCalibrationBins(catalogJson, catalog);

    catalog.assertConsistency();
    return catalog;
}

RuleCatalog loadRuleCatalog(const string& catalogPath)
{
    TextInputFile catalogFile(catalogPath);
    Json catalogJson;
    try
    {
        catalogFile.stream() >> catalogJson;
    }
    catch (const Json::parse_error& e)
    {
        throw std::runtime_error("Rule catalog " + catalogPath + " is not valid JSON: " + e.what());
    }

    RuleCatalog catalog = decodeRuleCatalog(catalogJson);
    spdlog::info(
        "Loaded rule catalog {} with {} risk rules for {} target genes", catalog.version(),
        add_commas_at_thousands(static_cast<unsigned long>(catalog.riskRuleCount())), catalog.targetGenes().size());

    return catalog;
}

}
