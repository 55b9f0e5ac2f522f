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

#include "core/RuleCatalog.hh"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <boost/algorithm/string.hpp>

using boost::optional;
using std::string;
using std::to_string;
using std::vector;

namespace pgxrisk
{

static const double kWeightSumTolerance = 1e-6;

static void assertUnitInterval(double value, const string& name)
{
    if (!(value >= 0.0 && value <= 1.0))
    {
        throw std::logic_error(name + " must be within [0, 1], got " + to_string(value));
    }
}

static string normalizeMedicationName(const string& medication)
{
    return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(medication));
}

static std::pair<string, string> makeUnorderedKey(const string& allele1, const string& allele2)
{
    return allele1 <= allele2 ? std::make_pair(allele1, allele2) : std::make_pair(allele2, allele1);
}

void GeneModel::setActivityScore(const string& allele, double score)
{
    if (score < 0.0)
    {
        throw std::logic_error("Activity score of " + gene_ + " " + allele + " must not be negative");
    }
    activityScores_[allele] = score;
}

optional<double> GeneModel::activityScore(const string& allele) const
{
    const auto scoreIt = activityScores_.find(allele);
    if (scoreIt == activityScores_.end())
    {
        return optional<double>();
    }
    return scoreIt->second;
}

void GeneModel::setBreakpoints(vector<PhenotypeBreakpoint> breakpoints)
{
    if (breakpoints.empty())
    {
        throw std::logic_error("Phenotype breakpoints of " + gene_ + " must not be empty");
    }

    for (size_t index = 0; index != breakpoints.size(); ++index)
    {
        const bool isLast = index + 1 == breakpoints.size();
        if (!breakpoints[index].maxScore && !isLast)
        {
            throw std::logic_error("Only the last phenotype breakpoint of " + gene_ + " may omit MaxScore");
        }
        if (breakpoints[index].phenotype == Phenotype::kUnknown)
        {
            throw std::logic_error("Phenotype breakpoints of " + gene_ + " must not call Unknown");
        }
        const auto& maxScore = breakpoints[index].maxScore;
        if (index > 0 && maxScore && *maxScore <= *breakpoints[index - 1].maxScore)
        {
            throw std::logic_error("Phenotype breakpoints of " + gene_ + " must be strictly ascending");
        }
    }

    breakpoints_ = std::move(breakpoints);
}

void GeneModel::addDiplotypePhenotype(const string& allele1, const string& allele2, Phenotype phenotype)
{
    diplotypePhenotypes_[makeUnorderedKey(allele1, allele2)] = phenotype;
}

optional<Phenotype> GeneModel::explicitPhenotype(const string& allele1, const string& allele2) const
{
    const auto phenotypeIt = diplotypePhenotypes_.find(makeUnorderedKey(allele1, allele2));
    if (phenotypeIt == diplotypePhenotypes_.end())
    {
        return optional<Phenotype>();
    }
    return phenotypeIt->second;
}

void GeneModel::addInhibitor(const string& medication, InhibitorStrength strength)
{
    const string name = normalizeMedicationName(medication);
    const auto existingIt = inhibitors_.find(name);
    if (existingIt != inhibitors_.end() && existingIt->second != strength)
    {
        throw std::logic_error(
            "Inhibitor " + name + " of " + gene_ + " is listed as both " + streamToString(existingIt->second)
            + " and " + streamToString(strength));
    }
    inhibitors_[name] = strength;
}

InhibitorStrength GeneModel::inhibitorStrength(const string& medication) const
{
    const auto strengthIt = inhibitors_.find(normalizeMedicationName(medication));
    if (strengthIt == inhibitors_.end())
    {
        return InhibitorStrength::kNone;
    }
    return strengthIt->second;
}

string deriveFdaRequirement(EvidenceTier tier)
{
    switch (tier)
    {
    case EvidenceTier::k1A:
        return "Required";
    case EvidenceTier::k1B:
        return "Recommended";
    default:
        return "None";
    }
}

static void assertValidConfidenceModel(const ConfidenceModel& model)
{
    const ConfidenceWeights& weights = model.weights;
    for (double weight : { weights.evidence, weights.genotype, weights.phenotype, weights.ruleCoverage })
    {
        if (weight < 0.0)
        {
            throw std::logic_error("Confidence weights must be non-negative");
        }
    }

    const double weightSum = weights.evidence + weights.genotype + weights.phenotype + weights.ruleCoverage;
    if (std::abs(weightSum - 1.0) > kWeightSumTolerance)
    {
        throw std::logic_error("Confidence weights must sum to 1, got " + to_string(weightSum));
    }

    const GenotypeComponentModel& genotype = model.genotype;
    const double genotypeWeightSum = genotype.qualityWeight + genotype.completenessWeight + genotype.supportWeight;
    if (genotype.qualityWeight < 0.0 || genotype.completenessWeight < 0.0 || genotype.supportWeight < 0.0
        || std::abs(genotypeWeightSum - 1.0) > kWeightSumTolerance)
    {
        throw std::logic_error("Genotype component weights must be non-negative and sum to 1");
    }
    assertUnitInterval(genotype.baselineSupport, "BaselineSupport");
    assertUnitInterval(genotype.supportPerVariant, "SupportPerVariant");

    assertUnitInterval(model.phenotype.mapped, "Phenotype.Mapped");
    assertUnitInterval(model.phenotype.ambiguous, "Phenotype.Ambiguous");
    assertUnitInterval(model.phenotype.unknown, "Phenotype.Unknown");
    assertUnitInterval(model.ruleCoverageFallback, "RuleCoverageFallback");
    assertUnitInterval(model.noEvidence, "NoEvidence");

    // Higher tiers must never score below lower ones
    double previousValue = 1.0;
    for (EvidenceTier tier : { EvidenceTier::k1A, EvidenceTier::k1B, EvidenceTier::k2A, EvidenceTier::k2B,
                               EvidenceTier::k3, EvidenceTier::k4 })
    {
        const auto valueIt = model.evidenceByTier.find(tier);
        if (valueIt == model.evidenceByTier.end())
        {
            throw std::logic_error("Evidence confidence is missing level " + streamToString(tier));
        }
        assertUnitInterval(valueIt->second, "Evidence confidence of level " + streamToString(tier));
        if (valueIt->second > previousValue)
        {
            throw std::logic_error("Evidence confidence must not increase as the evidence level drops");
        }
        previousValue = valueIt->second;
    }

    if (model.noEvidence > previousValue)
    {
        throw std::logic_error("NoEvidence confidence must not exceed the confidence of level 4");
    }
}

RuleCatalog::RuleCatalog(
    string version, vector<string> targetGenes, string referenceAllele, ConfidenceModel confidenceModel)
    : version_(std::move(version))
    , targetGenes_(std::move(targetGenes))
    , referenceAllele_(std::move(referenceAllele))
    , confidenceModel_(std::move(confidenceModel))
{
    if (version_.empty())
    {
        throw std::logic_error("Rule catalog version must not be empty");
    }
    if (targetGenes_.empty())
    {
        throw std::logic_error("Rule catalog must list at least one target gene");
    }
    if (referenceAllele_.empty())
    {
        throw std::logic_error("Rule catalog reference allele must not be empty");
    }

    assertValidConfidenceModel(confidenceModel_);

    phenoconversionPenalties_[InhibitorStrength::kNone] = 0.0;
    phenoconversionPenalties_[InhibitorStrength::kWeak] = 0.02;
    phenoconversionPenalties_[InhibitorStrength::kModerate] = 0.05;
    phenoconversionPenalties_[InhibitorStrength::kStrong] = 0.10;
}

bool RuleCatalog::isTargetGene(const string& gene) const
{
    return std::find(targetGenes_.begin(), targetGenes_.end(), gene) != targetGenes_.end();
}

void RuleCatalog::addSupportedDrug(const string& drug, const string& gene)
{
    supportedDrugs_[boost::algorithm::to_upper_copy(drug)] = gene;
}

void RuleCatalog::addDrugAlias(const string& alias, const string& drug)
{
    drugAliases_[boost::algorithm::to_upper_copy(alias)] = boost::algorithm::to_upper_copy(drug);
}

string RuleCatalog::normalizeDrugName(const string& drugName) const
{
    const string upper = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(drugName));
    const auto aliasIt = drugAliases_.find(upper);
    if (aliasIt != drugAliases_.end())
    {
        return aliasIt->second;
    }
    return upper;
}

optional<string> RuleCatalog::primaryGene(const string& normalizedDrug) const
{
    const auto drugIt = supportedDrugs_.find(normalizedDrug);
    if (drugIt == supportedDrugs_.end())
    {
        return optional<string>();
    }
    return drugIt->second;
}

void RuleCatalog::addAlleleDefinition(AlleleDefinition definition)
{
    if (allelesByRsid_.count(definition.rsid) != 0)
    {
        throw std::logic_error("Allele definition for " + definition.rsid + " is listed more than once");
    }
    const string rsid = definition.rsid;
    allelesByRsid_.emplace(rsid, std::move(definition));
}

optional<AlleleDefinition> RuleCatalog::findAlleleByRsid(const string& rsid) const
{
    const auto alleleIt = allelesByRsid_.find(rsid);
    if (alleleIt == allelesByRsid_.end())
    {
        return optional<AlleleDefinition>();
    }
    return alleleIt->second;
}

optional<AlleleDefinition> RuleCatalog::findAllele(const string& gene, const string& starAllele) const
{
    for (const auto& rsidAndAllele : allelesByRsid_)
    {
        const AlleleDefinition& definition = rsidAndAllele.second;
        if (definition.gene == gene && definition.starAllele == starAllele)
        {
            return definition;
        }
    }
    return optional<AlleleDefinition>();
}

GeneModel& RuleCatalog::mutableGeneModel(const string& gene)
{
    auto modelIt = geneModels_.find(gene);
    if (modelIt == geneModels_.end())
    {
        modelIt = geneModels_.emplace(gene, GeneModel(gene)).first;
    }
    return modelIt->second;
}

const GeneModel* RuleCatalog::findGeneModel(const string& gene) const
{
    const auto modelIt = geneModels_.find(gene);
    return modelIt == geneModels_.end() ? nullptr : &modelIt->second;
}

void RuleCatalog::addRiskRule(RiskRule rule)
{
    RuleKey key(rule.gene, rule.phenotype, rule.drug);
    if (riskRules_.count(key) != 0)
    {
        throw std::logic_error(
            "Risk rule for " + rule.gene + " / " + streamToString(rule.phenotype) + " / " + rule.drug
            + " is listed more than once");
    }
    riskRules_.emplace(std::move(key), std::move(rule));
}

optional<RiskRule> RuleCatalog::findRiskRule(const string& gene, Phenotype phenotype, const string& drug) const
{
    const auto ruleIt = riskRules_.find(RuleKey(gene, phenotype, drug));
    if (ruleIt == riskRules_.end())
    {
        return optional<RiskRule>();
    }
    return ruleIt->second;
}

void RuleCatalog::addDynamicEvidence(EvidenceAnnotation annotation)
{
    GeneDrugKey key(annotation.gene, annotation.drug);
    auto existingIt = dynamicEvidence_.find(key);
    if (existingIt == dynamicEvidence_.end())
    {
        dynamicEvidence_.emplace(std::move(key), std::move(annotation));
        return;
    }

    // EvidenceTier is ordered best-first
    if (annotation.tier < existingIt->second.tier)
    {
        existingIt->second = std::move(annotation);
        return;
    }

    existingIt->second.phenotypeCategories.insert(
        annotation.phenotypeCategories.begin(), annotation.phenotypeCategories.end());
}

bool RuleCatalog::addAnnotationSentence(const string& gene, const string& drug, const string& sentence)
{
    const auto annotationIt = dynamicEvidence_.find(GeneDrugKey(gene, drug));
    if (annotationIt == dynamicEvidence_.end())
    {
        return false;
    }

    vector<string>& sentences = annotationIt->second.annotationSentences;
    if (std::find(sentences.begin(), sentences.end(), sentence) != sentences.end())
    {
        return false;
    }

    sentences.push_back(sentence);
    return true;
}

optional<EvidenceAnnotation> RuleCatalog::findDynamicEvidence(const string& gene, const string& drug) const
{
    const auto annotationIt = dynamicEvidence_.find(GeneDrugKey(gene, drug));
    if (annotationIt == dynamicEvidence_.end())
    {
        return optional<EvidenceAnnotation>();
    }
    return annotationIt->second;
}

void RuleCatalog::addCuratedReference(EvidenceAnnotation annotation)
{
    GeneDrugKey key(annotation.gene, annotation.drug);
    if (curatedReferences_.count(key) != 0)
    {
        throw std::logic_error("Curated reference for " + key.first + " / " + key.second + " is listed more than once");
    }
    curatedReferences_.emplace(std::move(key), std::move(annotation));
}

optional<EvidenceAnnotation> RuleCatalog::findCuratedReference(const string& gene, const string& drug) const
{
    const auto referenceIt = curatedReferences_.find(GeneDrugKey(gene, drug));
    if (referenceIt == curatedReferences_.end())
    {
        return optional<EvidenceAnnotation>();
    }
    return referenceIt->second;
}

void RuleCatalog::setPhenoconversionPenalty(InhibitorStrength strength, double penalty)
{
    assertUnitInterval(penalty, "Phenoconversion penalty for " + streamToString(strength));
    phenoconversionPenalties_[strength] = penalty;
}

double RuleCatalog::phenoconversionPenalty(InhibitorStrength strength) const
{
    const auto penaltyIt = phenoconversionPenalties_.find(strength);
    return penaltyIt == phenoconversionPenalties_.end() ? 0.0 : penaltyIt->second;
}

void RuleCatalog::setCalibrationBins(vector<CalibrationBin> bins)
{
    std::sort(
        bins.begin(), bins.end(), [](const CalibrationBin& a, const CalibrationBin& b) { return a.lower < b.lower; });

    if (!bins.empty())
    {
        if (bins.front().lower != 0.0 || bins.back().upper != 1.0)
        {
            throw std::logic_error("Calibration bins must cover the whole [0, 1] interval");
        }
    }

    for (size_t index = 0; index != bins.size(); ++index)
    {
        CalibrationBin& bin = bins[index];
        if (index > 0)
        {
            const CalibrationBin& previous = bins[index - 1];
            if (std::abs(previous.upper - bin.lower) > kWeightSumTolerance)
            {
                throw std::logic_error("Calibration bins must be contiguous and non-overlapping");
            }
            if (bin.calibrated < previous.calibrated)
            {
                throw std::logic_error("Calibration bins must map to non-decreasing calibrated scores");
            }
            // Gaps within tolerance are closed so every score in [0, 1] falls into exactly one bin
            bin.lower = previous.upper;
        }

        if (!(bin.lower < bin.upper))
        {
            throw std::logic_error("Calibration bin lower bound must be below its upper bound");
        }
        assertUnitInterval(bin.calibrated, "Calibrated score");
    }

    calibrationBins_ = std::move(bins);
}

void RuleCatalog::assertConsistency() const
{
    for (const auto& drugAndGene : supportedDrugs_)
    {
        if (!isTargetGene(drugAndGene.second))
        {
            throw std::logic_error(
                "Drug " + drugAndGene.first + " maps to " + drugAndGene.second + " which is not a target gene");
        }
    }

    for (const auto& aliasAndDrug : drugAliases_)
    {
        if (supportedDrugs_.count(aliasAndDrug.second) == 0)
        {
            throw std::logic_error(
                "Alias " + aliasAndDrug.first + " points to unsupported drug " + aliasAndDrug.second);
        }
    }

    for (const auto& keyAndRule : riskRules_)
    {
        if (!isTargetGene(keyAndRule.second.gene))
        {
            throw std::logic_error("Risk rule refers to non-target gene " + keyAndRule.second.gene);
        }
    }

    for (const string& gene : targetGenes_)
    {
        const GeneModel* model = findGeneModel(gene);
        if (model == nullptr || model->breakpoints().empty())
        {
            throw std::logic_error("Target gene " + gene + " has no phenotype breakpoints");
        }
        if (!model->activityScore(referenceAllele_))
        {
            throw std::logic_error("Target gene " + gene + " has no activity score for " + referenceAllele_);
        }
    }
}

}
