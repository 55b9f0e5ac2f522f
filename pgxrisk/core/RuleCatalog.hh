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

#include <map>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "core/Common.hh"

namespace pgxrisk
{

struct AlleleDefinition
{
    std::string rsid;
    std::string gene;
    std::string starAllele;
    AlleleFunction function = AlleleFunction::kUncertain;
};

// Sums of allele activity scores at or below maxScore call this phenotype;
// the last breakpoint may be open-ended
struct PhenotypeBreakpoint
{
    Phenotype phenotype;
    boost::optional<double> maxScore;
};

class GeneModel
{
public:
    explicit GeneModel(std::string gene)
        : gene_(std::move(gene))
    {
    }

    const std::string& gene() const { return gene_; }

    void setActivityScore(const std::string& allele, double score);
    boost::optional<double> activityScore(const std::string& allele) const;
    const std::map<std::string, double>& activityScores() const { return activityScores_; }

    void setBreakpoints(std::vector<PhenotypeBreakpoint> breakpoints);
    const std::vector<PhenotypeBreakpoint>& breakpoints() const { return breakpoints_; }

    // Explicit diplotype calls are unordered: *1/*4 and *4/*1 are the same key
    void addDiplotypePhenotype(const std::string& allele1, const std::string& allele2, Phenotype phenotype);
    boost::optional<Phenotype> explicitPhenotype(const std::string& allele1, const std::string& allele2) const;

    void addInhibitor(const std::string& medication, InhibitorStrength strength);
    InhibitorStrength inhibitorStrength(const std::string& medication) const;
    bool supportsPhenoconversion() const { return !inhibitors_.empty(); }

private:
    std::string gene_;
    std::map<std::string, double> activityScores_;
    std::vector<PhenotypeBreakpoint> breakpoints_;
    std::map<std::pair<std::string, std::string>, Phenotype> diplotypePhenotypes_;
    std::map<std::string, InhibitorStrength> inhibitors_;
};

struct RiskRule
{
    std::string gene;
    Phenotype phenotype;
    std::string drug;
    RiskLabel riskLabel;
    Severity severity;
    std::string action;
    std::vector<std::string> alternatives;
};

struct EvidenceAnnotation
{
    std::string gene;
    std::string drug;
    EvidenceTier tier = EvidenceTier::kNone;
    std::string clinicalSignificance;
    std::string fdaRequirement = "None";
    std::string guideline;
    std::string authors;
    int year = 0;
    std::string pmid;
    std::string doi;
    // PharmGKB phenotype categories of every row for the pair at or below the kept evidence level
    std::set<std::string> phenotypeCategories;
    std::vector<std::string> annotationSentences;
};

// 1A -> Required, 1B -> Recommended, anything else -> None
std::string deriveFdaRequirement(EvidenceTier tier);

struct ConfidenceWeights
{
    double evidence = 0.0;
    double genotype = 0.0;
    double phenotype = 0.0;
    double ruleCoverage = 0.0;
};

struct GenotypeComponentModel
{
    double qualityWeight = 0.0;
    double completenessWeight = 0.0;
    double supportWeight = 0.0;
    // Support credited to a call backed by zero detected variants (wild-type default)
    double baselineSupport = 0.0;
    double supportPerVariant = 0.0;
};

struct PhenotypeComponentModel
{
    double mapped = 0.0;
    double ambiguous = 0.0;
    double unknown = 0.0;
};

struct ConfidenceModel
{
    ConfidenceWeights weights;
    std::map<EvidenceTier, double> evidenceByTier;
    double noEvidence = 0.0;
    GenotypeComponentModel genotype;
    PhenotypeComponentModel phenotype;
    double ruleCoverageFallback = 0.0;
};

struct CalibrationBin
{
    double lower;
    double upper;
    double calibrated;
};

/// \brief Versioned, read-only rule tables shared by every pipeline stage
///
/// A catalog is populated once by the loader and then only ever handed out by const reference.
///
class RuleCatalog
{
public:
    RuleCatalog(
        std::string version, std::vector<std::string> targetGenes, std::string referenceAllele,
        ConfidenceModel confidenceModel);

    const std::string& version() const { return version_; }
    const std::vector<std::string>& targetGenes() const { return targetGenes_; }
    bool isTargetGene(const std::string& gene) const;
    const std::string& referenceAllele() const { return referenceAllele_; }
    std::string defaultDiplotype() const { return referenceAllele_ + "/" + referenceAllele_; }

    void addSupportedDrug(const std::string& drug, const std::string& gene);
    void addDrugAlias(const std::string& alias, const std::string& drug);
    std::string normalizeDrugName(const std::string& drugName) const;
    boost::optional<std::string> primaryGene(const std::string& normalizedDrug) const;
    const std::map<std::string, std::string>& supportedDrugs() const { return supportedDrugs_; }

    void addAlleleDefinition(AlleleDefinition definition);
    boost::optional<AlleleDefinition> findAlleleByRsid(const std::string& rsid) const;
    boost::optional<AlleleDefinition> findAllele(const std::string& gene, const std::string& starAllele) const;

    GeneModel& mutableGeneModel(const std::string& gene);
    const GeneModel* findGeneModel(const std::string& gene) const;

    void addRiskRule(RiskRule rule);
    boost::optional<RiskRule> findRiskRule(const std::string& gene, Phenotype phenotype, const std::string& drug) const;
    size_t riskRuleCount() const { return riskRules_.size(); }

    // Keeps the better-supported row when a (gene, drug) pair is seen twice
    void addDynamicEvidence(EvidenceAnnotation annotation);
    // Appends a new variant-drug annotation sentence to the dynamic row of the pair; false if the pair has no row
    // or already carries the sentence
    bool addAnnotationSentence(const std::string& gene, const std::string& drug, const std::string& sentence);
    boost::optional<EvidenceAnnotation> findDynamicEvidence(const std::string& gene, const std::string& drug) const;
    size_t dynamicEvidenceCount() const { return dynamicEvidence_.size(); }

    void addCuratedReference(EvidenceAnnotation annotation);
    boost::optional<EvidenceAnnotation> findCuratedReference(const std::string& gene, const std::string& drug) const;

    void setPhenoconversionPenalty(InhibitorStrength strength, double penalty);
    double phenoconversionPenalty(InhibitorStrength strength) const;

    void setCalibrationBins(std::vector<CalibrationBin> bins);
    const std::vector<CalibrationBin>& calibrationBins() const { return calibrationBins_; }

    const ConfidenceModel& confidenceModel() const { return confidenceModel_; }

    // Cross-table checks that need the complete catalog
    void assertConsistency() const;

private:
    using RuleKey = std::tuple<std::string, Phenotype, std::string>;
    using GeneDrugKey = std::pair<std::string, std::string>;

    std::string version_;
    std::vector<std::string> targetGenes_;
    std::string referenceAllele_;
    std::map<std::string, std::string> supportedDrugs_;
    std::map<std::string, std::string> drugAliases_;
    std::map<std::string, AlleleDefinition> allelesByRsid_;
    std::map<std::string, GeneModel> geneModels_;
    std::map<RuleKey, RiskRule> riskRules_;
    std::map<GeneDrugKey, EvidenceAnnotation> dynamicEvidence_;
    std::map<GeneDrugKey, EvidenceAnnotation> curatedReferences_;
    std::map<InhibitorStrength, double> phenoconversionPenalties_;
    std::vector<CalibrationBin> calibrationBins_;
    ConfidenceModel confidenceModel_;
};

}
