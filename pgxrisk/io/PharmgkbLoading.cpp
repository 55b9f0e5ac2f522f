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

#include <algorithm>
#include <map>
#include <stdexcept>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "io/StringUtils.hh"
#include "io/TextInputFile.hh"
#include "spdlog/spdlog.h"

using std::map;
using std::string;
using std::vector;

namespace pgxrisk
{

static const string kGeneColumn = "Gene";
static const string kDrugsColumn = "Drug(s)";
static const string kLevelColumn = "Level of Evidence";
static const string kCategoryColumn = "Phenotype Category";
static const string kSentenceColumn = "Sentence";

static vector<string> splitTabs(const string& line)
{
    vector<string> fields;
    boost::split(fields, line, boost::is_any_of("\t"));
    for (auto& field : fields)
    {
        boost::algorithm::trim(field);
    }
    return fields;
}

static map<string, size_t> decodeHeader(std::istream& tsvStream, const vector<string>& requiredColumns)
{
    string line;
    if (!std::getline(tsvStream, line))
    {
        throw std::runtime_error("PharmGKB annotation table is empty");
    }

    map<string, size_t> columnIndexes;
    const vector<string> header = splitTabs(line);
    for (size_t index = 0; index != header.size(); ++index)
    {
        columnIndexes[header[index]] = index;
    }
    for (const string& column : requiredColumns)
    {
        if (columnIndexes.find(column) == columnIndexes.end())
        {
            throw std::runtime_error("PharmGKB annotation table is missing column " + column);
        }
    }

    return columnIndexes;
}

static vector<string> splitDrugs(const string& drugs)
{
    vector<string> drugNames;
    boost::split(drugNames, drugs, boost::is_any_of(";"));
    for (auto& drugName : drugNames)
    {
        boost::algorithm::trim(drugName);
    }
    drugNames.erase(
        std::remove_if(drugNames.begin(), drugNames.end(), [](const string& name) { return name.empty(); }),
        drugNames.end());
    return drugNames;
}

int loadPharmgkbAnnotations(std::istream& tsvStream, RuleCatalog& catalog)
{
    map<string, size_t> columnIndexes = decodeHeader(tsvStream, { kGeneColumn, kDrugsColumn, kLevelColumn });

    const size_t geneIndex = columnIndexes[kGeneColumn];
    const size_t drugsIndex = columnIndexes[kDrugsColumn];
    const size_t levelIndex = columnIndexes[kLevelColumn];
    const auto categoryIt = columnIndexes.find(kCategoryColumn);

    string line;
    int rowCount = 0;
    int lineNumber = 1;
    while (std::getline(tsvStream, line))
    {
        ++lineNumber;
        const vector<string> fields = splitTabs(line);
        if (fields.size() <= std::max(geneIndex, std::max(drugsIndex, levelIndex)))
        {
            spdlog::debug("Skipping short PharmGKB line {}", lineNumber);
            continue;
        }

        const string& gene = fields[geneIndex];
        const string& drugs = fields[drugsIndex];
        const string& level = fields[levelIndex];
        if (gene.empty() || drugs.empty() || level.empty())
        {
            continue;
        }

        EvidenceTier tier;
        try
        {
            tier = decodeEvidenceTier(level);
        }
        catch (const std::logic_error&)
        {
            spdlog::debug("Skipping PharmGKB line {} with evidence level {}", lineNumber, level);
            continue;
        }

        for (const string& drugName : splitDrugs(drugs))
        {
            // Rows carry no citation of their own so the curated map can supply one
            EvidenceAnnotation annotation;
            annotation.gene = gene;
            annotation.drug = catalog.normalizeDrugName(drugName);
            annotation.tier = tier;
            annotation.fdaRequirement = deriveFdaRequirement(tier);
            annotation.authors = "PharmGKB";
            if (categoryIt != columnIndexes.end() && categoryIt->second < fields.size())
            {
                annotation.clinicalSignificance = fields[categoryIt->second];
                for (const string& category : splitCommaSeparatedList(annotation.clinicalSignificance))
                {
                    annotation.phenotypeCategories.insert(category);
                }
            }
            catalog.addDynamicEvidence(std::move(annotation));
            ++rowCount;
        }
    }

    return rowCount;
}

int loadPharmgkbVariantAnnotations(std::istream& tsvStream, RuleCatalog& catalog)
{
    map<string, size_t> columnIndexes = decodeHeader(tsvStream, { kGeneColumn, kDrugsColumn, kSentenceColumn });
    const size_t geneIndex = columnIndexes[kGeneColumn];
    const size_t drugsIndex = columnIndexes[kDrugsColumn];
    const size_t sentenceIndex = columnIndexes[kSentenceColumn];

    string line;
    int sentenceCount = 0;
    while (std::getline(tsvStream, line))
    {
        const vector<string> fields = splitTabs(line);
        if (fields.size() <= std::max(geneIndex, std::max(drugsIndex, sentenceIndex)))
        {
            continue;
        }

        const string& gene = fields[geneIndex];
        const string& sentence = fields[sentenceIndex];
        if (gene.empty() || sentence.empty())
        {
            continue;
        }

        for (const string& drugName : splitDrugs(fields[drugsIndex]))
        {
            if (catalog.addAnnotationSentence(gene, catalog.normalizeDrugName(drugName), sentence))
            {
                ++sentenceCount;
            }
        }
    }

    return sentenceCount;
}

int loadPharmgkbVariantAnnotations(const string& tsvPath, RuleCatalog& catalog)
{
    TextInputFile tsvFile(tsvPath);
    const int sentenceCount = loadPharmgkbVariantAnnotations(tsvFile.stream(), catalog);
    spdlog::info("Attached {} variant annotation sentences from {}", add_commas_at_thousands(sentenceCount), tsvPath);
    return sentenceCount;
}

int loadPharmgkbAnnotations(const string& tsvPath, RuleCatalog& catalog)
{
    TextInputFile tsvFile(tsvPath);
    const int rowCount = loadPharmgkbAnnotations(tsvFile.stream(), catalog);
    spdlog::info(
        "Loaded {} PharmGKB annotation rows from {} ({} gene-drug pairs on file)", add_commas_at_thousands(rowCount),
        tsvPath, add_commas_at_thousands(static_cast<unsigned long>(catalog.dynamicEvidenceCount())));
    return rowCount;
}

}
