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

#include "io/VariantQualityFilter.hh"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <stdexcept>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "io/StringUtils.hh"
#include "io/TextInputFile.hh"
#include "spdlog/spdlog.h"

using boost::optional;
using std::map;
using std::string;
using std::vector;

namespace pgxrisk
{

static const size_t kMinimalColumnCount = 8;

static map<string, string> parseInfoField(const string& info)
{
    map<string, string> keyValues;
    if (info.empty() || info == ".")
    {
        return keyValues;
    }

    vector<string> items;
    boost::split(items, info, boost::is_any_of(";"));
    for (const string& item : items)
    {
        const auto separatorPos = item.find('=');
        if (separatorPos == string::npos)
        {
            keyValues[boost::algorithm::trim_copy(item)] = "";
        }
        else
        {
            keyValues[boost::algorithm::trim_copy(item.substr(0, separatorPos))]
                = boost::algorithm::trim_copy(item.substr(separatorPos + 1));
        }
    }

    return keyValues;
}

static string lookupInfoValue(const map<string, string>& info, const string& key)
{
    const auto valueIt = info.find(key);
    return valueIt == info.end() ? "" : valueIt->second;
}

static optional<string> extractGenotype(const string& format, const string& sample)
{
    vector<string> formatKeys;
    vector<string> sampleValues;
    boost::split(formatKeys, format, boost::is_any_of(":"));
    boost::split(sampleValues, sample, boost::is_any_of(":"));

    const auto gtIt = std::find(formatKeys.begin(), formatKeys.end(), "GT");
    const size_t gtIndex = static_cast<size_t>(gtIt - formatKeys.begin());
    if (gtIt == formatKeys.end() || gtIndex >= sampleValues.size())
    {
        return optional<string>();
    }

    string genotype = sampleValues[gtIndex];
    std::replace(genotype.begin(), genotype.end(), '|', '/');
    return genotype;
}

optional<GenotypeClass> classifyGenotype(const string& genotype)
{
    vector<string> alleles;
    boost::split(alleles, genotype, boost::is_any_of("/|"));
    if (alleles.size() != 2)
    {
        return optional<GenotypeClass>();
    }

    const auto isDigit = [](unsigned char c) { return std::isdigit(c) != 0; };
    vector<int> alleleIndexes;
    for (const string& allele : alleles)
    {
        if (allele.empty() || allele.size() > 6 || !std::all_of(allele.begin(), allele.end(), isDigit))
        {
            return optional<GenotypeClass>();
        }
        alleleIndexes.push_back(std::stoi(allele));
    }

    if (alleleIndexes[0] == 0 && alleleIndexes[1] == 0)
    {
        return GenotypeClass::kHomRef;
    }
    if (alleleIndexes[0] == alleleIndexes[1])
    {
        return GenotypeClass::kHomAlt;
    }
    return GenotypeClass::kHet;
}

// Gene and star allele come from INFO first and from the rsID table otherwise
static void annotateVariant(Variant& variant, const map<string, string>& info, const RuleCatalog& catalog)
{
    variant.gene = lookupInfoValue(info, "GENE");
    variant.starAllele = lookupInfoValue(info, "STAR");

    const optional<AlleleDefinition> definition = catalog.findAlleleByRsid(variant.rsid);
    if (definition)
    {
        if (variant.gene.empty())
        {
            variant.gene = definition->gene;
        }
        if (variant.starAllele.empty())
        {
            variant.starAllele = definition->starAllele;
        }
    }

    if (definition && definition->gene == variant.gene && definition->starAllele == variant.starAllele)
    {
        variant.function = definition->function;
        return;
    }

    const optional<AlleleDefinition> alleleByName = catalog.findAllele(variant.gene, variant.starAllele);
    variant.function = alleleByName ? alleleByName->function : AlleleFunction::kUncertain;
}

static optional<Variant> decodeDataLine(const vector<string>& fields)
{
    Variant variant;
    variant.chrom = fields[0];
    variant.ref = fields[3];
    variant.alt = fields[4];
    variant.filter = fields[6];

    try
    {
        variant.position = boost::lexical_cast<int64_t>(fields[1]);
        variant.qual = fields[5] == "." ? 0.0 : boost::lexical_cast<double>(fields[5]);
    }
    catch (const boost::bad_lexical_cast&)
    {
        return optional<Variant>();
    }

    if (!std::isfinite(variant.qual))
    {
        return optional<Variant>();
    }

    if (variant.chrom.empty() || variant.position <= 0)
    {
        return optional<Variant>();
    }

    variant.rsid = fields[2] == "." ? "" : fields[2];
    return variant;
}

FilteredVariants filterVariants(std::istream& vcfStream, const RuleCatalog& catalog, double minQual)
{
    FilteredVariants result;
    bool headerSeen = false;
    int lineNumber = 0;

    string line;
    while (std::getline(vcfStream, line))
    {
        ++lineNumber;
        boost::algorithm::trim_right(line);
        if (line.empty() || boost::algorithm::starts_with(line, "##"))
        {
            continue;
        }
        if (boost::algorithm::starts_with(line, "#CHROM"))
        {
            headerSeen = true;
            continue;
        }
        if (!headerSeen)
        {
            continue;
        }

        ++result.dataLineCount;
        vector<string> fields;
        boost::split(fields, line, boost::is_any_of("\t"));
        if (fields.size() < kMinimalColumnCount)
        {
            spdlog::debug("VCF line {}: expected at least {} columns, skipping", lineNumber, kMinimalColumnCount);
            ++result.skipped.malformed;
            continue;
        }

        optional<Variant> variant = decodeDataLine(fields);
        if (!variant)
        {
            spdlog::debug("VCF line {}: unparseable position or quality, skipping", lineNumber);
            ++result.skipped.malformed;
            continue;
        }

        if (variant->qual < minQual)
        {
            spdlog::debug("VCF line {}: quality {} below threshold {}, skipping", lineNumber, variant->qual, minQual);
            ++result.skipped.lowQuality;
            continue;
        }

        optional<string> genotype;
        if (fields.size() >= 10)
        {
            genotype = extractGenotype(fields[8], fields[9]);
        }
        const optional<GenotypeClass> genotypeClass
            = genotype ? classifyGenotype(*genotype) : optional<GenotypeClass>();
        if (!genotypeClass)
        {
            spdlog::debug("VCF line {}: genotype cannot be classified, skipping", lineNumber);
            ++result.skipped.unclassifiedGenotype;
            continue;
        }
        variant->genotype = *genotype;
        variant->genotypeClass = *genotypeClass;

        const map<string, string> info = parseInfoField(fields[7]);
        if (variant->rsid.empty())
        {
            variant->rsid = lookupInfoValue(info, "RS");
        }
        annotateVariant(*variant, info, catalog);
        if (variant->rsid.empty())
        {
            variant->rsid = "chr" + variant->chrom + ":" + std::to_string(variant->position);
        }

        if (!catalog.isTargetGene(variant->gene))
        {
            spdlog::debug("VCF line {}: gene '{}' is not a target gene, skipping", lineNumber, variant->gene);
            ++result.skipped.offTarget;
            continue;
        }

        result.variants.push_back(std::move(*variant));
    }

    const int parsedLineCount = result.dataLineCount - result.skipped.malformed;
    result.parsingSuccess = headerSeen && (result.dataLineCount == 0 || parsedLineCount > 0);
    if (!headerSeen)
    {
        spdlog::warn("VCF input has no #CHROM header line");
    }

    return result;
}

FilteredVariants filterVariantsFromFile(const string& vcfPath, const RuleCatalog& catalog, double minQual)
{
    TextInputFile vcfFile(vcfPath);
    FilteredVariants result = filterVariants(vcfFile.stream(), catalog, minQual);
    spdlog::info(
        "Retained {} of {} VCF records from {} ({} skipped)",
        add_commas_at_thousands(static_cast<int>(result.variants.size())),
        add_commas_at_thousands(result.dataLineCount), vcfPath, add_commas_at_thousands(result.skipped.total()));
    return result;
}

double calculateVcfQualityScore(const vector<Variant>& variants)
{
    if (variants.empty())
    {
        return 0.0;
    }

    double qualitySum = 0.0;
    for (const Variant& variant : variants)
    {
        qualitySum += variant.qual;
    }
    const double meanQuality = qualitySum / variants.size();

    return 0.7 * std::min(100.0, meanQuality) + 30.0 * calculateAnnotationCompleteness(variants);
}

double calculateAnnotationCompleteness(const vector<Variant>& variants)
{
    if (variants.empty())
    {
        return 1.0;
    }

    const auto annotatedCount = std::count_if(variants.begin(), variants.end(), [](const Variant& variant) {
        return !variant.gene.empty() && !variant.starAllele.empty();
    });
    return static_cast<double>(annotatedCount) / variants.size();
}

}
