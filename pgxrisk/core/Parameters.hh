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

namespace pgxrisk
{

enum class LogLevel
{
    kTrace,
    kDebug,
    kInfo,
    kWarn,
    kError
};

class InputPaths
{
public:
    InputPaths(
        std::string vcf, std::string catalog, std::string pharmgkbAnnotations, std::string pharmgkbVariantAnnotations)
        : vcf_(std::move(vcf))
        , catalog_(std::move(catalog))
        , pharmgkbAnnotations_(std::move(pharmgkbAnnotations))
        , pharmgkbVariantAnnotations_(std::move(pharmgkbVariantAnnotations))
    {
    }

    const std::string& vcf() const { return vcf_; }
    const std::string& catalog() const { return catalog_; }
    // Empty when no PharmGKB annotation table was supplied
    const std::string& pharmgkbAnnotations() const { return pharmgkbAnnotations_; }
    const std::string& pharmgkbVariantAnnotations() const { return pharmgkbVariantAnnotations_; }

private:
    std::string vcf_;
    std::string catalog_;
    std::string pharmgkbAnnotations_;
    std::string pharmgkbVariantAnnotations_;
};

class OutputPaths
{
public:
    explicit OutputPaths(std::string json)
        : json_(std::move(json))
    {
    }

    const std::string& json() const { return json_; }

private:
    std::string json_;
};

class AnalysisParameters
{
public:
    AnalysisParameters(double minQual, bool includeDecisionTrace)
        : minQual_(minQual)
        , includeDecisionTrace_(includeDecisionTrace)
    {
    }

    double minQual() const { return minQual_; }
    bool includeDecisionTrace() const { return includeDecisionTrace_; }

private:
    double minQual_;
    bool includeDecisionTrace_;
};

class ProgramParameters
{
public:
    ProgramParameters(
        InputPaths inputPaths, OutputPaths outputPaths, AnalysisParameters analysisParams, std::string patientId,
        std::vector<std::string> drugs, std::vector<std::string> concurrentMedications,
        boost::optional<std::string> timestamp, LogLevel logLevel)
        : inputPaths_(std::move(inputPaths))
        , outputPaths_(std::move(outputPaths))
        , analysisParams_(analysisParams)
        , patientId_(std::move(patientId))
        , drugs_(std::move(drugs))
        , concurrentMedications_(std::move(concurrentMedications))
        , timestamp_(std::move(timestamp))
        , logLevel_(logLevel)
    {
    }

    const InputPaths& inputPaths() const { return inputPaths_; }
    const OutputPaths& outputPaths() const { return outputPaths_; }
    const AnalysisParameters& analysis() const { return analysisParams_; }
    const std::string& patientId() const { return patientId_; }
    const std::vector<std::string>& drugs() const { return drugs_; }
    const std::vector<std::string>& concurrentMedications() const { return concurrentMedications_; }
    const boost::optional<std::string>& timestamp() const { return timestamp_; }
    LogLevel logLevel() const { return logLevel_; }

private:
    InputPaths inputPaths_;
    OutputPaths outputPaths_;
    AnalysisParameters analysisParams_;
    std::string patientId_;
    std::vector<std::string> drugs_;
    std::vector<std::string> concurrentMedications_;
    boost::optional<std::string> timestamp_;
    LogLevel logLevel_;
};

}
