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

#include <iostream>
#include <sstream>
#include <string>

namespace pgxrisk
{

enum class Phenotype
{
    kPM,
    kIM,
    kNM,
    kRM,
    kURM,
    kUnknown
};

enum class InhibitorStrength
{
    kNone,
    kWeak,
    kModerate,
    kStrong
};

enum class RiskLabel
{
    kSafe,
    kAdjustDosage,
    kToxic,
    kIneffective,
    kUnknown
};

enum class Severity
{
    kNone,
    kLow,
    kModerate,
    kHigh,
    kCritical
};

enum class Zygosity
{
    kHeterozygous,
    kHomozygous
};

enum class GenotypeClass
{
    kHomRef,
    kHet,
    kHomAlt
};

// PharmGKB-style levels; kNone marks "no evidence on file"
enum class EvidenceTier
{
    k1A,
    k1B,
    k2A,
    k2B,
    k3,
    k4,
    kNone
};

enum class AlleleFunction
{
    kNoFunction,
    kDecreased,
    kNormal,
    kIncreased,
    kUncertain
};

// Short codes: PM, IM, NM, RM, URM, Unknown
Phenotype decodePhenotype(const std::string& encoding);
std::string encodeFullPhenotype(Phenotype phenotype);

InhibitorStrength decodeInhibitorStrength(const std::string& encoding);
int strengthRank(InhibitorStrength strength);

RiskLabel decodeRiskLabel(const std::string& encoding);
Severity decodeSeverity(const std::string& encoding);
int severityRank(Severity severity);

EvidenceTier decodeEvidenceTier(const std::string& encoding);

AlleleFunction decodeAlleleFunction(const std::string& encoding);
// Loss of function ranks highest
int alleleImpactRank(AlleleFunction function);

std::ostream& operator<<(std::ostream& out, Phenotype phenotype);
std::ostream& operator<<(std::ostream& out, InhibitorStrength strength);
std::ostream& operator<<(std::ostream& out, RiskLabel label);
std::ostream& operator<<(std::ostream& out, Severity severity);
std::ostream& operator<<(std::ostream& out, Zygosity zygosity);
std::ostream& operator<<(std::ostream& out, GenotypeClass genotypeClass);
std::ostream& operator<<(std::ostream& out, EvidenceTier tier);
std::ostream& operator<<(std::ostream& out, AlleleFunction function);

template <typename T> std::string streamToString(const T& streamableObject)
{
    std::stringstream out;
    out << streamableObject;
    return out.str();
}

}
