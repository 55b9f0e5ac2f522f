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

#include "core/Common.hh"

#include <stdexcept>

#include <boost/algorithm/string.hpp>

using std::string;

namespace pgxrisk
{

Phenotype decodePhenotype(const string& encoding)
{
    if (encoding == "PM" || encoding == "Poor Metabolizer" || encoding == "Poor Function")
    {
        return Phenotype::kPM;
    }
    if (encoding == "IM" || encoding == "Intermediate Metabolizer" || encoding == "Decreased Function")
    {
        return Phenotype::kIM;
    }
    if (encoding == "NM" || encoding == "Normal Metabolizer" || encoding == "Normal Function")
    {
        return Phenotype::kNM;
    }
    if (encoding == "RM" || encoding == "Rapid Metabolizer" || encoding == "Increased Function")
    {
        return Phenotype::kRM;
    }
    if (encoding == "URM" || encoding == "Ultrarapid Metabolizer")
    {
        return Phenotype::kURM;
    }
    if (encoding == "Unknown")
    {
        return Phenotype::kUnknown;
    }

    throw std::logic_error("Encountered invalid phenotype: " + encoding);
}

string encodeFullPhenotype(Phenotype phenotype)
{
    switch (phenotype)
    {
    case Phenotype::kPM:
        return "Poor Metabolizer";
    case Phenotype::kIM:
        return "Intermediate Metabolizer";
    case Phenotype::kNM:
        return "Normal Metabolizer";
    case Phenotype::kRM:
        return "Rapid Metabolizer";
    case Phenotype::kURM:
        return "Ultrarapid Metabolizer";
    case Phenotype::kUnknown:
        return "Unknown";
    }

    return "Unknown";
}

InhibitorStrength decodeInhibitorStrength(const string& encoding)
{
    const string lowered = boost::algorithm::to_lower_copy(encoding);
    if (lowered == "strong")
    {
        return InhibitorStrength::kStrong;
    }
    if (lowered == "moderate")
    {
        return InhibitorStrength::kModerate;
    }
    if (lowered == "weak")
    {
        return InhibitorStrength::kWeak;
    }
    if (lowered == "none")
    {
        return InhibitorStrength::kNone;
    }

    throw std::logic_error("Encountered invalid inhibitor strength: " + encoding);
}

int strengthRank(InhibitorStrength strength) { return static_cast<int>(strength); }

RiskLabel decodeRiskLabel(const string& encoding)
{
    if (encoding == "Safe")
    {
        return RiskLabel::kSafe;
    }
    if (encoding == "Adjust Dosage")
    {
        return RiskLabel::kAdjustDosage;
    }
    if (encoding == "Toxic")
    {
        return RiskLabel::kToxic;
    }
    if (encoding == "Ineffective")
    {
        return RiskLabel::kIneffective;
    }
    if (encoding == "Unknown")
    {
        return RiskLabel::kUnknown;
    }

    throw std::logic_error("Encountered invalid risk label: " + encoding);
}

Severity decodeSeverity(const string& encoding)
{
    if (encoding == "none")
    {
        return Severity::kNone;
    }
    if (encoding == "low")
    {
        return Severity::kLow;
    }
    if (encoding == "moderate")
    {
        return Severity::kModerate;
    }
    if (encoding == "high")
    {
        return Severity::kHigh;
    }
    if (encoding == "critical")
    {
        return Severity::kCritical;
    }

    throw std::logic_error("Encountered invalid severity: " + encoding);
}

int severityRank(Severity severity) { return static_cast<int>(severity); }

EvidenceTier decodeEvidenceTier(const string& encoding)
{
    const string upper = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(encoding));
    if (upper == "1A")
    {
        return EvidenceTier::k1A;
    }
    if (upper == "1B")
    {
        return EvidenceTier::k1B;
    }
    if (upper == "2A")
    {
        return EvidenceTier::k2A;
    }
    if (upper == "2B")
    {
        return EvidenceTier::k2B;
    }
    if (upper == "3")
    {
        return EvidenceTier::k3;
    }
    if (upper == "4")
    {
        return EvidenceTier::k4;
    }
    if (upper == "NONE")
    {
        return EvidenceTier::kNone;
    }

    throw std::logic_error("Encountered invalid evidence level: " + encoding);
}

AlleleFunction decodeAlleleFunction(const string& encoding)
{
    const string lowered = boost::algorithm::to_lower_copy(encoding);
    if (lowered == "no function")
    {
        return AlleleFunction::kNoFunction;
    }
    if (lowered == "decreased function")
    {
        return AlleleFunction::kDecreased;
    }
    if (lowered == "normal function")
    {
        return AlleleFunction::kNormal;
    }
    if (lowered == "increased function")
    {
        return AlleleFunction::kIncreased;
    }
    if (lowered == "uncertain function" || lowered.empty())
    {
        return AlleleFunction::kUncertain;
    }

    throw std::logic_error("Encountered invalid allele function: " + encoding);
}

int alleleImpactRank(AlleleFunction function)
{
    switch (function)
    {
    case AlleleFunction::kNoFunction:
        return 4;
    case AlleleFunction::kDecreased:
        return 3;
    case AlleleFunction::kIncreased:
        return 2;
    case AlleleFunction::kUncertain:
        return 1;
    case AlleleFunction::kNormal:
        return 0;
    }

    return 0;
}

std::ostream& operator<<(std::ostream& out, Phenotype phenotype)
{
    switch (phenotype)
    {
    case Phenotype::kPM:
        out << "PM";
        break;
    case Phenotype::kIM:
        out << "IM";
        break;
    case Phenotype::kNM:
        out << "NM";
        break;
    case Phenotype::kRM:
        out << "RM";
        break;
    case Phenotype::kURM:
        out << "URM";
        break;
    case Phenotype::kUnknown:
        out << "Unknown";
        break;
    }

    return out;
}

std::ostream& operator<<(std::ostream& out, InhibitorStrength strength)
{
    switch (strength)
    {
    case InhibitorStrength::kNone:
        out << "none";
        break;
    case InhibitorStrength::kWeak:
        out << "weak";
        break;
    case InhibitorStrength::kModerate:
        out << "moderate";
        break;
    case InhibitorStrength::kStrong:
        out << "strong";
        break;
    }

    return out;
}

std::ostream& operator<<(std::ostream& out, RiskLabel label)
{
    switch (label)
    {
    case RiskLabel::kSafe:
        out << "Safe";
        break;
    case RiskLabel::kAdjustDosage:
        out << "Adjust Dosage";
        break;
    case RiskLabel::kToxic:
        out << "Toxic";
        break;
    case RiskLabel::kIneffective:
        out << "Ineffective";
        break;
    case RiskLabel::kUnknown:
        out << "Unknown";
        break;
    }

    return out;
}

std::ostream& operator<<(std::ostream& out, Severity severity)
{
    switch (severity)
    {
    case Severity::kNone:
        out << "none";
        break;
    case Severity::kLow:
        out << "low";
        break;
    case Severity::kModerate:
        out << "moderate";
        break;
    case Severity::kHigh:
        out << "high";
        break;
    case Severity::kCritical:
        out << "critical";
        break;
    }

    return out;
}

std::ostream& operator<<(std::ostream& out, Zygosity zygosity)
{
    switch (zygosity)
    {
    case Zygosity::kHeterozygous:
        out << "heterozygous";
        break;
    case Zygosity::kHomozygous:
        out << "homozygous";
        break;
    }

    return out;
}

std::ostream& operator<<(std::ostream& out, GenotypeClass genotypeClass)
{
    switch (genotypeClass)
    {
    case GenotypeClass::kHomRef:
        out << "HomRef";
        break;
    case GenotypeClass::kHet:
        out << "Het";
        break;
    case GenotypeClass::kHomAlt:
        out << "HomAlt";
        break;
    }

    return out;
}

std::ostream& operator<<(std::ostream& out, EvidenceTier tier)
{
    switch (tier)
    {
    case EvidenceTier::k1A:
        out << "1A";
        break;
    case EvidenceTier::k1B:
        out << "1B";
        break;
    case EvidenceTier::k2A:
        out << "2A";
        break;
    case EvidenceTier::k2B:
        out << "2B";
        break;
    case EvidenceTier::k3:
        out << "3";
        break;
    case EvidenceTier::k4:
        out << "4";
        break;
    case EvidenceTier::kNone:
        out << "none";
        break;
    }

    return out;
}

std::ostream& operator<<(std::ostream& out, AlleleFunction function)
{
    switch (function)
    {
    case AlleleFunction::kNoFunction:
        out << "No function";
        break;
    case AlleleFunction::kDecreased:
        out << "Decreased function";
        break;
    case AlleleFunction::kNormal:
        out << "Normal function";
        break;
    case AlleleFunction::kIncreased:
        out << "Increased function";
        break;
    case AlleleFunction::kUncertain:
        out << "Uncertain function";
        break;
    }

    return out;
}

}
