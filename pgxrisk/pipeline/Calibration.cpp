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

#include "pipeline/Calibration.hh"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include <boost/algorithm/string.hpp>
#include <nlohmann/json.hpp>

using std::string;
using std::vector;

using Json = nlohmann::json;

namespace pgxrisk
{

static double clampToUnitInterval(double value) { return std::max(0.0, std::min(1.0, value)); }

static double roundToHundredths(double value) { return std::round(value * 100.0) / 100.0; }

double PostHocCalibrator::calibrate(double rawScore) const
{
    const double score = clampToUnitInterval(rawScore);
    // Bins are ordered, so the last bin starting at or below the score encloses it
    const CalibrationBin* enclosingBin = nullptr;
    for (const CalibrationBin& bin : bins_)
    {
        if (bin.lower <= score)
        {
            enclosingBin = &bin;
        }
    }

    return roundToHundredths(enclosingBin ? enclosingBin->calibrated : score);
}

vector<LabeledPrediction> decodeLabeledPredictions(std::istream& jsonlStream)
{
    vector<LabeledPrediction> predictions;
    string line;
    int lineNumber = 0;
    while (std::getline(jsonlStream, line))
    {
        ++lineNumber;
        boost::algorithm::trim(line);
        if (line.empty())
        {
            continue;
        }

        Json record;
        try
        {
            record = Json::parse(line);
        }
        catch (const Json::parse_error& e)
        {
            throw std::runtime_error("Line " + std::to_string(lineNumber) + " is not valid JSON: " + e.what());
        }

        if (record.find("confidence") == record.end() || record.find("correct") == record.end())
        {
            throw std::runtime_error(
                "Line " + std::to_string(lineNumber) + " must have fields confidence and correct: " + line);
        }

        const Json& correct = record["correct"];
        const bool isCorrect = correct.is_boolean() ? correct.get<bool>() : correct.get<int>() != 0;
        predictions.push_back({ clampToUnitInterval(record["confidence"].get<double>()), isCorrect });
    }

    return predictions;
}

CalibrationAudit auditCalibration(const vector<LabeledPrediction>& predictions, int binCount)
{
    if (binCount <= 0)
    {
        throw std::invalid_argument("Calibration audit needs at least one bin");
    }

    CalibrationAudit audit;
    audit.sampleCount = static_cast<int>(predictions.size());
    audit.binCount = binCount;
    if (predictions.empty())
    {
        return audit;
    }

    vector<double> confidenceSums(binCount, 0.0);
    vector<double> correctCounts(binCount, 0.0);
    vector<int> binSizes(binCount, 0);
    double squaredErrorSum = 0.0;
    for (const LabeledPrediction& prediction : predictions)
    {
        const double outcome = prediction.isCorrect ? 1.0 : 0.0;
        squaredErrorSum += (prediction.confidence - outcome) * (prediction.confidence - outcome);

        const int binIndex = std::min(static_cast<int>(prediction.confidence * binCount), binCount - 1);
        confidenceSums[binIndex] += prediction.confidence;
        correctCounts[binIndex] += outcome;
        ++binSizes[binIndex];
    }

    const double sampleCount = predictions.size();
    for (int binIndex = 0; binIndex != binCount; ++binIndex)
    {
        if (binSizes[binIndex] == 0)
        {
            continue;
        }
        const double meanConfidence = confidenceSums[binIndex] / binSizes[binIndex];
        const double accuracy = correctCounts[binIndex] / binSizes[binIndex];
        audit.expectedCalibrationError += (binSizes[binIndex] / sampleCount) * std::abs(meanConfidence - accuracy);
    }
    audit.brierScore = squaredErrorSum / sampleCount;

    return audit;
}

}
