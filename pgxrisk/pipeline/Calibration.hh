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

#include <istream>
#include <utility>
#include <vector>

#include "core/RuleCatalog.hh"

namespace pgxrisk
{

/// \brief Monotonic piecewise-constant map from raw to calibrated confidence
///
/// Bins are half-open [lower, upper) except the last one, which includes 1. Without bins the calibrator is the
/// identity. Outputs are rounded to two decimals.
///
class PostHocCalibrator
{
public:
    explicit PostHocCalibrator(std::vector<CalibrationBin> bins)
        : bins_(std::move(bins))
    {
    }

    double calibrate(double rawScore) const;
    bool isIdentity() const { return bins_.empty(); }

private:
    std::vector<CalibrationBin> bins_;
};

struct LabeledPrediction
{
    double confidence;
    bool isCorrect;
};

struct CalibrationAudit
{
    int sampleCount = 0;
    int binCount = 0;
    double expectedCalibrationError = 0.0;
    double brierScore = 0.0;
};

// Reads {"confidence": c, "correct": 0|1} rows, one JSON object per line; confidences are clamped to [0, 1]
std::vector<LabeledPrediction> decodeLabeledPredictions(std::istream& jsonlStream);

// Expected calibration error over equal-width bins and the Brier score
CalibrationAudit auditCalibration(const std::vector<LabeledPrediction>& predictions, int binCount = 10);

}
