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

#include <sstream>
#include <stdexcept>
#include <vector>

#include "gtest/gtest.h"

#include "tests/TestCatalog.hh"

using std::vector;
using namespace pgxrisk;

TEST(CalibratingScores, RawScoresInsideBins_MappedToBinValues)
{
    const RuleCatalog catalog = makeTestCatalog();
    const PostHocCalibrator calibrator(catalog.calibrationBins());

    EXPECT_FALSE(calibrator.isIdentity());
    EXPECT_DOUBLE_EQ(0.3, calibrator.calibrate(0.1));
    EXPECT_DOUBLE_EQ(0.45, calibrator.calibrate(0.4));
    EXPECT_DOUBLE_EQ(0.68, calibrator.calibrate(0.69));
    EXPECT_DOUBLE_EQ(0.78, calibrator.calibrate(0.7));
    EXPECT_DOUBLE_EQ(0.95, calibrator.calibrate(1.0));
}

TEST(CalibratingScores, OutOfRangeScores_Clamped)
{
    const RuleCatalog catalog = makeTestCatalog();
    const PostHocCalibrator calibrator(catalog.calibrationBins());

    EXPECT_DOUBLE_EQ(0.3, calibrator.calibrate(-0.5));
    EXPECT_DOUBLE_EQ(0.95, calibrator.calibrate(1.5));
}

TEST(CalibratingScores, IncreasingRawScores_NonDecreasingCalibratedScores)
{
    const RuleCatalog catalog = makeTestCatalog();
    const PostHocCalibrator calibrator(catalog.calibrationBins());

    double previous = calibrator.calibrate(0.0);
    for (int step = 1; step <= 100; ++step)
    {
        const double current = calibrator.calibrate(step / 100.0);
        EXPECT_GE(current, previous);
        previous = current;
    }
}

TEST(CalibratingScores, NearlyContiguousBins_GapClosedAndMonotonic)
{
    RuleCatalog catalog = makeTestCatalog();
    catalog.setCalibrationBins({ { 0.0, 0.5, 0.68 }, { 0.5000009, 1.0, 0.9 } });
    EXPECT_DOUBLE_EQ(0.5, catalog.calibrationBins()[1].lower);

    const PostHocCalibrator calibrator(catalog.calibrationBins());
    EXPECT_DOUBLE_EQ(0.68, calibrator.calibrate(0.49));
    EXPECT_DOUBLE_EQ(0.9, calibrator.calibrate(0.5000004));
    EXPECT_DOUBLE_EQ(0.9, calibrator.calibrate(0.6));
}

TEST(CalibratingScores, ScoreBetweenSeparatedBins_PreviousBinValueUsed)
{
    const vector<CalibrationBin> bins = { { 0.0, 0.5, 0.68 }, { 0.6, 1.0, 0.9 } };
    const PostHocCalibrator calibrator(bins);
    EXPECT_DOUBLE_EQ(0.68, calibrator.calibrate(0.55));
}

TEST(CalibratingScores, NoBins_IdentityRoundedToHundredths)
{
    const vector<CalibrationBin> noBins;
    const PostHocCalibrator calibrator(noBins);
    EXPECT_TRUE(calibrator.isIdentity());
    EXPECT_DOUBLE_EQ(0.82, calibrator.calibrate(0.8234));
}

TEST(DecodingLabeledPredictions, JsonLines_Decoded)
{
    std::istringstream jsonl("{\"confidence\": 0.9, \"correct\": 1}\n"
                             "\n"
                             "{\"confidence\": 0.2, \"correct\": false}\n");

    const vector<LabeledPrediction> predictions = decodeLabeledPredictions(jsonl);
    ASSERT_EQ(2u, predictions.size());
    EXPECT_DOUBLE_EQ(0.9, predictions[0].confidence);
    EXPECT_TRUE(predictions[0].isCorrect);
    EXPECT_FALSE(predictions[1].isCorrect);
}

TEST(DecodingLabeledPredictions, MissingField_ExceptionThrown)
{
    std::istringstream jsonl("{\"confidence\": 0.9}\n");
    EXPECT_THROW(decodeLabeledPredictions(jsonl), std::runtime_error);

    std::istringstream brokenJsonl("{\"confidence\": \n");
    EXPECT_THROW(decodeLabeledPredictions(brokenJsonl), std::runtime_error);
}

TEST(AuditingCalibration, PerfectlyCalibratedPredictions_ZeroError)
{
    const vector<LabeledPrediction> predictions
        = { { 1.0, true }, { 1.0, true }, { 0.0, false }, { 0.0, false } };

    const CalibrationAudit audit = auditCalibration(predictions, 10);
    EXPECT_EQ(4, audit.sampleCount);
    EXPECT_DOUBLE_EQ(0.0, audit.expectedCalibrationError);
    EXPECT_DOUBLE_EQ(0.0, audit.brierScore);
}

TEST(AuditingCalibration, OverconfidentPredictions_ErrorReported)
{
    const vector<LabeledPrediction> predictions
        = { { 0.9, true }, { 0.9, false }, { 0.3, false }, { 0.3, true } };

    const CalibrationAudit audit = auditCalibration(predictions, 10);
    // Bin 9: |0.9 - 0.5| over half the samples; bin 3: |0.3 - 0.5| over the other half
    EXPECT_NEAR(0.5 * 0.4 + 0.5 * 0.2, audit.expectedCalibrationError, 1e-9);
    EXPECT_NEAR((0.01 + 0.81 + 0.09 + 0.49) / 4.0, audit.brierScore, 1e-9);
}

TEST(AuditingCalibration, NonPositiveBinCount_ExceptionThrown)
{
    EXPECT_THROW(auditCalibration({ { 0.5, true } }, 0), std::invalid_argument);
}
