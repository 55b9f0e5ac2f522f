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

#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include "spdlog/spdlog.h"

#include "app/Version.hh"
#include "io/TextInputFile.hh"
#include "pipeline/Calibration.hh"

namespace po = boost::program_options;

using boost::optional;
using std::string;

using namespace pgxrisk;

static double round6(double value) { return std::round(value * 1e6) / 1e6; }

struct AuditParameters
{
    string inputPath;
    int binCount = 10;
};

static optional<AuditParameters> tryParsingAuditParameters(int argc, char** argv)
{
    AuditParameters params;

    // clang-format off
    po::options_description options("Calibration audit options");
    options.add_options()
        ("help,h", "Print help message")
        ("version,v", "Print version number")
        ("input", po::value<string>(&params.inputPath)->required(), "JSONL file with {\"confidence\": c, \"correct\": 0|1} rows")
        ("bins", po::value<int>(&params.binCount)->default_value(10), "number of equal-width confidence bins")
    ;
    // clang-format on

    po::variables_map argumentMap;
    po::store(po::command_line_parser(argc, argv).options(options).run(), argumentMap);

    if ((argc == 1) or argumentMap.count("help"))
    {
        std::cerr << options << std::endl;
        return {};
    }

    if (argumentMap.count("version"))
    {
        std::cerr << "Starting " << kProgramVersion << std::endl;
        return {};
    }

    po::notify(argumentMap);

    if (params.binCount < 1)
    {
        throw std::invalid_argument("Number of bins must be at least 1");
    }

    return params;
}

int main(int argc, char** argv)
{
    spdlog::set_pattern("%Y-%m-%dT%H:%M:%S,[%v]");

    try
    {
        auto optionalParameters = tryParsingAuditParameters(argc, argv);
        if (!optionalParameters)
        {
            return 0;
        }
        const AuditParameters& params = *optionalParameters;

        TextInputFile inputFile(params.inputPath);
        const auto predictions = decodeLabeledPredictions(inputFile.stream());
        if (predictions.empty())
        {
            throw std::runtime_error("No predictions found in " + params.inputPath);
        }
        const CalibrationAudit audit = auditCalibration(predictions, params.binCount);
        spdlog::info("Audited {} predictions from {}", audit.sampleCount, params.inputPath);

        nlohmann::json auditRecord;
        auditRecord["n"] = audit.sampleCount;
        auditRecord["bins"] = audit.binCount;
        auditRecord["ece"] = round6(audit.expectedCalibrationError);
        auditRecord["brier_score"] = round6(audit.brierScore);
        std::cout << std::setw(2) << auditRecord << std::endl;
    }
    catch (const std::exception& e)
    {
        spdlog::error(e.what());
        return 1;
    }

    return 0;
}
