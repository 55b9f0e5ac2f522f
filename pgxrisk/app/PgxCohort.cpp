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

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include "spdlog/spdlog.h"

#include "app/OutputHelpers.hh"
#include "app/Version.hh"
#include "cohort/CohortAggregator.hh"
#include "io/JsonWriter.hh"
#include "io/ParameterLoading.hh"
#include "io/TextInputFile.hh"

namespace po = boost::program_options;

using boost::optional;
using std::string;
using std::vector;

using namespace pgxrisk;

struct CohortParameters
{
    vector<string> resultPaths;
    string outputPath;
    string logLevel = "info";
};

static optional<CohortParameters> tryParsingCohortParameters(int argc, char** argv)
{
    CohortParameters params;

    // clang-format off
    po::options_description options("Cohort options");
    options.add_options()
        ("help,h", "Print help message")
        ("version,v", "Print version number")
        ("results", po::value<vector<string>>(&params.resultPaths)->multitoken()->required(), "PgxRisk output JSON files (optionally gzipped)")
        ("output", po::value<string>(&params.outputPath), "file to write the cohort summary to; defaults to standard output")
        ("log-level", po::value<string>(&params.logLevel)->default_value("info"), "'trace', 'debug', 'info', 'warn', or 'error'")
    ;
    // clang-format on

    po::positional_options_description positionalOptions;
    positionalOptions.add("results", -1);

    po::variables_map argumentMap;
    po::store(
        po::command_line_parser(argc, argv).options(options).positional(positionalOptions).run(), argumentMap);

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
    return params;
}

static CohortSummary summarizeResultFile(const string& resultPath)
{
    TextInputFile resultFile(resultPath);

    nlohmann::json resultsJson;
    try
    {
        resultFile.stream() >> resultsJson;
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw std::runtime_error("Unable to parse " + resultPath + ": " + e.what());
    }

    const CohortSummary summary = aggregateCohort(decodeCohortEntries(resultsJson));
    spdlog::debug("Read {} results from {}", summary.cohortSize(), resultPath);
    return summary;
}

int main(int argc, char** argv)
{
    spdlog::set_pattern("%Y-%m-%dT%H:%M:%S,[%v]");

    try
    {
        auto optionalParameters = tryParsingCohortParameters(argc, argv);
        if (!optionalParameters)
        {
            return 0;
        }
        const CohortParameters& params = *optionalParameters;

        try
        {
            setLogLevel(decodeLogLevel(params.logLevel));
        }
        catch (const std::logic_error&)
        {
            throw std::invalid_argument("Log level must be set to either trace, debug, info, warn, or error");
        }

        CohortSummary cohortSummary;
        for (const string& resultPath : params.resultPaths)
        {
            cohortSummary.merge(summarizeResultFile(resultPath));
        }
        spdlog::info(
            "Summarized {} results from {} files; {}", cohortSummary.cohortSize(), params.resultPaths.size(),
            cohortSummary.alert());

        CohortJsonWriter cohortWriter(cohortSummary);
        if (params.outputPath.empty())
        {
            std::cout << cohortWriter;
        }
        else
        {
            writeToFile(params.outputPath, cohortWriter);
        }
    }
    catch (const std::exception& e)
    {
        spdlog::error(e.what());
        return 1;
    }

    return 0;
}
