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

#include "io/ParameterLoading.hh"

#include <iostream>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "app/Version.hh"
#include "io/StringUtils.hh"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

using boost::optional;
using std::string;
using std::to_string;
using std::vector;

namespace pgxrisk
{

struct UserParameters
{
    // Input file paths
    string vcfPath;
    string catalogPath;
    string pharmgkbAnnotationsPath;
    string pharmgkbVariantAnnotationsPath;

    // Output prefix
    string outputPrefix;

    // Patient parameters
    string patientId;
    string drugs;
    string concurrentMedications;
    string timestamp;

    double minQual = 20.0;
    bool compressOutputFiles = false;
    bool omitDecisionTrace = false;
    string logLevel = "info";
};

static optional<UserParameters> tryParsingUserParameters(int argc, char** argv)
{
    UserParameters params;

    // clang-format off
    po::options_description basicOptions("Basic options");
    basicOptions.add_options()
        ("help,h", "Print help message")
        ("version,v", "Print version number")
        ("vcf", po::value<string>(&params.vcfPath)->required(), "patient VCF file (optionally gzipped)")
        ("rules-catalog", po::value<string>(&params.catalogPath)->required(), "JSON file with the versioned PGx rules catalog")
        ("drugs,d", po::value<string>(&params.drugs)->required(), "comma-separated list of drugs to assess")
        ("output-prefix", po::value<string>(&params.outputPrefix)->required(), "prefix for the output files")
        ("patient-id", po::value<string>(&params.patientId), "patient identifier; defaults to the name of the VCF file")
        ("concurrent-medications,m", po::value<string>(&params.concurrentMedications), "comma-separated list of concurrently taken medications")
        ("compress-output-files,z", po::bool_switch(&params.compressOutputFiles), "compress the json output file, adding .gz to its filename")
    ;
    // clang-format on

    // clang-format off
    po::options_description advancedOptions("Advanced options");
    advancedOptions.add_options()
        ("pharmgkb-annotations", po::value<string>(&params.pharmgkbAnnotationsPath), "TSV table of PharmGKB clinical annotations")
        ("pharmgkb-variant-annotations", po::value<string>(&params.pharmgkbVariantAnnotationsPath), "TSV table of PharmGKB variant-drug annotations; requires --pharmgkb-annotations")
        ("min-qual", po::value<double>(&params.minQual)->default_value(20.0), "Minimum QUAL of VCF records to retain")
        ("timestamp", po::value<string>(&params.timestamp), "Timestamp to stamp the results with; defaults to the current UTC time")
        ("omit-decision-trace", po::bool_switch(&params.omitDecisionTrace), "Do not write per-drug decision traces")
        ("log-level", po::value<string>(&params.logLevel)->default_value("info"), "'trace', 'debug', 'info', 'warn', or 'error'")
    ;
    // clang-format on

    po::options_description visibleOptions;
    visibleOptions.add(basicOptions).add(advancedOptions);

    po::variables_map argumentMap;
    po::store(po::command_line_parser(argc, argv).options(visibleOptions).run(), argumentMap);

    if ((argc == 1) or argumentMap.count("help"))
    {
        std::cerr << visibleOptions << std::endl;
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

static void assertWritablePath(const string& pathEncoding)
{
    const fs::path path(pathEncoding);
    const fs::path pathToDirectory = path.parent_path();

    const bool thereIsNoDirectory = pathToDirectory.empty();
    const bool pathLeadsToExistingDirectory = fs::is_directory(pathToDirectory);
    const bool filenameIsValid = fs::portable_posix_name(path.filename().string());

    if (!filenameIsValid || (!thereIsNoDirectory && !pathLeadsToExistingDirectory))
    {
        throw std::invalid_argument(pathEncoding + " is not a valid output path");
    }
}

static void assertPathToExistingFile(const string& pathEncoding)
{
    const fs::path path(pathEncoding);
    const bool isPathToExistingFile = fs::exists(path) && fs::is_regular_file(path);

    if (!isPathToExistingFile)
    {
        throw std::invalid_argument(pathEncoding + " is not a path to an existing file");
    }
}

static void assertValidity(const UserParameters& userParameters)
{
    assertPathToExistingFile(userParameters.vcfPath);
    assertPathToExistingFile(userParameters.catalogPath);
    if (!userParameters.pharmgkbAnnotationsPath.empty())
    {
        assertPathToExistingFile(userParameters.pharmgkbAnnotationsPath);
    }
    if (!userParameters.pharmgkbVariantAnnotationsPath.empty())
    {
        if (userParameters.pharmgkbAnnotationsPath.empty())
        {
            throw std::invalid_argument("--pharmgkb-variant-annotations requires --pharmgkb-annotations");
        }
        assertPathToExistingFile(userParameters.pharmgkbVariantAnnotationsPath);
    }

    assertWritablePath(userParameters.outputPrefix);

    if (splitCommaSeparatedList(userParameters.drugs).empty())
    {
        throw std::invalid_argument("At least one drug must be specified with --drugs");
    }

    const double kMaxQual = 10000.0;
    if (userParameters.minQual < 0 || userParameters.minQual > kMaxQual)
    {
        const string message = "Minimum quality of " + to_string(userParameters.minQual)
            + " is not supported; the range of allowed values is between 0 and " + to_string(kMaxQual);
        throw std::invalid_argument(message);
    }
}

static string decodePatientId(const UserParameters& userParams)
{
    if (!boost::algorithm::trim_copy(userParams.patientId).empty())
    {
        return boost::algorithm::trim_copy(userParams.patientId);
    }

    // Strip both extensions of names like sample.vcf.gz
    fs::path vcfPath(userParams.vcfPath);
    if (vcfPath.extension() == ".gz")
    {
        vcfPath = vcfPath.stem();
    }
    return vcfPath.stem().string();
}

LogLevel decodeLogLevel(const string& encoding)
{
    if (encoding == "trace")
    {
        return LogLevel::kTrace;
    }
    if (encoding == "debug")
    {
        return LogLevel::kDebug;
    }
    else if (encoding == "info")
    {
        return LogLevel::kInfo;
    }
    else if (encoding == "warn")
    {
        return LogLevel::kWarn;
    }
    else if (encoding == "error")
    {
        return LogLevel::kError;
    }
    else
    {
        throw std::logic_error("Invalid encoding of logging level " + encoding);
    }
}

optional<ProgramParameters> tryLoadingProgramParameters(int argc, char** argv)
{
    auto optionalUserParameters = tryParsingUserParameters(argc, argv);
    if (!optionalUserParameters)
    {
        return optional<ProgramParameters>();
    }

    const auto& userParams = *optionalUserParameters;
    assertValidity(userParams);

    InputPaths inputPaths(
        userParams.vcfPath, userParams.catalogPath, userParams.pharmgkbAnnotationsPath,
        userParams.pharmgkbVariantAnnotationsPath);
    string jsonPath = userParams.outputPrefix + ".json";
    if (userParams.compressOutputFiles)
    {
        jsonPath += ".gz";
    }
    OutputPaths outputPaths(jsonPath);
    AnalysisParameters analysisParams(userParams.minQual, !userParams.omitDecisionTrace);

    LogLevel logLevel;
    try
    {
        logLevel = decodeLogLevel(userParams.logLevel);
    }
    catch (std::logic_error&)
    {
        const string message = "Log level must be set to either trace, debug, info, warn, or error";
        throw std::invalid_argument(message);
    }

    optional<string> timestamp;
    if (!userParams.timestamp.empty())
    {
        timestamp = userParams.timestamp;
    }

    return ProgramParameters(
        inputPaths, outputPaths, analysisParams, decodePatientId(userParams),
        splitCommaSeparatedList(userParams.drugs), splitCommaSeparatedList(userParams.concurrentMedications),
        timestamp, logLevel);
}

}
