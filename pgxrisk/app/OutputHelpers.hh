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

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>

#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include "core/Parameters.hh"

namespace pgxrisk
{

// Writes to a gzip-compressed stream when the file name ends in "gz"
template <typename T> void writeToFile(const std::string& fileName, T& streamable)
{
    std::ofstream outFile;
    boost::iostreams::filtering_ostream outStream;

    outFile.open(fileName, std::ios::out | std::ios::binary);
    if (!outFile.is_open())
    {
        throw std::runtime_error("Failed to open " + fileName + " for writing (" + strerror(errno) + ")");
    }

    if (fileName.size() > 2 && fileName.substr(fileName.size() - 2) == "gz")
    {
        outStream.push(boost::iostreams::gzip_compressor());
    }

    outStream.push(outFile);
    outStream << streamable;
    outStream.flush();
    outStream.reset(); // Ensures proper flushing of data

    outFile.close();
}

void setLogLevel(LogLevel logLevel);

}
