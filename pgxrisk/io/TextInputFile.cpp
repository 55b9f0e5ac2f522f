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

#include "io/TextInputFile.hh"

#include <stdexcept>

#include <boost/algorithm/string/predicate.hpp>

namespace pgxrisk
{

TextInputFile::TextInputFile(const std::string& path)
    : path_(path)
{
    inFile_.open(path_, std::ios::in | std::ios::binary);
    if (!inFile_.is_open())
    {
        throw std::runtime_error("Failed to open " + path_ + " for reading");
    }

    if (boost::algorithm::ends_with(path_, "gz"))
    {
        inStream_.push(boost::iostreams::gzip_decompressor());
    }

    inStream_.push(inFile_);
}

}
