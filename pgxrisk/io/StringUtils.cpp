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

#include "io/StringUtils.hh"

#include <iomanip>
#include <sstream>

#include <boost/algorithm/string.hpp>

namespace pgxrisk
{

std::string add_commas_at_thousands(std::string n)
{
    if (n.length() > 3)
    {
        for (int i = static_cast<int>(n.length()) - 3; i > 0; i -= 3)
        {
            n.insert(i, ",");
        }
    }

    return n;
}

std::string add_commas_at_thousands(int n) { return add_commas_at_thousands(std::to_string(n)); }

std::string add_commas_at_thousands(unsigned long n) { return add_commas_at_thousands(std::to_string(n)); }

std::vector<std::string> splitCommaSeparatedList(const std::string& encoding)
{
    std::vector<std::string> pieces;
    boost::split(pieces, encoding, boost::is_any_of(","));

    std::vector<std::string> items;
    for (auto& piece : pieces)
    {
        boost::algorithm::trim(piece);
        if (!piece.empty())
        {
            items.push_back(piece);
        }
    }

    return items;
}

std::string formatFixed(double value, int decimalPlaces)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(decimalPlaces) << value;
    return out.str();
}

}
