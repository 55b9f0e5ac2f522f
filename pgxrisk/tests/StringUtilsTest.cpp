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

#include <string>
#include <vector>

#include "gtest/gtest.h"

using std::string;
using std::vector;
using namespace pgxrisk;

TEST(SplittingLists, CommaSeparatedItems_TrimmedAndFiltered)
{
    const vector<string> expected = { "CODEINE", "warfarin", "5-FU" };
    EXPECT_EQ(expected, splitCommaSeparatedList(" CODEINE, warfarin,,5-FU , "));
    EXPECT_TRUE(splitCommaSeparatedList("").empty());
}

TEST(FormattingNumbers, LargeCounts_CommasAdded)
{
    EXPECT_EQ("1,234,567", add_commas_at_thousands(1234567));
    EXPECT_EQ("0.850", formatFixed(0.85, 3));
}
