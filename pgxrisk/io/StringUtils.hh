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

#include <string>
#include <vector>

namespace pgxrisk
{

std::string add_commas_at_thousands(std::string n);
std::string add_commas_at_thousands(int n);
std::string add_commas_at_thousands(unsigned long n);

// Splits on commas, trims whitespace and drops empty items
std::vector<std::string> splitCommaSeparatedList(const std::string& encoding);

std::string formatFixed(double value, int decimalPlaces);

}
