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

#include <nlohmann/json.hpp>

#include "core/RuleCatalog.hh"

namespace pgxrisk
{

/// \brief Translate the catalog json structure into a validated rule catalog
///
/// Throws std::logic_error on missing fields, invalid encodings or inconsistent tables
///
RuleCatalog decodeRuleCatalog(const nlohmann::json& catalogJson);

// Reads plain or gzip-compressed (*.gz) JSON
RuleCatalog loadRuleCatalog(const std::string& catalogPath);

}
