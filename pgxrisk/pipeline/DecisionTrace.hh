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

struct TraceStep
{
    std::string stage;
    std::string input;
    std::string output;
    std::string source;
};

// Append-only record of what each pipeline stage received, produced and consulted
class DecisionTrace
{
public:
    void record(std::string stage, std::string input, std::string output, std::string source)
    {
        steps_.push_back({ std::move(stage), std::move(input), std::move(output), std::move(source) });
    }

    const std::vector<TraceStep>& steps() const { return steps_; }
    bool empty() const { return steps_.empty(); }

private:
    std::vector<TraceStep> steps_;
};

}
