#pragma once

#include <string>
#include "codepair/execution_result.h"
#include "codepair/language.h"

namespace codepair {

// Common seam for the local sandbox and the remote gateway
class CodeExecutor {
public:
    virtual ~CodeExecutor() = default;

    virtual ExecutionResult execute(const std::string& code, Language language) = 0;
};

// Length of UTF-8 source as an editor counts it: UTF-16 code units, so a
// character outside the BMP counts twice. Size ceilings are in these units.
size_t code_length(const std::string& code);

} // namespace codepair
