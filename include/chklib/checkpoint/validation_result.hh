#pragma once

#include <string>
#include <vector>

namespace chk {

// Verdict on a submission, the only thing the engine returns
struct ValidationResult {
    bool passed = false; // implies errors.empty()
    std::string message;
    std::vector<std::string> errors; // blocking failures
    std::vector<std::string> hints; // advisory

    /**
     * @brief Serializes the result as
     *   `{"passed":bool,"message":str,"errors":[str],"hints":[str]}`
     * @details Empty errors and hints are omitted.
     */
    [[nodiscard]] std::string to_json() const;
};

} // namespace chk
