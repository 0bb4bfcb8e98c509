#include "input_classifier.h"
#include "source_scanner.h"
#include <regex>

namespace liverun {

bool PythonInputClassifier::may_require_input(const std::string& source) const {
    static const std::regex input_call(R"(\binput\s*\()");
    static const std::regex stdin_access(R"(\bsys\s*\.\s*stdin\b)");

    if (source.empty()) {
        return false;
    }

    std::string residual = SourceScanner::strip_strings_and_comments(source);
    return std::regex_search(residual, input_call) ||
           std::regex_search(residual, stdin_access);
}

} // namespace liverun
