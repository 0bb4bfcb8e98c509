#pragma once

#include <string>

namespace liverun {

// Decides, without running it, whether a program may block on interactive
// input. The answer only controls whether a stdin pipe is attached.
class InputClassifier {
public:
    virtual ~InputClassifier() = default;
    virtual bool may_require_input(const std::string& source) const = 0;
};

// Heuristic for Python sources: strips literals and comments, then looks
// for an input(...) call or a reference to sys.stdin. Unsound both ways:
// input reached through aliasing or getattr is missed, and a literal the
// scanner misreads can produce a false positive.
class PythonInputClassifier : public InputClassifier {
public:
    bool may_require_input(const std::string& source) const override;
};

} // namespace liverun
