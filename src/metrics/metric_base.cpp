#include "MetricBase.hpp"
#include <iostream>

namespace Equity {

void MetricBase::note(DecompositionResult& r, const std::string& msg) const {
    r.notes.push_back(msg);
    if (opts_.verbose) {
        std::cerr << "[WARN][Equity::" << name() << "] " << msg << std::endl;
    }
}

} // namespace Equity
