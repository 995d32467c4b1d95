#pragma once

#include <string>

namespace bbpssw {

// One engine event. `trial` is the index assigned by the trial runner (0
// for standalone engines) and `step` the protocol step the event produced.
struct ExecutionLog {
    int trial = 0;
    int round = 0;
    std::string step;
    std::string category;
    std::string message;
};

}  // namespace bbpssw
