#pragma once

#include <string>
#include <vector>

namespace fwb {

struct unsatisfied_api {
    std::string package;
    std::string api;

    friend bool operator==(const unsatisfied_api&, const unsatisfied_api&) = default;
};

/// Every package/API pair left without a provider after resolution
struct e_unsatisfied_apis {
    std::vector<unsatisfied_api> value;
};

/// Combined output of a failed test executable
struct e_test_output {
    std::string value;
};

}  // namespace fwb
