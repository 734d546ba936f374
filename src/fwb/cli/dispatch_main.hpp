#pragma once

namespace fwb::cli {

struct options;

int dispatch_main(const options&) noexcept;

}  // namespace fwb::cli
