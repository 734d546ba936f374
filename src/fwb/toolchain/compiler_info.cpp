#include "./compiler_info.hpp"

#include <fwb/util/algo.hpp>

using namespace fwb;

void compiler_info::merge(const compiler_info& other) {
    extend(includes, other.includes);
    extend(cflags, other.cflags);
    extend(lflags, other.lflags);
    extend(aflags, other.aflags);
    extend(ignore_dirs, other.ignore_dirs);
    extend(ignore_files, other.ignore_files);
    if (other.linker_script) {
        linker_script = other.linker_script;
    }
}
