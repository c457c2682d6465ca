#pragma once

#include <string>

namespace pyscope::ast {
    struct Alias {
        std::string name;   // dotted for 'import a.b'
        std::string asname; // empty if none
    };
}
