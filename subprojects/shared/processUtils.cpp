#include "processUtils.hpp"

#include <unistd.h>
#include <climits>

#ifndef HOST_NAME_MAX
#define HOST_NAME_MAX 255
#endif

std::string ProcessUtils::get_hostname() {
    char buffer[HOST_NAME_MAX + 1] = {};
    if (::gethostname(buffer, sizeof(buffer) - 1) != 0 || buffer[0] == '\0') {
        return "localhost";
    }
    std::string name(buffer);
    // Short form only.
    auto dot = name.find('.');
    if (dot != std::string::npos && dot > 0) name.resize(dot);
    return name;
}
