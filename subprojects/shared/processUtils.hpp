#pragma once
#include <string>

class ProcessUtils {
public:
    // Short host name of this machine ("localhost" if it cannot be read)
    static std::string get_hostname();

    // Default CoT host identifier: "<prefix>@<hostname>"
    static std::string default_host_id(const std::string& prefix = "takclient") {
        return prefix + "@" + get_hostname();
    }
};
