#include "autosplit_sdk/address.hpp"

#include <cstdio>

namespace autosplit_sdk {

std::string to_string(Address address) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "0x%016llx",
        static_cast<unsigned long long>(address.value()));
    return buf;
}

std::ostream& operator<<(std::ostream& os, Address address) {
    return os << to_string(address);
}

} // namespace autosplit_sdk
