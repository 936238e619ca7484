#include "apisim/RequestContext.h"

namespace apisim {

std::string Span::toString() const {
    std::string out = name;
    for (const auto& kv : attributes) {
        out += " ";
        out += kv.first;
        out += "=";
        out += kv.second;
    }
    return out;
}

} // namespace apisim
