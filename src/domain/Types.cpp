#include "domain/Types.h"

#include <cstdio>
#include <type_traits>

namespace domain {

std::string formatFieldValue(const FieldValue& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, double>) {
                char buffer[32];
                std::snprintf(buffer, sizeof(buffer), "%.6g", v);
                return buffer;
            }
            else if constexpr (std::is_same_v<T, std::int64_t>) {
                return std::to_string(v);
            }
            else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            }
            else {
                return v;
            }
        },
        value);
}

}  // namespace domain
