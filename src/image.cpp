#include "framestream/image.hpp"

#include <cstdint>
#include <sstream>

namespace framestream {

size_t dtype_item_size(const std::string& dtype) {
    if (dtype == "uint8" || dtype == "int8") {
        return 1;
    }
    if (dtype == "uint16" || dtype == "int16") {
        return 2;
    }
    if (dtype == "uint32" || dtype == "int32" || dtype == "float32") {
        return 4;
    }
    if (dtype == "float64") {
        return 8;
    }
    return 0;
}

size_t expected_byte_size(const std::string& dtype, const std::vector<int>& shape) {
    size_t total = dtype_item_size(dtype);
    if (total == 0 || shape.empty()) {
        return 0;
    }
    for (int dim : shape) {
        if (dim <= 0 || total > SIZE_MAX / static_cast<size_t>(dim)) {
            return 0;
        }
        total *= static_cast<size_t>(dim);
    }
    return total;
}

std::string describe_shape(const std::vector<int>& shape) {
    std::ostringstream out;
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) {
            out << 'x';
        }
        out << shape[i];
    }
    return out.str();
}

} // namespace framestream
