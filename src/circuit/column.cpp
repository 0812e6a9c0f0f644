#include "circuit/column.hpp"

namespace bitcoin_vm {

std::string Column::to_string() const {
    switch (type) {
        case ColumnType::Advice: return "advice[" + std::to_string(index) + "]";
        case ColumnType::Fixed: return "fixed[" + std::to_string(index) + "]";
        case ColumnType::Instance: return "instance[" + std::to_string(index) + "]";
    }
    return "column[?]";
}

std::string Cell::to_string() const {
    return column.to_string() + "@" + std::to_string(row);
}

} // namespace bitcoin_vm
