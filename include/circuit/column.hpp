#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace bitcoin_vm {

enum class ColumnType : uint8_t {
    Advice,
    Fixed,
    Instance,
};

/**
 * Column - handle to one column of the circuit matrix
 */
struct Column {
    ColumnType type = ColumnType::Advice;
    size_t index = 0;

    bool operator==(const Column& rhs) const { return type == rhs.type && index == rhs.index; }
    bool operator!=(const Column& rhs) const { return !(*this == rhs); }
    bool operator<(const Column& rhs) const {
        return type != rhs.type ? type < rhs.type : index < rhs.index;
    }

    std::string to_string() const;
};

// Fixed column holding 0/1, gating gates
struct Selector {
    Column column;
};

// Fixed column holding a static lookup table
struct TableColumn {
    Column column;
};

/**
 * Rotation - row offset of a query relative to the row being checked
 */
struct Rotation {
    int32_t offset = 0;

    static constexpr Rotation prev() { return Rotation{-1}; }
    static constexpr Rotation cur() { return Rotation{0}; }
    static constexpr Rotation next() { return Rotation{1}; }
};

/**
 * Cell - absolute position in the circuit matrix
 */
struct Cell {
    Column column;
    size_t row = 0;

    bool operator==(const Cell& rhs) const { return column == rhs.column && row == rhs.row; }
    std::string to_string() const;
};

} // namespace bitcoin_vm
