#pragma once

/// @file test_vector.hpp
/// @brief Tabular test vectors: parsing and execution against a Model
///
/// Format:
///   # comment
///   Clr Pre J K C Q ~Q      <- header: terminal labels
///   0   1   X X X 0 1       <- one token per column
///   1   1   1 1 C 1 0
///
/// Tokens: 0, 1, X (don't care / leave unchanged), C (clock pulse, inputs
/// only), Z (floating). Blank lines and '#' comments are ignored.

#include "simulation/model.hpp"
#include "simulation/signal.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gatesim {

enum class TestToken { ZERO, ONE, DONT_CARE, CLOCK, HIGH_Z };

[[nodiscard]] char test_token_char(TestToken token);

/// One data row and the source line it came from
struct TestRow {
    size_t line = 0;
    std::vector<TestToken> tokens;
};

struct TestVector {
    std::vector<std::string> columns;
    std::vector<TestRow> rows;
};

/// Malformed test vector text, or a column that cannot be bound to the model.
/// line and column are 1-based; 0 when not applicable.
class TestVectorError : public std::runtime_error {
  public:
    TestVectorError(const std::string& message, size_t line, size_t column);

    [[nodiscard]] size_t line() const { return line_; }
    [[nodiscard]] size_t column() const { return column_; }

  private:
    size_t line_;
    size_t column_;
};

/// Parses test vector text.
/// @throws TestVectorError on a missing or duplicated header, a wrong column
///         count or an unknown token
[[nodiscard]] TestVector parse_test_vector(std::string_view text);

/// A failed output assertion
struct TestMismatch {
    size_t row = 0;  ///< 1-based data row number
    size_t line = 0; ///< Source line of the row
    std::string column;
    Signal expected = Signal::Zero;
    Signal actual = Signal::Zero;
};

struct TestReport {
    size_t rows_run = 0;
    std::vector<TestMismatch> mismatches;
    bool aborted = false; ///< The circuit oscillated; remaining rows were skipped
    std::string error;

    [[nodiscard]] bool passed() const { return !aborted && mismatches.empty(); }

    /// One line per mismatch plus a closing tally
    [[nodiscard]] std::string summary() const;
};

/// Drives a Model through the rows of a test vector.
///
/// Per row: all 0/1/Z inputs are applied together and settled; then every C
/// column is pulsed (toggled, settled, toggled back, settled); then the
/// output columns are compared. Mismatches are collected, not thrown.
class TestVectorRunner {
  public:
    explicit TestVectorRunner(Model& model);

    /// Runs every row in order.
    /// @throws TestVectorError if a column does not name an IN/CLOCK/OUT
    ///         terminal, or an output column contains C
    [[nodiscard]] TestReport run(const TestVector& vector);

  private:
    struct Binding {
        Element* terminal;
        bool is_input;
    };

    [[nodiscard]] std::vector<Binding> bind(const TestVector& vector) const;

    Model& model_;
};

/// Parses @p text and runs it against @p model
[[nodiscard]] TestReport run_test_vector(Model& model, std::string_view text);

} // namespace gatesim
