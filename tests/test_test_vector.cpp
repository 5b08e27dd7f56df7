/// @file test_test_vector.cpp
/// @brief Tests for test vector parsing and execution against a model

#include <catch2/catch.hpp>

#include "simulation/circuit_builder.hpp"
#include "testing/test_vector.hpp"

#include <string>

using namespace gatesim;

// ---------- Parsing ----------

TEST_CASE("Parsing a test vector", "[testvector]") {
    TestVector vector = parse_test_vector("# leading comment\n"
                                         "\n"
                                         "A  B   Y   # trailing comment\n"
                                         "0  1   X\n"
                                         "   \n"
                                         "c  z   1\n");

    REQUIRE(vector.columns.size() == 3);
    CHECK(vector.columns[0] == "A");
    CHECK(vector.columns[2] == "Y");

    REQUIRE(vector.rows.size() == 2);
    CHECK(vector.rows[0].line == 4);
    CHECK(vector.rows[0].tokens[0] == TestToken::ZERO);
    CHECK(vector.rows[0].tokens[1] == TestToken::ONE);
    CHECK(vector.rows[0].tokens[2] == TestToken::DONT_CARE);

    CHECK(vector.rows[1].line == 6);
    CHECK(vector.rows[1].tokens[0] == TestToken::CLOCK);
    CHECK(vector.rows[1].tokens[1] == TestToken::HIGH_Z);

    CHECK(test_token_char(TestToken::HIGH_Z) == 'Z');
    CHECK(test_token_char(TestToken::CLOCK) == 'C');
}

TEST_CASE("Malformed test vectors", "[testvector]") {
    SECTION("wrong number of values") {
        try {
            (void)parse_test_vector("A B\n0 1\n0\n");
            FAIL("expected TestVectorError");
        } catch (const TestVectorError& e) {
            CHECK(e.line() == 3);
            CHECK(e.column() == 0);
        }
    }

    SECTION("unknown token") {
        try {
            (void)parse_test_vector("A B\n\n1 2\n");
            FAIL("expected TestVectorError");
        } catch (const TestVectorError& e) {
            CHECK(e.line() == 3);
            CHECK(e.column() == 2);
            CHECK(std::string(e.what()) == "line 3, column 2: unknown token '2'");
        }
    }

    SECTION("duplicate column") {
        try {
            (void)parse_test_vector("A B A\n");
            FAIL("expected TestVectorError");
        } catch (const TestVectorError& e) {
            CHECK(e.line() == 1);
            CHECK(e.column() == 3);
        }
    }

    SECTION("no header") {
        CHECK_THROWS_AS(parse_test_vector("# nothing here\n\n"), TestVectorError);
        CHECK_THROWS_AS(parse_test_vector(""), TestVectorError);
    }
}

// ---------- Running ----------

TEST_CASE("Passing vector", "[testvector]") {
    auto model = build_half_adder();
    TestReport report = run_test_vector(*model, "A B S C\n"
                                                "0 0 0 0\n"
                                                "1 1 0 1\n");
    CHECK(report.passed());
    CHECK(report.rows_run == 2);
    CHECK_FALSE(report.aborted);
    CHECK(report.summary() == "2 row(s), 0 mismatch(es)");
}

TEST_CASE("Don't-care columns never fail", "[testvector]") {
    auto model = build_half_adder();
    TestReport report = run_test_vector(*model, "A B S C\n"
                                                "1 X X X\n"
                                                "X 1 0 1\n");
    CHECK(report.passed());
}

TEST_CASE("Mismatches are collected with their position", "[testvector]") {
    auto model = build_half_adder();
    TestReport report = run_test_vector(*model, "A B S C\n"
                                                "# second row is wrong\n"
                                                "0 1 1 0\n"
                                                "1 1 1 1\n"
                                                "1 0 1 0\n");

    CHECK_FALSE(report.passed());
    CHECK(report.rows_run == 3);
    REQUIRE(report.mismatches.size() == 1);

    const TestMismatch& mismatch = report.mismatches[0];
    CHECK(mismatch.row == 2);
    CHECK(mismatch.line == 4);
    CHECK(mismatch.column == "S");
    CHECK(mismatch.expected == Signal::One);
    CHECK(mismatch.actual == Signal::Zero);

    CHECK(report.summary().find("row 2 (line 4): S expected 1, got 0") != std::string::npos);
}

TEST_CASE("A shorted net reads X without aborting the run", "[testvector]") {
    auto model = build_shorted_outputs();
    TestReport report = run_test_vector(*model, "A B Y\n"
                                                "1 0 1\n"
                                                "1 1 1\n"
                                                "Z 0 0\n"
                                                "Z Z Z\n");

    CHECK_FALSE(report.aborted);
    CHECK(report.rows_run == 4);
    REQUIRE(report.mismatches.size() == 1);
    CHECK(report.mismatches[0].row == 1);
    CHECK(report.mismatches[0].actual == Signal::Unknown);
}

TEST_CASE("Clock columns pulse from the current level", "[testvector]") {
    auto model = build_d_register();

    // With C left high the pulse is high-low-high, so the rising edge comes last
    TestReport report = run_test_vector(*model, "D C Q\n"
                                                "1 1 1\n"
                                                "0 C 0\n"
                                                "1 X 0\n");
    INFO(report.summary());
    CHECK(report.passed());
}

TEST_CASE("Inputs of a row are applied together", "[testvector]") {
    // Releasing both latch inputs at once leaves no steady state
    SimulationConfig config;
    config.max_settle_passes = 50;
    auto model = build_sr_latch(config);

    TestReport report = run_test_vector(*model, "S R Q ~Q\n"
                                                "1 1 0 0\n"
                                                "0 0 X X\n"
                                                "1 0 1 0\n");
    CHECK(report.aborted);
    CHECK_FALSE(report.passed());
    CHECK(report.rows_run == 1);
    CHECK(report.error.find("row 2 (line 3)") != std::string::npos);
}

TEST_CASE("Oscillation aborts the run", "[testvector]") {
    SimulationConfig config;
    config.max_settle_passes = 100;
    auto model = build_gated_oscillator(config);

    TestReport report = run_test_vector(*model, "EN Y\n"
                                                "0  1\n"
                                                "1  X\n"
                                                "0  1\n");
    CHECK(report.aborted);
    CHECK(report.rows_run == 1);
    CHECK(report.mismatches.empty());
    CHECK(report.summary().find("aborted") != std::string::npos);
    CHECK(model->is_faulted());
}

TEST_CASE("Columns must bind to terminals", "[testvector]") {
    auto model = build_d_register();

    SECTION("unknown label") {
        try {
            (void)run_test_vector(*model, "D C Q R\n0 0 0 0\n");
            FAIL("expected TestVectorError");
        } catch (const TestVectorError& e) {
            CHECK(e.column() == 4);
        }
    }

    SECTION("clock token in an output column") {
        try {
            (void)run_test_vector(*model, "D C Q\n1 C 1\n0 0 C\n");
            FAIL("expected TestVectorError");
        } catch (const TestVectorError& e) {
            CHECK(e.line() == 3);
            CHECK(e.column() == 3);
        }
        // Nothing was run
        CHECK(model->get_output("Q") == Signal::Zero);
    }
}
