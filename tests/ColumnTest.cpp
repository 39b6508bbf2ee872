#include <catch2/catch.hpp>
#include "dataframe/Column.hpp"
#include <cmath>
#include <typeinfo>

using namespace salescast;

// =============================================================================
// IntColumn
// =============================================================================

TEST_CASE("IntColumn push_back and at", "[IntColumn]") {
    IntColumn col("Quantity");
    col.push_back(3);
    col.push_back(-1);

    REQUIRE(col.size() == 2);
    REQUIRE(col.at(0) == 3);
    REQUIRE(col.at(1) == -1);
    REQUIRE(col.getName() == "Quantity");
    REQUIRE(col.getType() == ColumnTypeOpt::INT);
}

TEST_CASE("IntColumn filterEqual", "[IntColumn]") {
    IntColumn col("Document Number");
    for (int64_t v : {100, 101, 100, 102}) col.push_back(v);

    auto indices = col.filterEqual("100");

    REQUIRE(indices == std::vector<size_t>{0, 2});
}

TEST_CASE("IntColumn append", "[IntColumn]") {
    IntColumn col("n");
    col.push_back(1);
    IntColumn more("n");
    more.push_back(2);
    more.push_back(3);

    col.append(more);

    REQUIRE(col.size() == 3);
    REQUIRE(col.at(2) == 3);
    REQUIRE(more.size() == 2);
}

TEST_CASE("Column append rejects another type", "[IntColumn]") {
    IntColumn ints("n");
    DoubleColumn doubles("n");
    doubles.push_back(1.0);

    REQUIRE_THROWS_AS(ints.append(doubles), std::bad_cast);
}

// =============================================================================
// DoubleColumn
// =============================================================================

TEST_CASE("DoubleColumn null cells", "[DoubleColumn]") {
    DoubleColumn col("Predicted Quantity");
    col.push_back(12.5);
    col.push_back(DoubleColumn::null());

    REQUIRE(col.getType() == ColumnTypeOpt::DOUBLE);
    REQUIRE_FALSE(col.isNull(0));
    REQUIRE(col.isNull(1));
    REQUIRE(std::isnan(col.at(1)));
}

TEST_CASE("DoubleColumn filterEqual", "[DoubleColumn]") {
    DoubleColumn col("Amount");
    for (double v : {1.5, 2.0, 1.5}) col.push_back(v);

    REQUIRE(col.filterEqual("1.5") == std::vector<size_t>{0, 2});
    REQUIRE(col.filterEqual("3").empty());
}

TEST_CASE("DoubleColumn null never matches", "[DoubleColumn]") {
    DoubleColumn col("Amount");
    col.push_back(DoubleColumn::null());

    REQUIRE(col.filterEqual("nan").empty());
}

// =============================================================================
// StringColumn
// =============================================================================

TEST_CASE("StringColumn push_back and at", "[StringColumn]") {
    auto pool = std::make_shared<StringPool>();
    StringColumn col("Customer Name", pool);
    col.push_back("Alice");
    col.push_back("Bob");
    col.push_back("Alice");

    REQUIRE(col.size() == 3);
    REQUIRE(col.at(1) == "Bob");
    REQUIRE(col.getId(0) == col.getId(2));
    REQUIRE(pool->size() == 2);
}

TEST_CASE("StringColumn filterEqual", "[StringColumn]") {
    auto pool = std::make_shared<StringPool>();
    StringColumn col("Item Name", pool);
    for (const char* v : {"Widget", "Gadget", "Widget"}) col.push_back(v);

    REQUIRE(col.filterEqual("Widget") == std::vector<size_t>{0, 2});
}

TEST_CASE("StringColumn filterEqual on unknown value leaves pool untouched", "[StringColumn]") {
    auto pool = std::make_shared<StringPool>();
    StringColumn col("Item Name", pool);
    col.push_back("Widget");

    REQUIRE(col.filterEqual("Sprocket").empty());
    REQUIRE(pool->size() == 1);
}

TEST_CASE("StringColumn shared pool between columns", "[StringColumn]") {
    auto pool = std::make_shared<StringPool>();
    StringColumn customers("Customer Name", pool);
    StringColumn sales("Sales Name", pool);

    customers.push_back("Dupont");
    sales.push_back("Dupont");

    REQUIRE(customers.getId(0) == sales.getId(0));
    REQUIRE(pool->size() == 1);
}

TEST_CASE("StringColumn append across pools re-interns values", "[StringColumn]") {
    auto poolA = std::make_shared<StringPool>();
    auto poolB = std::make_shared<StringPool>();
    StringColumn a("City", poolA);
    StringColumn b("City", poolB);

    a.push_back("Paris");
    b.push_back("Nantes");
    b.push_back("Paris");

    a.append(b);

    REQUIRE(a.size() == 3);
    REQUIRE(a.at(1) == "Nantes");
    REQUIRE(a.at(2) == "Paris");
    REQUIRE(a.getId(0) == a.getId(2));
}

TEST_CASE("StringColumn append on the same pool keeps ids", "[StringColumn]") {
    auto pool = std::make_shared<StringPool>();
    StringColumn a("Currency", pool);
    StringColumn b("Currency", pool);
    a.push_back("EUR");
    b.push_back("USD");
    b.push_back("EUR");

    a.append(b);

    REQUIRE(a.size() == 3);
    REQUIRE(a.getId(2) == a.getId(0));
    REQUIRE(pool->size() == 2);
}
