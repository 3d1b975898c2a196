#include <gtest/gtest.h>

#include "Cleaner.h"
#include "ScrubExceptions.h"
#include "test_helpers.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using ScrubTest::peopleDataset;

namespace {
TypedDataset agesDataset(const NumericCells& ages) {
    TypedDataset d;
    d.addNumericColumn("age", ages);
    return d;
}

std::vector<double> ageValues(const TypedDataset& d) {
    std::vector<double> out;
    for (const auto& cell : d.column("age").numeric()) {
        if (cell) out.push_back(*cell);
    }
    return out;
}
}

// =============================================================================
// trim
// =============================================================================

TEST(CleanerTrimTest, StripsNamedTextColumn) {
    const TypedDataset input = peopleDataset();
    const TypedDataset out = Cleaner::trim(input, {"name"});

    const TextCells expected = {std::string("Alice"), std::string("Bob"), std::string("Carol")};
    EXPECT_EQ(out.column("name").text(), expected);
    EXPECT_EQ(out.column("age"), input.column("age"));
    EXPECT_EQ(out.rowIds(), input.rowIds());
    EXPECT_EQ(out.colCount(), 2u);
}

TEST(CleanerTrimTest, LeavesInputUntouched) {
    const TypedDataset input = peopleDataset();
    const TypedDataset before = input;
    (void)Cleaner::trim(input, {"name"});
    EXPECT_EQ(input, before);
    EXPECT_EQ(*input.column("name").text()[0], "  Alice  ");
}

TEST(CleanerTrimTest, MissingCellsStayMissing) {
    TypedDataset d;
    d.addTextColumn("city", {std::string(" Paris"), std::nullopt, std::string("\tOslo\n"), std::string("   ")});
    const TypedDataset out = Cleaner::trim(d, {"city"});

    const TextCells& cells = out.column("city").text();
    ASSERT_EQ(cells.size(), 4u);
    EXPECT_EQ(*cells[0], "Paris");
    EXPECT_FALSE(cells[1].has_value());
    EXPECT_EQ(*cells[2], "Oslo");
    // All-whitespace becomes an empty value, which is not missing.
    ASSERT_TRUE(cells[3].has_value());
    EXPECT_EQ(*cells[3], "");
}

TEST(CleanerTrimTest, KeepsInteriorWhitespace) {
    TypedDataset d;
    d.addTextColumn("full", {std::string("  Ada   Lovelace ")});
    EXPECT_EQ(*Cleaner::trim(d, {"full"}).column("full").text()[0], "Ada   Lovelace");
}

TEST(CleanerTrimTest, UnnamedTextColumnsUnchanged) {
    TypedDataset d;
    d.addTextColumn("a", {std::string(" x ")});
    d.addTextColumn("b", {std::string(" y ")});
    const TypedDataset out = Cleaner::trim(d, {"a"});
    EXPECT_EQ(*out.column("a").text()[0], "x");
    EXPECT_EQ(*out.column("b").text()[0], " y ");
}

TEST(CleanerTrimTest, Idempotent) {
    const TypedDataset once = Cleaner::trim(peopleDataset(), {"name"});
    EXPECT_EQ(Cleaner::trim(once, {"name"}), once);
}

TEST(CleanerTrimTest, DuplicateNamesTrimOnce) {
    const TypedDataset out = Cleaner::trim(peopleDataset(), {"name", "name"});
    EXPECT_EQ(*out.column("name").text()[0], "Alice");
}

TEST(CleanerTrimTest, NumericColumnRaisesWrongColumnType) {
    const TypedDataset input = peopleDataset();
    try {
        (void)Cleaner::trim(input, {"age"});
        FAIL() << "expected WrongColumnTypeException";
    } catch (const Scrub::WrongColumnTypeException& e) {
        EXPECT_EQ(e.column(), "age");
        EXPECT_EQ(e.expected(), "text");
        EXPECT_EQ(e.actual(), "numeric");
    }
}

TEST(CleanerTrimTest, OtherKindIsNotText) {
    TypedDataset d;
    d.addTextColumn("flag", {std::string(" true ")}, ColumnKind::OTHER);
    EXPECT_THROW(Cleaner::trim(d, {"flag"}), Scrub::WrongColumnTypeException);
}

TEST(CleanerTrimTest, MissingColumnCheckedBeforeKind) {
    // "age" would fail the kind check, but the absent name is reported first.
    EXPECT_THROW(Cleaner::trim(peopleDataset(), {"age", "nope"}), Scrub::MissingColumnException);
}

TEST(CleanerTrimTest, TypeFailureIsNoOp) {
    const TypedDataset input = peopleDataset();
    const TypedDataset before = input;
    EXPECT_THROW(Cleaner::trim(input, {"name", "age"}), Scrub::WrongColumnTypeException);
    EXPECT_EQ(input, before);
}

TEST(CleanerTrimTest, EmptyNameListCopies) {
    const TypedDataset input = peopleDataset();
    EXPECT_EQ(Cleaner::trim(input, {}), input);
}

// =============================================================================
// dropInvalidRows
// =============================================================================

TEST(CleanerDropInvalidTest, RemovesRowsMissingInNamedColumn) {
    TypedDataset d;
    d.addTextColumn("name", {std::string("Alice"), std::nullopt, std::string("Bob")});
    d.addNumericColumn("age", {25.0, 30.0, std::nullopt});

    const TypedDataset out = Cleaner::dropInvalidRows(d, {"name"});
    EXPECT_EQ(out.rowIds(), (std::vector<RowId>{0, 2}));
    const TextCells expectedNames = {std::string("Alice"), std::string("Bob")};
    EXPECT_EQ(out.column("name").text(), expectedNames);
    // age is not named, its missing cell survives with row 2.
    EXPECT_FALSE(out.column("age").numeric()[1].has_value());
}

TEST(CleanerDropInvalidTest, AnyNamedColumnMissingRemovesRow) {
    TypedDataset d;
    d.addTextColumn("name", {std::string("Alice"), std::nullopt, std::string("Bob"), std::string("Dan")});
    d.addNumericColumn("age", {25.0, 30.0, std::nullopt, 41.0});

    const TypedDataset out = Cleaner::dropInvalidRows(d, {"name", "age"});
    EXPECT_EQ(out.rowIds(), (std::vector<RowId>{0, 3}));
    EXPECT_EQ(out.colCount(), 2u);
}

TEST(CleanerDropInvalidTest, EmptyStringIsNotMissing) {
    TypedDataset d;
    d.addTextColumn("note", {std::string(""), std::nullopt});
    EXPECT_EQ(Cleaner::dropInvalidRows(d, {"note"}).rowIds(), (std::vector<RowId>{0}));
}

TEST(CleanerDropInvalidTest, AcceptsAnyColumnKind) {
    TypedDataset d;
    d.addTextColumn("when", {std::string("2024-01-01"), std::nullopt}, ColumnKind::OTHER);
    EXPECT_EQ(Cleaner::dropInvalidRows(d, {"when"}).rowCount(), 1u);
}

TEST(CleanerDropInvalidTest, AllRowsRemovedYieldsZeroRows) {
    TypedDataset d;
    d.addNumericColumn("x", {std::nullopt, std::nullopt});
    d.addTextColumn("y", {std::string("a"), std::string("b")});

    const TypedDataset out = Cleaner::dropInvalidRows(d, {"x"});
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(out.colCount(), 2u);
    EXPECT_EQ(out.columnNames(), d.columnNames());
    EXPECT_EQ(out.column("y").size(), 0u);
}

TEST(CleanerDropInvalidTest, UnknownColumnRaisesBeforeFiltering) {
    TypedDataset d;
    d.addTextColumn("name", {std::string("Alice"), std::nullopt});
    const TypedDataset before = d;
    try {
        (void)Cleaner::dropInvalidRows(d, {"name", "unknownCol"});
        FAIL() << "expected MissingColumnException";
    } catch (const Scrub::MissingColumnException& e) {
        EXPECT_EQ(e.column(), "unknownCol");
    }
    EXPECT_EQ(d, before);
}

TEST(CleanerDropInvalidTest, IdempotentAndNoSurvivorMissing) {
    TypedDataset d;
    d.addTextColumn("a", {std::string("x"), std::nullopt, std::string("z"), std::string("w")});
    d.addNumericColumn("b", {1.0, 2.0, std::nullopt, 4.0});

    const TypedDataset once = Cleaner::dropInvalidRows(d, {"a", "b"});
    EXPECT_LE(once.rowCount(), d.rowCount());
    for (size_t r = 0; r < once.rowCount(); ++r) {
        EXPECT_FALSE(once.column("a").isMissing(r));
        EXPECT_FALSE(once.column("b").isMissing(r));
    }
    EXPECT_EQ(Cleaner::dropInvalidRows(once, {"a", "b"}), once);
}

TEST(CleanerDropInvalidTest, IdentifiersSurviveChainedFiltering) {
    TypedDataset d;
    d.addNumericColumn("a", {std::nullopt, 1.0, 2.0, 3.0});
    d.addNumericColumn("b", {1.0, 2.0, std::nullopt, 3.0});
    const TypedDataset out = Cleaner::dropInvalidRows(Cleaner::dropInvalidRows(d, {"a"}), {"b"});
    EXPECT_EQ(out.rowIds(), (std::vector<RowId>{1, 3}));
}

// =============================================================================
// removeOutliersIQR
// =============================================================================

TEST(CleanerOutlierTest, RemovesFarValue) {
    const TypedDataset d = agesDataset({20.0, 22.0, 21.0, 150.0, 23.0, 24.0});
    const TypedDataset out = Cleaner::removeOutliersIQR(d, "age", 1.5);

    EXPECT_EQ(ageValues(out), (std::vector<double>{20.0, 22.0, 21.0, 23.0, 24.0}));
    EXPECT_EQ(out.rowIds(), (std::vector<RowId>{0, 1, 2, 4, 5}));
}

TEST(CleanerOutlierTest, BoundsUseLinearInterpolation) {
    const TypedDataset d = agesDataset({20.0, 22.0, 21.0, 150.0, 23.0, 24.0});
    const IqrBounds b = Cleaner::computeIqrBounds(d, "age", 1.5);
    EXPECT_DOUBLE_EQ(b.q1, 21.25);
    EXPECT_DOUBLE_EQ(b.q3, 23.75);
    EXPECT_DOUBLE_EQ(b.iqr, 2.5);
    EXPECT_DOUBLE_EQ(b.lower, 17.5);
    EXPECT_DOUBLE_EQ(b.upper, 27.5);
    EXPECT_EQ(b.observed, 6u);
}

TEST(CleanerOutlierTest, DefaultFactorIsOnePointFive) {
    const TypedDataset d = agesDataset({20.0, 22.0, 21.0, 150.0, 23.0, 24.0});
    EXPECT_EQ(Cleaner::removeOutliersIQR(d, "age"), Cleaner::removeOutliersIQR(d, "age", 1.5));
}

TEST(CleanerOutlierTest, BoundaryValuesAreKept) {
    // Q1=2, Q3=4, IQR=2, factor 1 gives [0, 6].
    const TypedDataset d = agesDataset({1.0, 2.0, 3.0, 4.0, 5.0, 0.0, 6.0, 2.0, 4.0});
    const IqrBounds b = Cleaner::computeIqrBounds(d, "age", 1.0);
    ASSERT_DOUBLE_EQ(b.lower, 0.0);
    ASSERT_DOUBLE_EQ(b.upper, 6.0);
    EXPECT_EQ(Cleaner::removeOutliersIQR(d, "age", 1.0).rowCount(), d.rowCount());
}

TEST(CleanerOutlierTest, MissingCellsRetained) {
    const TypedDataset d = agesDataset({20.0, std::nullopt, 21.0, 150.0, 23.0, std::nullopt, 24.0});
    const TypedDataset out = Cleaner::removeOutliersIQR(d, "age", 1.5);
    EXPECT_EQ(out.rowIds(), (std::vector<RowId>{0, 1, 2, 4, 5, 6}));
    EXPECT_EQ(out.column("age").missingCount(), 2u);
}

TEST(CleanerOutlierTest, NanCellsRetainedAndIgnoredByQuartiles) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const TypedDataset d = agesDataset({20.0, nan, 21.0, 150.0, 23.0, 22.0, 24.0});
    const IqrBounds b = Cleaner::computeIqrBounds(d, "age", 1.5);
    EXPECT_EQ(b.observed, 6u);
    EXPECT_DOUBLE_EQ(b.q1, 21.25);

    const TypedDataset out = Cleaner::removeOutliersIQR(d, "age", 1.5);
    EXPECT_EQ(out.rowIds(), (std::vector<RowId>{0, 1, 2, 4, 5, 6}));
    EXPECT_TRUE(std::isnan(*out.column("age").numeric()[1]));
}

TEST(CleanerOutlierTest, InfiniteValuesRemovedButNotFenced) {
    const double inf = std::numeric_limits<double>::infinity();
    const TypedDataset d = agesDataset({1.0, 2.0, 3.0, 4.0, inf, -inf});
    const IqrBounds b = Cleaner::computeIqrBounds(d, "age", 1.5);
    EXPECT_EQ(b.observed, 4u);
    EXPECT_EQ(Cleaner::removeOutliersIQR(d, "age", 1.5).rowIds(), (std::vector<RowId>{0, 1, 2, 3}));
}

TEST(CleanerOutlierTest, SingleDistinctValueCollapsesFence) {
    const TypedDataset d = agesDataset({5.0, 5.0, 5.0, std::nullopt});
    const IqrBounds b = Cleaner::computeIqrBounds(d, "age", 3.0);
    EXPECT_DOUBLE_EQ(b.lower, 5.0);
    EXPECT_DOUBLE_EQ(b.upper, 5.0);
    EXPECT_DOUBLE_EQ(b.iqr, 0.0);
    EXPECT_EQ(Cleaner::removeOutliersIQR(d, "age", 3.0).rowCount(), 4u);
}

TEST(CleanerOutlierTest, ZeroIqrRemovesEverythingOffTheQuartiles) {
    // Q1 = Q3 = 10 while two distinct values exist.
    const TypedDataset d = agesDataset({10.0, 10.0, 10.0, 10.0, 10.0, 11.0});
    const IqrBounds b = Cleaner::computeIqrBounds(d, "age", 1.5);
    EXPECT_DOUBLE_EQ(b.lower, 10.0);
    EXPECT_DOUBLE_EQ(b.upper, 10.0);
    EXPECT_EQ(Cleaner::removeOutliersIQR(d, "age", 1.5).rowIds(), (std::vector<RowId>{0, 1, 2, 3, 4}));
}

TEST(CleanerOutlierTest, ZeroFactorFencesAtQuartiles) {
    const TypedDataset d = agesDataset({1.0, 2.0, 3.0, 4.0, 5.0});
    // Q1=2, Q3=4.
    EXPECT_EQ(ageValues(Cleaner::removeOutliersIQR(d, "age", 0.0)), (std::vector<double>{2.0, 3.0, 4.0}));
}

TEST(CleanerOutlierTest, AllMissingColumnRemovesNothing) {
    const TypedDataset d = agesDataset({std::nullopt, std::nullopt});
    EXPECT_FALSE(Cleaner::computeIqrBounds(d, "age").valid());
    EXPECT_EQ(Cleaner::removeOutliersIQR(d, "age"), d);
}

TEST(CleanerOutlierTest, ZeroRowDatasetIsValid) {
    const TypedDataset d = agesDataset({});
    EXPECT_TRUE(Cleaner::removeOutliersIQR(d, "age").empty());
}

TEST(CleanerOutlierTest, RetainedSatisfyFenceAndRemovedViolateIt) {
    const TypedDataset d = agesDataset({3.0, -40.0, 7.5, 8.0, 9.0, 10.0, 11.5, 12.0, 95.0, 13.0, 14.0});
    const double factor = 1.2;
    const IqrBounds b = Cleaner::computeIqrBounds(d, "age", factor);
    const TypedDataset out = Cleaner::removeOutliersIQR(d, "age", factor);

    for (double v : ageValues(out)) EXPECT_TRUE(b.contains(v)) << v;

    const auto& kept = out.rowIds();
    const auto& original = d.column("age").numeric();
    for (RowId id : d.rowIds()) {
        if (std::find(kept.begin(), kept.end(), id) != kept.end()) continue;
        EXPECT_FALSE(b.contains(*original[id])) << *original[id];
    }
}

TEST(CleanerOutlierTest, OtherColumnsFollowSurvivingRows) {
    TypedDataset d;
    d.addTextColumn("name", {std::string("a"), std::string("b"), std::string("c"), std::string("d"), std::string("e")});
    d.addNumericColumn("age", {10.0, 11.0, 12.0, 13.0, 500.0});
    const TypedDataset before = d;

    const TypedDataset out = Cleaner::removeOutliersIQR(d, "age");
    const TextCells expected = {std::string("a"), std::string("b"), std::string("c"), std::string("d")};
    EXPECT_EQ(out.column("name").text(), expected);
    EXPECT_EQ(d, before);
}

TEST(CleanerOutlierTest, MissingAndWrongTypeColumnsRaise) {
    const TypedDataset d = peopleDataset();
    EXPECT_THROW(Cleaner::removeOutliersIQR(d, "missingCol"), Scrub::MissingColumnException);
    try {
        (void)Cleaner::removeOutliersIQR(d, "name");
        FAIL() << "expected WrongColumnTypeException";
    } catch (const Scrub::WrongColumnTypeException& e) {
        EXPECT_EQ(e.expected(), "numeric");
        EXPECT_EQ(e.actual(), "text");
    }
}

TEST(CleanerOutlierTest, InvalidFactorRaises) {
    const TypedDataset d = agesDataset({1.0, 2.0, 3.0});
    EXPECT_THROW(Cleaner::removeOutliersIQR(d, "age", -0.5), Scrub::InvalidArgumentException);
    EXPECT_THROW(Cleaner::removeOutliersIQR(d, "age", std::numeric_limits<double>::quiet_NaN()),
                 Scrub::InvalidArgumentException);
    EXPECT_THROW(Cleaner::computeIqrBounds(d, "age", std::numeric_limits<double>::infinity()),
                 Scrub::InvalidArgumentException);
}

TEST(CleanerOutlierTest, ColumnCheckedBeforeFactor) {
    const TypedDataset d = agesDataset({1.0, 2.0, 3.0});
    EXPECT_THROW(Cleaner::removeOutliersIQR(d, "nope", -1.0), Scrub::MissingColumnException);
}

TEST(CleanerOutlierTest, ErrorsShareBaseClass) {
    const TypedDataset d = agesDataset({1.0});
    EXPECT_THROW(Cleaner::removeOutliersIQR(d, "nope"), Scrub::ScrubException);
    EXPECT_THROW(Cleaner::trim(d, {"age"}), Scrub::ScrubException);
}
