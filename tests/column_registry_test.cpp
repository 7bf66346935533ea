// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include <gtest/gtest.h>
#include <frost/column_registry.h>
#include "fakes.h"

using namespace frost;
using namespace frost_test;


class ColumnRegistryTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        //logical: a(frozen) b c(frozen) d e(hidden)
        reg.add(makeColumn(L"a", true));
        reg.add(makeColumn(L"b"));
        reg.add(makeColumn(L"c", true));
        reg.add(makeColumn(L"d"));
        reg.add(makeColumn(L"e", false, false));
    }

    ColumnRegistry reg;
};


TEST_F(ColumnRegistryTest, VisualIndexIsRankWithinPane)
{
    EXPECT_EQ(reg.toVisualIndex(0), 0); //a: frozen #0
    EXPECT_EQ(reg.toVisualIndex(1), 0); //b: normal #0
    EXPECT_EQ(reg.toVisualIndex(2), 1); //c: frozen #1
    EXPECT_EQ(reg.toVisualIndex(3), 1); //d: normal #1
    EXPECT_EQ(reg.toVisualIndex(4), -1);
    EXPECT_EQ(reg.toVisualIndex(99), -1);

    EXPECT_EQ(reg.frozenVisibleCount(), 2);
    EXPECT_EQ(reg.visibleCount(PaneId::normal), 2);
}


TEST_F(ColumnRegistryTest, VisualLogicalRoundTrip)
{
    for (const size_t col : reg.visibleColumns())
        EXPECT_EQ(reg.toLogicalIndex(reg.getPane(col), reg.toVisualIndex(col)), static_cast<int>(col));

    EXPECT_EQ(reg.toLogicalIndex(PaneId::frozen, 2), -1);
    EXPECT_EQ(reg.toLogicalIndex(PaneId::normal, -1), -1);
}


TEST_F(ColumnRegistryTest, HidingDoesNotShiftOtherPane)
{
    const int visB = reg.toVisualIndex(1);
    const int visD = reg.toVisualIndex(3);

    reg.setVisible(0, false); //hide frozen "a"

    EXPECT_EQ(reg.frozenVisibleCount(), 1);
    EXPECT_EQ(reg.toVisualIndex(0), -1);
    EXPECT_EQ(reg.toVisualIndex(2), 0);
    EXPECT_EQ(reg.toVisualIndex(1), visB);
    EXPECT_EQ(reg.toVisualIndex(3), visD);
}


TEST_F(ColumnRegistryTest, FreezingMovesColumnBetweenPanes)
{
    reg.setFrozen(3, true);

    EXPECT_EQ(reg.getPane(3), PaneId::frozen);
    EXPECT_EQ(reg.toVisualIndex(3), 2);
    EXPECT_EQ(reg.visibleCount(PaneId::normal), 1);
    EXPECT_EQ(reg.getDisplayNames(PaneId::frozen), (std::vector<std::wstring> {L"a", L"c", L"d"}));
}


TEST_F(ColumnRegistryTest, DisplayOrderFollowsHeaderDrag)
{
    EXPECT_TRUE(reg.moveInDisplayOrder(PaneId::normal, 0, 1));

    EXPECT_EQ(reg.getDisplayNames(PaneId::normal), (std::vector<std::wstring> {L"d", L"b"}));
    EXPECT_EQ(reg.displayPosToLogical(PaneId::normal, 0), 3);
    EXPECT_EQ(reg.getDisplayOrder(PaneId::normal), (std::vector<int> {1, 0}));
    EXPECT_EQ(reg.visibleColumnsInDisplayOrder(), (std::vector<size_t> {0, 2, 3, 1}));

    //visual indices are independent of the display order
    EXPECT_EQ(reg.toVisualIndex(1), 0);

    EXPECT_FALSE(reg.moveInDisplayOrder(PaneId::normal, 0, 5));
}


TEST_F(ColumnRegistryTest, DisplayOrderAppendsNewlyVisibleColumns)
{
    reg.setDisplayNames(PaneId::normal, {L"d", L"b"});
    reg.setVisible(4, true);

    EXPECT_EQ(reg.getDisplayNames(PaneId::normal), (std::vector<std::wstring> {L"d", L"b", L"e"}));

    reg.setDisplayNames(PaneId::normal, {L"unknown", L"e", L"a"}); //"a" lives in the frozen pane
    EXPECT_EQ(reg.getDisplayNames(PaneId::normal), (std::vector<std::wstring> {L"e", L"b", L"d"}));
}


TEST_F(ColumnRegistryTest, WidthHonorsMinimum)
{
    reg.setWidth(1, 5);
    EXPECT_EQ(reg.getColumn(1).width, reg.getColumn(1).minWidth);

    EXPECT_FALSE(reg.setWidth(42, 100));
}


TEST_F(ColumnRegistryTest, ChangeNotificationsAreCoalesced)
{
    int changes = 0;
    reg.setChangeCallback([&] { ++changes; });

    reg.setWidth(0, 150);
    EXPECT_EQ(changes, 1);

    reg.setWidth(0, 150); //unchanged
    EXPECT_EQ(changes, 1);

    {
        ColumnUpdateScope scope(reg);
        reg.setVisible(1, false);
        reg.setFrozen(3, true);
        reg.setTitleOverride(0, L"Alpha");
        EXPECT_EQ(changes, 1);
    }
    EXPECT_EQ(changes, 2);
    EXPECT_EQ(reg.getColumn(0).getEffectiveTitle(), L"Alpha");
}


TEST_F(ColumnRegistryTest, NamesAreUniqueAndNonEmpty)
{
    EXPECT_EQ(reg.findByName(L"d"), 3);
    EXPECT_EQ(reg.findByName(L"zzz"), -1);

    EXPECT_THROW(reg.add(makeColumn(L"a")), std::logic_error);
    EXPECT_THROW(reg.add(makeColumn(L"")),  std::logic_error);
}


TEST_F(ColumnRegistryTest, LogicalMoveAndRemove)
{
    reg.move(0, 3); //b c d a e
    EXPECT_EQ(reg.findByName(L"a"), 3);
    EXPECT_EQ(reg.toVisualIndex(3), 1); //"a" now follows "c" in the frozen pane

    reg.remove(1); //b d a e
    EXPECT_EQ(reg.size(), 4u);
    EXPECT_EQ(reg.getDisplayNames(PaneId::frozen), (std::vector<std::wstring> {L"a"}));
}
